#pragma once

#include <string>
#include <vector>

namespace ProcessUtils {
// Resolves a bare command name against $PATH; empty when not found or not executable.
std::string findExecutableInPath(const std::string& command);

/**
 * @brief Runs executable with args, stdout redirected to outputPath, stderr discarded.
 * @return Child exit status, or -1 when the child could not be started or was signalled.
 */
int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath);

/**
 * @brief Runs executable with args and waits for it, stderr redirected to stderrPath.
 * @return Child exit status, or -1 when the child could not be started or was signalled.
 */
int spawnWithStderr(const std::string& executable,
                    const std::vector<std::string>& args,
                    const std::string& stderrPath);

// First line of a text file, empty when unreadable.
std::string firstLineOf(const std::string& path);
} // namespace ProcessUtils
