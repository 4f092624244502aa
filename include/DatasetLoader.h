#pragma once
#include "TabularDataset.h"

#include <string>

enum class SourceFormat { DELIMITED_TEXT, XLSX, XLS };

struct LoadOptions {
    // '\0' selects by extension: ',' for .csv, '\t' for .tsv, detected for .txt.
    char delimiter = '\0';
    DateTimeUtils::DateLocaleHint dateLocaleHint = DateTimeUtils::DateLocaleHint::AUTO;
};

class DatasetLoader {
public:
    explicit DatasetLoader(LoadOptions options = LoadOptions{}) : options_(options) {}

    /**
     * @brief Resolves a source location to one file.
     * @details A directory stands for an upload area: its first regular file in lexical order is used.
     * @throws DataFlow::NoInputException when the path is absent or the directory holds no files.
     */
    static std::string resolveSourceFile(const std::string& sourcePath);

    /**
     * @brief Maps a file extension (case-insensitive) to a source format.
     * @throws DataFlow::UnsupportedFormatException for anything but .csv/.tsv/.txt/.xlsx/.xls.
     */
    static SourceFormat formatForPath(const std::string& path);

    /**
     * @brief Loads the source into a typed dataset.
     * @details Spreadsheets are converted to delimited text by xlsx2csv/xls2csv into a temporary
     * file that is removed on every exit path.
     * @throws DataFlow::NoInputException, DataFlow::UnsupportedFormatException,
     * DataFlow::IOException, DataFlow::DatasetException.
     */
    TabularDataset load(const std::string& sourcePath) const;

private:
    LoadOptions options_;
};
