#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

/**
 * @brief Minimal ZIP writer/reader (no ZIP64, no encryption) on top of zlib raw deflate.
 * @details Entries carry a fixed 1980-01-01 timestamp so identical inputs give identical bytes.
 */
class ZipArchive {
public:
    /**
     * @throws DataFlow::WorkbookException on a duplicate name or a zlib failure.
     */
    void addFile(const std::string& name, const std::vector<uint8_t>& data, bool compress = true);
    void addFile(const std::string& name, const std::string& text);

    size_t entryCount() const noexcept { return entries_.size(); }

    // Local headers, data and the central directory in one buffer.
    std::vector<uint8_t> finish() const;

    /**
     * @brief Reads every entry of an archive produced by this class (stored or deflated).
     * @throws DataFlow::WorkbookException on a truncated archive, bad signature or CRC mismatch.
     */
    static std::map<std::string, std::vector<uint8_t>> extract(const std::vector<uint8_t>& archive);

    // Offsets and sizes above 4 GiB need ZIP64 records, which are not written.
    static uint32_t narrow32(uint64_t value, const char* what);

private:
    struct Entry {
        std::string name;
        uint16_t method = 0;
        uint32_t crc = 0;
        uint32_t uncompressedSize = 0;
        std::vector<uint8_t> payload;
    };

    std::vector<Entry> entries_;
};
