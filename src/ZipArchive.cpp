#include "ZipArchive.h"
#include "DataFlowExceptions.h"

#include <limits>
#include <zlib.h>

namespace {
constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr uint16_t kVersion = 20;
constexpr uint16_t kFlagUtf8 = 0x0800;
constexpr uint16_t kDosTime = 0;
// 1980-01-01
constexpr uint16_t kDosDate = (0 << 9) | (1 << 5) | 1;

void put16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
}

void put32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

uint16_t get16(const std::vector<uint8_t>& in, size_t off) {
    if (off + 2 > in.size()) throw DataFlow::WorkbookException("Truncated ZIP archive");
    return static_cast<uint16_t>(in[off] | (in[off + 1] << 8));
}

uint32_t get32(const std::vector<uint8_t>& in, size_t off) {
    if (off + 4 > in.size()) throw DataFlow::WorkbookException("Truncated ZIP archive");
    return static_cast<uint32_t>(in[off]) | (static_cast<uint32_t>(in[off + 1]) << 8) |
           (static_cast<uint32_t>(in[off + 2]) << 16) | (static_cast<uint32_t>(in[off + 3]) << 24);
}

uint32_t crcOf(const std::vector<uint8_t>& data) {
    uLong crc = crc32(0L, Z_NULL, 0);
    if (!data.empty()) crc = crc32(crc, data.data(), static_cast<uInt>(data.size()));
    return static_cast<uint32_t>(crc);
}

std::vector<uint8_t> deflateRaw(const std::vector<uint8_t>& data) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw DataFlow::WorkbookException("deflateInit2 failed");
    }
    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&strm, Z_FINISH);
    const uLong produced = strm.total_out;
    deflateEnd(&strm);
    if (rc != Z_STREAM_END) throw DataFlow::WorkbookException("deflate failed with code " + std::to_string(rc));
    out.resize(produced);
    return out;
}

std::vector<uint8_t> inflateRaw(const uint8_t* data, size_t size, size_t expected) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK) throw DataFlow::WorkbookException("inflateInit2 failed");
    std::vector<uint8_t> out(expected);
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    const int rc = inflate(&strm, Z_FINISH);
    const uLong produced = strm.total_out;
    inflateEnd(&strm);
    if (rc != Z_STREAM_END || produced != expected) {
        throw DataFlow::WorkbookException("inflate failed with code " + std::to_string(rc));
    }
    return out;
}
} // namespace

uint32_t ZipArchive::narrow32(uint64_t value, const char* what) {
    if (value > std::numeric_limits<uint32_t>::max()) {
        throw DataFlow::WorkbookException(std::string("ZIP ") + what + " exceeds 4 GiB; ZIP64 is not supported");
    }
    return static_cast<uint32_t>(value);
}

void ZipArchive::addFile(const std::string& name, const std::vector<uint8_t>& data, bool compress) {
    if (name.empty() || name.size() > std::numeric_limits<uint16_t>::max()) {
        throw DataFlow::WorkbookException("Invalid ZIP entry name '" + name + "'");
    }
    for (const auto& e : entries_) {
        if (e.name == name) throw DataFlow::WorkbookException("Duplicate ZIP entry '" + name + "'");
    }
    if (data.size() >= std::numeric_limits<uint32_t>::max()) {
        throw DataFlow::WorkbookException("ZIP entry '" + name + "' is too large");
    }
    if (entries_.size() >= std::numeric_limits<uint16_t>::max()) {
        throw DataFlow::WorkbookException("Too many ZIP entries");
    }

    Entry entry;
    entry.name = name;
    entry.crc = crcOf(data);
    entry.uncompressedSize = static_cast<uint32_t>(data.size());
    if (compress && !data.empty()) {
        entry.method = Z_DEFLATED;
        entry.payload = deflateRaw(data);
    } else {
        entry.method = 0;
        entry.payload = data;
    }
    entries_.push_back(std::move(entry));
}

void ZipArchive::addFile(const std::string& name, const std::string& text) {
    addFile(name, std::vector<uint8_t>(text.begin(), text.end()), true);
}

std::vector<uint8_t> ZipArchive::finish() const {
    std::vector<uint8_t> out;
    std::vector<uint32_t> offsets;
    offsets.reserve(entries_.size());

    for (const auto& e : entries_) {
        offsets.push_back(narrow32(out.size(), "local header offset"));
        put32(out, kLocalHeaderSig);
        put16(out, kVersion);
        put16(out, kFlagUtf8);
        put16(out, e.method);
        put16(out, kDosTime);
        put16(out, kDosDate);
        put32(out, e.crc);
        put32(out, narrow32(e.payload.size(), "entry size"));
        put32(out, e.uncompressedSize);
        put16(out, static_cast<uint16_t>(e.name.size()));
        put16(out, 0);
        out.insert(out.end(), e.name.begin(), e.name.end());
        out.insert(out.end(), e.payload.begin(), e.payload.end());
    }

    const uint32_t centralStart = narrow32(out.size(), "central directory offset");
    for (size_t i = 0; i < entries_.size(); ++i) {
        const Entry& e = entries_[i];
        put32(out, kCentralHeaderSig);
        put16(out, kVersion);
        put16(out, kVersion);
        put16(out, kFlagUtf8);
        put16(out, e.method);
        put16(out, kDosTime);
        put16(out, kDosDate);
        put32(out, e.crc);
        put32(out, narrow32(e.payload.size(), "entry size"));
        put32(out, e.uncompressedSize);
        put16(out, static_cast<uint16_t>(e.name.size()));
        put16(out, 0);
        put16(out, 0);
        put16(out, 0);
        put16(out, 0);
        put32(out, 0);
        put32(out, offsets[i]);
        out.insert(out.end(), e.name.begin(), e.name.end());
    }
    const uint32_t centralSize = narrow32(out.size() - centralStart, "central directory size");

    put32(out, kEndOfCentralDirSig);
    put16(out, 0);
    put16(out, 0);
    put16(out, static_cast<uint16_t>(entries_.size()));
    put16(out, static_cast<uint16_t>(entries_.size()));
    put32(out, centralSize);
    put32(out, centralStart);
    put16(out, 0);
    return out;
}

std::map<std::string, std::vector<uint8_t>> ZipArchive::extract(const std::vector<uint8_t>& archive) {
    if (archive.size() < 22) throw DataFlow::WorkbookException("Truncated ZIP archive");

    size_t eocd = archive.size() - 22;
    while (get32(archive, eocd) != kEndOfCentralDirSig) {
        if (eocd == 0 || archive.size() - eocd > 22 + 0xFFFF) {
            throw DataFlow::WorkbookException("ZIP end of central directory not found");
        }
        --eocd;
    }

    const uint16_t count = get16(archive, eocd + 10);
    size_t cursor = get32(archive, eocd + 16);
    std::map<std::string, std::vector<uint8_t>> out;

    for (uint16_t i = 0; i < count; ++i) {
        if (get32(archive, cursor) != kCentralHeaderSig) throw DataFlow::WorkbookException("Bad ZIP central header");
        const uint16_t method = get16(archive, cursor + 10);
        const uint32_t crc = get32(archive, cursor + 16);
        const uint32_t compSize = get32(archive, cursor + 20);
        const uint32_t size = get32(archive, cursor + 24);
        const uint16_t nameLen = get16(archive, cursor + 28);
        const uint16_t extraLen = get16(archive, cursor + 30);
        const uint16_t commentLen = get16(archive, cursor + 32);
        const uint32_t localOffset = get32(archive, cursor + 42);
        if (cursor + 46 + nameLen > archive.size()) throw DataFlow::WorkbookException("Truncated ZIP archive");
        const std::string name(archive.begin() + static_cast<std::ptrdiff_t>(cursor + 46),
                               archive.begin() + static_cast<std::ptrdiff_t>(cursor + 46 + nameLen));
        cursor += 46 + nameLen + extraLen + commentLen;

        if (get32(archive, localOffset) != kLocalHeaderSig) throw DataFlow::WorkbookException("Bad ZIP local header");
        const size_t dataStart = localOffset + 30 + get16(archive, localOffset + 26) + get16(archive, localOffset + 28);
        if (dataStart + compSize > archive.size()) throw DataFlow::WorkbookException("Truncated ZIP entry '" + name + "'");

        std::vector<uint8_t> data;
        if (method == 0) {
            data.assign(archive.begin() + static_cast<std::ptrdiff_t>(dataStart),
                        archive.begin() + static_cast<std::ptrdiff_t>(dataStart + compSize));
        } else if (method == Z_DEFLATED) {
            data = inflateRaw(archive.data() + dataStart, compSize, size);
        } else {
            throw DataFlow::WorkbookException("Unsupported ZIP compression method " + std::to_string(method));
        }
        if (crcOf(data) != crc) throw DataFlow::WorkbookException("CRC mismatch in ZIP entry '" + name + "'");
        out.emplace(name, std::move(data));
    }
    return out;
}
