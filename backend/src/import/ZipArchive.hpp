#pragma once
#include <string>
#include <vector>
#include <cstdint>

struct ZipEntry {
    std::string name;
    std::uint16_t method = 0;           // 0 stored, 8 deflated
    std::uint16_t flags = 0;
    std::uint32_t crc = 0;
    std::uint64_t compressed_size = 0;
    std::uint64_t uncompressed_size = 0;
    std::uint64_t local_header_offset = 0;
};

// Read-only view of a zip container. Only the central directory is held in
// memory; entry data is read from disk on demand and inflated with zlib.
class ZipArchive {
public:
    // Throws ImportError (Archive stage) when the central directory cannot be read.
    explicit ZipArchive(const std::string& path);

    const std::vector<ZipEntry>& entries() const { return entry_list; }
    const ZipEntry* find(const std::string& name) const;

    // Per-entry failures are returned, not thrown, so one bad entry can be skipped.
    bool read(const ZipEntry& entry, std::string& out, std::string& problem) const;
    bool extractTo(const ZipEntry& entry, const std::string& destPath, std::string& problem) const;

private:
    std::string archive_path;
    std::uint64_t archive_size = 0;
    std::vector<ZipEntry> entry_list;

    void readCentralDirectory();
    bool dataOffset(const ZipEntry& entry, std::uint64_t& offset, std::string& problem) const;

    template <typename Sink>
    bool decode(const ZipEntry& entry, Sink& sink, std::string& problem) const;
};
