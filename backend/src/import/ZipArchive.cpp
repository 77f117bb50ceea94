#include "ZipArchive.hpp"
#include "../core/Errors.hpp"
#include <algorithm>
#include <fstream>
#include <new>
#include <stdexcept>
#include <zlib.h>
#include <spdlog/spdlog.h>

static const std::uint32_t LOCAL_HEADER_SIG = 0x04034b50;
static const std::uint32_t CENTRAL_HEADER_SIG = 0x02014b50;
static const std::uint32_t END_OF_DIRECTORY_SIG = 0x06054b50;
static const std::size_t END_OF_DIRECTORY_LEN = 22;
static const std::size_t CENTRAL_HEADER_LEN = 46;
static const std::size_t LOCAL_HEADER_LEN = 30;
static const std::size_t MAX_COMMENT_LEN = 0xFFFF;
static const std::size_t CHUNK = 64 * 1024;
// deflate cannot expand data by more than about 1032:1
static const std::uint64_t MAX_DEFLATE_RATIO = 1032;

static std::uint16_t le16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

static std::uint32_t le32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) |
        (static_cast<std::uint32_t>(p[1]) << 8) |
        (static_cast<std::uint32_t>(p[2]) << 16) |
        (static_cast<std::uint32_t>(p[3]) << 24);
}

ZipArchive::ZipArchive(const std::string& path)
    : archive_path(path)
{
    readCentralDirectory();
    spdlog::debug("Opened zip '{}' with {} entries", path, entry_list.size());
}

void ZipArchive::readCentralDirectory() {
    std::ifstream in(archive_path, std::ios::binary);
    if (!in) throw ImportError(ImportError::Stage::Archive, "Cannot open package '" + archive_path + "'");

    in.seekg(0, std::ios::end);
    archive_size = static_cast<std::uint64_t>(in.tellg());
    if (archive_size < END_OF_DIRECTORY_LEN)
        throw ImportError(ImportError::Stage::Archive, "'" + archive_path + "' is not a zip archive");

    // the end-of-directory record sits in the last 22 + comment bytes
    const std::uint64_t tailSize = std::min<std::uint64_t>(archive_size, END_OF_DIRECTORY_LEN + MAX_COMMENT_LEN);
    std::vector<unsigned char> tail(tailSize);
    in.seekg(static_cast<std::streamoff>(archive_size - tailSize));
    in.read(reinterpret_cast<char*>(tail.data()), static_cast<std::streamsize>(tailSize));
    if (static_cast<std::uint64_t>(in.gcount()) != tailSize)
        throw ImportError(ImportError::Stage::Archive, "Failed to read the end of '" + archive_path + "'");

    const unsigned char* eocd = nullptr;
    for (std::size_t i = tailSize - END_OF_DIRECTORY_LEN + 1; i-- > 0;) {
        if (le32(&tail[i]) == END_OF_DIRECTORY_SIG) {
            eocd = &tail[i];
            break;
        }
    }
    if (!eocd)
        throw ImportError(ImportError::Stage::Archive, "'" + archive_path + "' has no zip central directory");

    const std::uint16_t count = le16(eocd + 10);
    const std::uint32_t dirSize = le32(eocd + 12);
    const std::uint32_t dirOffset = le32(eocd + 16);
    if (count == 0xFFFF || dirOffset == 0xFFFFFFFF)
        throw ImportError(ImportError::Stage::Archive, "ZIP64 packages are not supported");
    if (static_cast<std::uint64_t>(dirOffset) + dirSize > archive_size)
        throw ImportError(ImportError::Stage::Archive, "Zip central directory lies outside the file");

    std::vector<unsigned char> dir(dirSize);
    in.seekg(dirOffset);
    in.read(reinterpret_cast<char*>(dir.data()), dirSize);
    if (in.gcount() != static_cast<std::streamsize>(dirSize))
        throw ImportError(ImportError::Stage::Archive, "Failed to read zip central directory");

    std::size_t pos = 0;
    entry_list.clear();
    entry_list.reserve(count);
    for (std::uint16_t k = 0; k < count; ++k) {
        if (pos + CENTRAL_HEADER_LEN > dir.size() || le32(&dir[pos]) != CENTRAL_HEADER_SIG)
            throw ImportError(ImportError::Stage::Archive, "Corrupt zip central directory");

        const unsigned char* h = &dir[pos];
        const std::uint16_t nameLen = le16(h + 28);
        const std::uint16_t extraLen = le16(h + 30);
        const std::uint16_t commentLen = le16(h + 32);
        if (pos + CENTRAL_HEADER_LEN + nameLen > dir.size())
            throw ImportError(ImportError::Stage::Archive, "Corrupt zip central directory");

        ZipEntry e;
        e.flags = le16(h + 8);
        e.method = le16(h + 10);
        e.crc = le32(h + 16);
        e.compressed_size = le32(h + 20);
        e.uncompressed_size = le32(h + 24);
        e.local_header_offset = le32(h + 42);
        e.name.assign(reinterpret_cast<const char*>(h + CENTRAL_HEADER_LEN), nameLen);
        entry_list.push_back(e);

        pos += CENTRAL_HEADER_LEN + nameLen + extraLen + commentLen;
    }
}

const ZipEntry* ZipArchive::find(const std::string& name) const {
    for (const auto& e : entry_list) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

bool ZipArchive::dataOffset(const ZipEntry& entry, std::uint64_t& offset, std::string& problem) const {
    std::ifstream in(archive_path, std::ios::binary);
    unsigned char header[LOCAL_HEADER_LEN];
    in.seekg(static_cast<std::streamoff>(entry.local_header_offset));
    in.read(reinterpret_cast<char*>(header), sizeof(header));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(header)) || le32(header) != LOCAL_HEADER_SIG) {
        problem = "bad local header";
        return false;
    }

    offset = entry.local_header_offset + LOCAL_HEADER_LEN + le16(header + 26) + le16(header + 28);
    if (offset + entry.compressed_size > archive_size) {
        problem = "entry data lies outside the file";
        return false;
    }
    return true;
}

template <typename Sink>
bool ZipArchive::decode(const ZipEntry& entry, Sink& sink, std::string& problem) const {
    if (entry.flags & 0x1) {
        problem = "encrypted entries are not supported";
        return false;
    }

    if (entry.method == 0 && entry.uncompressed_size != entry.compressed_size) {
        problem = "stored entry sizes disagree";
        return false;
    }
    if (entry.method == 8 && entry.uncompressed_size > entry.compressed_size * MAX_DEFLATE_RATIO + CHUNK) {
        problem = "implausible uncompressed size " + std::to_string(entry.uncompressed_size);
        return false;
    }

    std::uint64_t offset = 0;
    if (!dataOffset(entry, offset, problem)) return false;

    std::ifstream in(archive_path, std::ios::binary);
    in.seekg(static_cast<std::streamoff>(offset));

    std::vector<char> input(CHUNK);
    std::vector<char> output(CHUNK);
    uLong crc = crc32(0L, Z_NULL, 0);
    std::uint64_t remaining = entry.compressed_size;
    std::uint64_t produced = 0;

    if (entry.method == 0) {
        while (remaining > 0) {
            const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, CHUNK));
            in.read(input.data(), static_cast<std::streamsize>(n));
            if (in.gcount() != static_cast<std::streamsize>(n)) {
                problem = "truncated entry";
                return false;
            }
            crc = crc32(crc, reinterpret_cast<const Bytef*>(input.data()), static_cast<uInt>(n));
            if (!sink(input.data(), n)) {
                problem = "write failed";
                return false;
            }
            remaining -= n;
            produced += n;
        }
    }
    else if (entry.method == 8) {
        z_stream zs{};
        if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) {
            problem = "inflateInit2 failed";
            return false;
        }

        int ret = Z_OK;
        bool outputFull = false;
        while (ret != Z_STREAM_END) {
            // a full output buffer may leave data pending inside zlib
            if (zs.avail_in == 0 && !outputFull) {
                if (remaining == 0) break;
                const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, CHUNK));
                in.read(input.data(), static_cast<std::streamsize>(n));
                if (in.gcount() != static_cast<std::streamsize>(n)) {
                    inflateEnd(&zs);
                    problem = "truncated entry";
                    return false;
                }
                zs.next_in = reinterpret_cast<Bytef*>(input.data());
                zs.avail_in = static_cast<uInt>(n);
                remaining -= n;
            }

            zs.next_out = reinterpret_cast<Bytef*>(output.data());
            zs.avail_out = static_cast<uInt>(CHUNK);
            ret = inflate(&zs, Z_NO_FLUSH);
            if (ret != Z_OK && ret != Z_STREAM_END && ret != Z_BUF_ERROR) {
                inflateEnd(&zs);
                problem = "corrupt deflate stream";
                return false;
            }

            const std::size_t n = CHUNK - zs.avail_out;
            outputFull = zs.avail_out == 0;
            if (produced + n > entry.uncompressed_size) {
                inflateEnd(&zs);
                problem = "entry inflates past its recorded size";
                return false;
            }
            if (n > 0) {
                crc = crc32(crc, reinterpret_cast<const Bytef*>(output.data()), static_cast<uInt>(n));
                if (!sink(output.data(), n)) {
                    inflateEnd(&zs);
                    problem = "write failed";
                    return false;
                }
                produced += n;
            }
        }
        inflateEnd(&zs);

        if (ret != Z_STREAM_END) {
            problem = "truncated deflate stream";
            return false;
        }
    }
    else {
        problem = "unsupported compression method " + std::to_string(entry.method);
        return false;
    }

    if (produced != entry.uncompressed_size) {
        problem = "size mismatch";
        return false;
    }
    if (crc != entry.crc) {
        problem = "CRC mismatch";
        return false;
    }
    return true;
}

bool ZipArchive::read(const ZipEntry& entry, std::string& out, std::string& problem) const {
    out.clear();
    // the recorded size is untrusted; grow with the data actually inflated
    out.reserve(static_cast<std::size_t>(std::min<std::uint64_t>(entry.uncompressed_size, CHUNK)));
    auto sink = [&out](const char* data, std::size_t n) {
        out.append(data, n);
        return true;
    };
    try {
        return decode(entry, sink, problem);
    }
    catch (const std::bad_alloc&) {
        out.clear();
        out.shrink_to_fit();
        problem = "entry too large to hold in memory";
        return false;
    }
    catch (const std::length_error&) {
        out.clear();
        out.shrink_to_fit();
        problem = "entry too large to hold in memory";
        return false;
    }
}

bool ZipArchive::extractTo(const ZipEntry& entry, const std::string& destPath, std::string& problem) const {
    std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
    if (!out) {
        problem = "cannot open '" + destPath + "' for writing";
        return false;
    }
    auto sink = [&out](const char* data, std::size_t n) {
        out.write(data, static_cast<std::streamsize>(n));
        return static_cast<bool>(out);
    };
    return decode(entry, sink, problem);
}
