#include "MediaStore.hpp"
#include "../utils/Text.hpp"
#include <filesystem>
#include <fstream>
#include <vector>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

static constexpr std::size_t HASH_BYTES = 16;
static constexpr std::size_t MAX_NAME_LEN = 255;

static std::string toHex(const unsigned char* data, std::size_t len) {
    std::vector<char> hex(2 * len + 1);
    sodium_bin2hex(hex.data(), hex.size(), data, len);
    return std::string(hex.data());
}

/* -------------------------
   DirectoryMediaStore
   ------------------------- */

DirectoryMediaStore::DirectoryMediaStore(const std::string& directory)
    : media_dir(directory)
{
    std::error_code ec;
    fs::create_directories(media_dir, ec);
    if (ec) spdlog::error("Failed to create media directory '{}': {}", media_dir, ec.message());
    else spdlog::info("Media directory '{}'", media_dir);
}

std::string DirectoryMediaStore::pathFor(const std::string& name) const {
    return (fs::path(media_dir) / name).string();
}

bool DirectoryMediaStore::exists(const std::string& name) const {
    std::error_code ec;
    return fs::is_regular_file(pathFor(name), ec);
}

std::string DirectoryMediaStore::checksum(const std::string& name) const {
    std::string sum;
    if (!exists(name) || !Media::checksumFile(pathFor(name), sum)) return "";
    return sum;
}

bool DirectoryMediaStore::write(const std::string& name, const std::string& bytes) {
    std::ofstream out(pathFor(name), std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open media file '{}' for writing", name);
        return false;
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    return static_cast<bool>(out);
}

bool DirectoryMediaStore::copyFrom(const std::string& name, const std::string& sourcePath) {
    std::error_code ec;
    fs::copy_file(sourcePath, pathFor(name), fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::error("Failed to copy media '{}' from '{}': {}", name, sourcePath, ec.message());
        return false;
    }
    return true;
}

bool DirectoryMediaStore::remove(const std::string& name) {
    std::error_code ec;
    bool removed = fs::remove(pathFor(name), ec);
    if (ec) spdlog::warn("Failed to remove media '{}': {}", name, ec.message());
    return removed;
}

std::string DirectoryMediaStore::reference(const std::string& name) const {
    return pathFor(name);
}

/* -------------------------
   Helpers
   ------------------------- */

std::string Media::sanitizeFilename(const std::string& name) {
    std::string base = name;
    std::size_t slash = base.find_last_of("/\\");
    if (slash != std::string::npos) base = base.substr(slash + 1);

    Text::replaceAll(base, "..", "");

    for (auto& c : base) {
        unsigned char u = static_cast<unsigned char>(c);
        bool safe = (u >= 'a' && u <= 'z') || (u >= 'A' && u <= 'Z') || (u >= '0' && u <= '9') ||
            c == '.' || c == '-' || c == '_';
        if (!safe) c = '_';
    }

    if (base.size() > MAX_NAME_LEN) {
        std::size_t dot = base.find_last_of('.');
        std::string ext = dot == std::string::npos ? "" : base.substr(dot);
        if (ext.size() >= MAX_NAME_LEN) ext.clear();
        base = base.substr(0, MAX_NAME_LEN - ext.size()) + ext;
    }

    if (base.empty() || base == ".") base = "unnamed";
    return base;
}

std::string Media::checksum(const std::string& bytes) {
    unsigned char hash[HASH_BYTES];
    crypto_generichash(hash, sizeof(hash),
        reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(), nullptr, 0);
    return toHex(hash, sizeof(hash));
}

bool Media::checksumFile(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    crypto_generichash_state state;
    crypto_generichash_init(&state, nullptr, 0, HASH_BYTES);

    std::vector<char> buffer(64 * 1024);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize n = in.gcount();
        if (n > 0)
            crypto_generichash_update(&state, reinterpret_cast<const unsigned char*>(buffer.data()),
                static_cast<unsigned long long>(n));
    }

    unsigned char hash[HASH_BYTES];
    crypto_generichash_final(&state, hash, sizeof(hash));
    out = toHex(hash, sizeof(hash));
    return true;
}

std::string Media::withSuffix(const std::string& name, const std::string& suffix) {
    std::size_t dot = name.find_last_of('.');
    if (dot == std::string::npos || dot == 0) return name + "_" + suffix;
    return name.substr(0, dot) + "_" + suffix + name.substr(dot);
}

std::size_t Media::rewriteReferences(std::string& html, const std::map<std::string, std::string>& renames) {
    if (renames.empty()) return 0;

    const std::string lower = Text::toLower(html);
    std::string out;
    out.reserve(html.size());
    std::size_t changed = 0;
    std::size_t pos = 0;

    auto substitute = [&](std::size_t valueBegin, std::size_t valueEnd) {
        std::string value = html.substr(valueBegin, valueEnd - valueBegin);
        auto it = renames.find(value);
        out.append(html, pos, valueBegin - pos);
        if (it != renames.end() && it->second != value) {
            out += it->second;
            ++changed;
        }
        else {
            out += value;
        }
        pos = valueEnd;
    };

    while (pos < html.size()) {
        std::size_t src = lower.find("src=", pos);
        std::size_t sound = lower.find("[sound:", pos);
        if (src == std::string::npos && sound == std::string::npos) break;

        if (sound == std::string::npos || (src != std::string::npos && src < sound)) {
            std::size_t quote = src + 4;
            if (quote < html.size() && (html[quote] == '"' || html[quote] == '\'')) {
                std::size_t close = html.find(html[quote], quote + 1);
                if (close != std::string::npos) {
                    substitute(quote + 1, close);
                    continue;
                }
            }
            out.append(html, pos, quote - pos);
            pos = quote;
        }
        else {
            std::size_t begin = sound + 7;
            std::size_t close = html.find(']', begin);
            if (close == std::string::npos) {
                out.append(html, pos, begin - pos);
                pos = begin;
                continue;
            }
            substitute(begin, close);
        }
    }

    out.append(html, pos, std::string::npos);
    html = out;
    return changed;
}
