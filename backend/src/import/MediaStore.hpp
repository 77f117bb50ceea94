#pragma once
#include <string>
#include <map>

// Where imported media ends up. The core only passes filenames around; how a
// name becomes something playable is up to the implementation.
class MediaStore {
public:
    virtual ~MediaStore() = default;

    virtual bool exists(const std::string& name) const = 0;
    virtual std::string checksum(const std::string& name) const = 0;   // "" when missing
    virtual bool write(const std::string& name, const std::string& bytes) = 0;
    virtual bool copyFrom(const std::string& name, const std::string& sourcePath) = 0;
    virtual bool remove(const std::string& name) = 0;
    virtual std::string reference(const std::string& name) const = 0;
};

// Plain directory of files, one per media name.
class DirectoryMediaStore : public MediaStore {
public:
    explicit DirectoryMediaStore(const std::string& directory);

    bool exists(const std::string& name) const override;
    std::string checksum(const std::string& name) const override;
    bool write(const std::string& name, const std::string& bytes) override;
    bool copyFrom(const std::string& name, const std::string& sourcePath) override;
    bool remove(const std::string& name) override;
    std::string reference(const std::string& name) const override;

    const std::string& directory() const { return media_dir; }

private:
    std::string media_dir;
    std::string pathFor(const std::string& name) const;
};

namespace Media
{
    // Basename only, [A-Za-z0-9._-], at most 255 bytes, never empty.
    std::string sanitizeFilename(const std::string& name);

    // BLAKE2b (libsodium generichash) as hex.
    std::string checksum(const std::string& bytes);
    bool checksumFile(const std::string& path, std::string& out);

    // "photo.jpg" + "1a2b" -> "photo_1a2b.jpg"
    std::string withSuffix(const std::string& name, const std::string& suffix);

    // Rewrites <img src="..."> and [sound:...] references found in `renames`.
    // Returns how many references changed.
    std::size_t rewriteReferences(std::string& html, const std::map<std::string, std::string>& renames);
}
