#pragma once
#include <string>

// Private scratch directory under the system temp dir, removed with its
// contents when the object goes away.
class SpillDirectory {
public:
    // Throws ImportError (Archive stage) when the directory cannot be created.
    explicit SpillDirectory(const std::string& parent = "");
    ~SpillDirectory();

    SpillDirectory(const SpillDirectory&) = delete;
    SpillDirectory& operator=(const SpillDirectory&) = delete;

    const std::string& path() const { return dir_path; }
    std::string file(const std::string& name) const;

private:
    std::string dir_path;
};
