#include "SpillDirectory.hpp"
#include "../core/Errors.hpp"
#include <filesystem>
#include <random>
#include <sstream>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

SpillDirectory::SpillDirectory(const std::string& parent) {
    std::error_code ec;
    fs::path base = parent.empty() ? fs::temp_directory_path(ec) : fs::path(parent);
    if (ec) throw ImportError(ImportError::Stage::Archive, "No temporary directory available: " + ec.message());

    std::random_device rd;
    for (int attempt = 0; attempt < 8; ++attempt) {
        std::ostringstream name;
        name << "flashcore-import-" << std::hex << rd() << rd();
        fs::path candidate = base / name.str();
        if (fs::create_directories(candidate, ec) && !ec) {
            dir_path = candidate.string();
            spdlog::debug("Created spill directory '{}'", dir_path);
            return;
        }
    }
    throw ImportError(ImportError::Stage::Archive, "Cannot create a temporary directory under '" + base.string() + "'");
}

SpillDirectory::~SpillDirectory() {
    std::error_code ec;
    fs::remove_all(dir_path, ec);
    if (ec) spdlog::warn("Failed to remove spill directory '{}': {}", dir_path, ec.message());
}

std::string SpillDirectory::file(const std::string& name) const {
    return (fs::path(dir_path) / name).string();
}
