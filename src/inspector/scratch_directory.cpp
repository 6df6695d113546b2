#include "inspector/scratch_directory.hpp"

#include "log/log.hpp"
#include "package/hashing.hpp"

#include <fstream>

namespace apidiff::inspector {

namespace fs = std::filesystem;

namespace {

constexpr size_t NAME_BYTES = 16;
constexpr int CREATE_ATTEMPTS = 4;

} // namespace

auto ScratchDirectory::create(const fs::path& root) -> Result<ScratchDirectory, std::string> {
    std::error_code ec;
    fs::path base = root / "apidiff";
    fs::create_directories(base, ec);
    if (ec) {
        return "cannot create " + base.string() + ": " + ec.message();
    }

    for (int attempt = 0; attempt < CREATE_ATTEMPTS; ++attempt) {
        auto name = package::random_hex(NAME_BYTES);
        if (!name) {
            return std::string("no randomness available for scratch directory name");
        }
        fs::path dir = base / *name;
        if (fs::create_directory(dir, ec)) {
            APIDIFF_LOG_TRACE("inspector", "Scratch directory " << dir.string());
            return ScratchDirectory(dir);
        }
        if (ec) {
            return "cannot create " + dir.string() + ": " + ec.message();
        }
    }
    return std::string("scratch directory name collision");
}

ScratchDirectory::ScratchDirectory(ScratchDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

auto ScratchDirectory::operator=(ScratchDirectory&& other) noexcept -> ScratchDirectory& {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

void ScratchDirectory::remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        APIDIFF_LOG_WARN("inspector", "Could not remove scratch directory " << path_.string()
                                                                             << ": "
                                                                             << ec.message());
    }
    path_.clear();
}

auto ScratchDirectory::write(const std::string& file_name, const ByteBuffer& bytes) const
    -> Result<fs::path, std::string> {
    fs::path target = path_ / fs::path(file_name).filename();
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
        return "cannot open " + target.string() + " for writing";
    }
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return "cannot write " + target.string();
    }
    return target;
}

} // namespace apidiff::inspector
