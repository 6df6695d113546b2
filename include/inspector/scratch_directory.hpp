//! # Scratch Directory
//!
//! Per-call working directory `<root>/apidiff/<32 hex chars>/` holding the
//! modules selected from one archive. Removed when the owner goes out of
//! scope; removal failures are logged and ignored.

#pragma once

#include "common.hpp"

#include <filesystem>
#include <string>

namespace apidiff::inspector {

class ScratchDirectory {
public:
    /// Creates a fresh, uniquely named directory under `root`.
    [[nodiscard]] static auto create(const std::filesystem::path& root)
        -> Result<ScratchDirectory, std::string>;

    ScratchDirectory(const ScratchDirectory&) = delete;
    auto operator=(const ScratchDirectory&) -> ScratchDirectory& = delete;
    ScratchDirectory(ScratchDirectory&& other) noexcept;
    auto operator=(ScratchDirectory&& other) noexcept -> ScratchDirectory&;
    ~ScratchDirectory();

    [[nodiscard]] auto path() const -> const std::filesystem::path& {
        return path_;
    }

    /// Writes `bytes` as `<dir>/<file_name>` and returns the full path.
    [[nodiscard]] auto write(const std::string& file_name, const ByteBuffer& bytes) const
        -> Result<std::filesystem::path, std::string>;

private:
    explicit ScratchDirectory(std::filesystem::path path) : path_(std::move(path)) {}

    void remove();

    std::filesystem::path path_;
};

} // namespace apidiff::inspector
