#pragma once
#include <filesystem>

namespace masklint::fs {

// Destination directory for materialized scripts.
//
// A persistent directory is left on disk. An ephemeral directory is removed
// recursively by cleanup() or, at the latest, when the handle is destroyed.
class OutputDirectory {
public:
    // Creates path and any missing parents
    static OutputDirectory persistent(const std::filesystem::path& path);

    // Creates a fresh directory under the system temp directory
    static OutputDirectory ephemeral();

    OutputDirectory(OutputDirectory&& other) noexcept;
    OutputDirectory& operator=(OutputDirectory&& other) noexcept;
    OutputDirectory(const OutputDirectory&) = delete;
    OutputDirectory& operator=(const OutputDirectory&) = delete;
    ~OutputDirectory();

    const std::filesystem::path& path() const { return path_; }
    bool is_ephemeral() const { return ephemeral_; }

    // Removes an ephemeral directory; no-op for persistent ones or when
    // already cleaned up. Failures are logged, never thrown.
    void cleanup() noexcept;

private:
    OutputDirectory(std::filesystem::path path, bool ephemeral);

    std::filesystem::path path_;
    bool ephemeral_ = false;
};

}  // namespace masklint::fs
