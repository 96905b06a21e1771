#include "masklint/fs/output_directory.hpp"

#include <stdlib.h>

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::fs {

OutputDirectory::OutputDirectory(std::filesystem::path path, bool ephemeral)
    : path_(std::move(path)), ephemeral_(ephemeral) {}

OutputDirectory OutputDirectory::persistent(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec) {
        throw OutputDirectoryError("cannot create " + path.string() + ": " +
                                   ec.message());
    }
    if (!std::filesystem::is_directory(path, ec)) {
        throw OutputDirectoryError(path.string() + " is not a directory");
    }
    MASKLINT_LOG_DEBUG << "Using output directory " << path.string();
    return OutputDirectory(path, false);
}

OutputDirectory OutputDirectory::ephemeral() {
    std::error_code ec;
    const auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw OutputDirectoryError("no temporary directory available: " +
                                   ec.message());
    }

    std::string pattern = (base / "masklint-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw OutputDirectoryError("cannot create temporary directory in " +
                                   base.string() + ": " + std::strerror(errno));
    }

    std::filesystem::path path(buffer.data());
    MASKLINT_LOG_DEBUG << "Created temporary output directory "
                       << path.string();
    return OutputDirectory(path, true);
}

OutputDirectory::OutputDirectory(OutputDirectory&& other) noexcept
    : path_(std::move(other.path_)), ephemeral_(other.ephemeral_) {
    other.ephemeral_ = false;
    other.path_.clear();
}

OutputDirectory& OutputDirectory::operator=(OutputDirectory&& other) noexcept {
    if (this != &other) {
        cleanup();
        path_ = std::move(other.path_);
        ephemeral_ = other.ephemeral_;
        other.ephemeral_ = false;
        other.path_.clear();
    }
    return *this;
}

OutputDirectory::~OutputDirectory() { cleanup(); }

void OutputDirectory::cleanup() noexcept {
    if (!ephemeral_ || path_.empty()) {
        return;
    }
    ephemeral_ = false;

    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        MASKLINT_LOG_WARN << "Failed to remove temporary directory "
                          << path_.string() << ": " << ec.message();
    } else {
        MASKLINT_LOG_DEBUG << "Removed temporary directory " << path_.string();
    }
}

}  // namespace masklint::fs
