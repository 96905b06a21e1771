#include "masklint/fs/script_materializer.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include "masklint/core/errors.hpp"
#include "masklint/log/logger.hpp"

namespace masklint::fs {

namespace {

std::string io_error(const std::string& what, const std::string& path,
                     int err) {
    return what + " " + path + ": " + std::strerror(err);
}

}  // namespace

std::string script_file_name(const std::string& qualified_name,
                             lint::LanguageHandler handler) {
    std::string name = qualified_name;
    std::replace(name.begin(), name.end(), ' ', '_');
    name += lint::file_extension(handler);
    return name;
}

std::filesystem::path materialize(lint::LanguageHandler handler,
                                  const std::string& qualified_name,
                                  const maskfile::Script& script,
                                  const std::filesystem::path& directory) {
    const auto path = directory / script_file_name(qualified_name, handler);
    const std::string path_str = path.string();
    const std::string content = lint::transform_content(handler, script);

    int fd = ::open(path_str.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            throw CollisionError(path_str);
        }
        throw MaterializeError(io_error("Cannot create", path_str, errno));
    }

    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written,
                            content.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int err = errno;
            ::close(fd);
            throw MaterializeError(io_error("Cannot write", path_str, err));
        }
        written += static_cast<size_t>(n);
    }

    if (::close(fd) != 0) {
        throw MaterializeError(io_error("Cannot close", path_str, errno));
    }

    MASKLINT_LOG_DEBUG << "Materialized '" << qualified_name << "' as "
                       << path_str << " (" << content.size() << " bytes)";
    return path;
}

}  // namespace masklint::fs
