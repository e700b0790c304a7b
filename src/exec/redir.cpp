/*
 * Redirection file handling implementation - shellkit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <shellkit/exec/redir.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace shellkit {

static Error io_error(const std::string& what, const std::string& path, int err) {
    return make_error(ErrorKind::Io, what + " " + path + ": " + std::strerror(err));
}

Status LocalFileHandler::write_file(const std::string& path, const std::string& content, RedirType type) {
    int flags = O_CREAT|O_WRONLY|(type == RedirType::OutAppend ? O_APPEND : O_TRUNC);
    int fd = ::open(path.c_str(), flags, 0644);
    if (fd < 0) return io_error("failed to write to file", path, errno);
    std::size_t off = 0;
    while (off < content.size()) {
        ssize_t n = ::write(fd, content.data() + off, content.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno; ::close(fd);
            return io_error("failed to write to file", path, err);
        }
        off += static_cast<std::size_t>(n);
    }
    if (::close(fd) != 0) return io_error("failed to write to file", path, errno);
    return std::nullopt;
}

Status LocalFileHandler::read_file(const std::string& path, std::string& content) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) return io_error("failed to read file", path, errno);
    content.clear();
    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno; ::close(fd);
            return io_error("failed to read file", path, err);
        }
        if (n == 0) break;
        content.append(buf, static_cast<std::size_t>(n));
    }
    ::close(fd);
    return std::nullopt;
}

} // namespace shellkit
