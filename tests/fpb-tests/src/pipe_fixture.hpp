#pragma once

#include <string>
#include <cerrno>
#include <unistd.h>

namespace fpb_tests {

struct Pipe {
    int read_fd = -1;
    int write_fd = -1;

    Pipe() {
        int fds[2];
        if (pipe(fds) == 0) {
            read_fd = fds[0];
            write_fd = fds[1];
        }
    }

    ~Pipe() {
        closeRead();
        closeWrite();
    }

    Pipe(const Pipe &) = delete;
    Pipe &operator=(const Pipe &) = delete;

    void closeRead() {
        if (read_fd >= 0) {
            close(read_fd);
            read_fd = -1;
        }
    }

    void closeWrite() {
        if (write_fd >= 0) {
            close(write_fd);
            write_fd = -1;
        }
    }

    bool write(const std::string &data) const {
        return ::write(write_fd, data.data(), data.size()) == static_cast<ssize_t>(data.size());
    }

    // Reads until EOF; the write end must be closed first.
    std::string drain() const {
        std::string result;
        char buffer[256];
        while (true) {
            ssize_t n = ::read(read_fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                break;
            }
            result.append(buffer, static_cast<size_t>(n));
        }
        return result;
    }
};

} // namespace fpb_tests
