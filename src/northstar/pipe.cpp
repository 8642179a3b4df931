#include "northstar/pipe.h"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

#include "northstar/error.h"

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}

Pipe make_pipe(bool cloexec) {
    int fds[2];
    if (pipe2(fds, cloexec ? O_CLOEXEC : 0) != 0) {
        throw system_failure(ErrorCode::Io, "pipe2 failed", errno);
    }
    Pipe p;
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return p;
}

bool write_all(int fd, const void* data, size_t size) {
    const char* bytes = static_cast<const char*>(data);
    size_t written = 0;
    while (written < size) {
        ssize_t n = write(fd, bytes + written, size - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

bool write_all(int fd, const std::string& data) {
    return write_all(fd, data.data(), data.size());
}

bool read_exact(int fd, void* data, size_t size) {
    char* bytes = static_cast<char*>(data);
    size_t done = 0;
    while (done < size) {
        ssize_t n = read(fd, bytes + done, size - done);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (n == 0) {
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

bool read_to_end(int fd, std::string& out) {
    char buffer[4096];
    while (true) {
        ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return false;
        }
        if (n == 0) {
            return true;
        }
        out.append(buffer, static_cast<size_t>(n));
    }
}

bool send_frame(int fd, const json& message) {
    // Container output may carry invalid UTF-8.
    std::string body = message.dump(-1, ' ', false, json::error_handler_t::replace);
    if (body.size() > MAX_FRAME_SIZE) {
        return false;
    }
    uint32_t size = static_cast<uint32_t>(body.size());
    unsigned char header[4] = {
            static_cast<unsigned char>(size >> 24),
            static_cast<unsigned char>(size >> 16),
            static_cast<unsigned char>(size >> 8),
            static_cast<unsigned char>(size)
    };
    std::string frame(reinterpret_cast<const char*>(header), sizeof(header));
    frame += body;
    return write_all(fd, frame);
}

bool recv_frame(int fd, json& message) {
    unsigned char header[4];
    ssize_t n;
    do {
        n = read(fd, header, 1);
    } while (n < 0 && errno == EINTR);
    if (n == 0) {
        return false;
    }
    if (n < 0) {
        throw system_failure(ErrorCode::ProtocolError, "read failed", errno);
    }
    if (!read_exact(fd, header + 1, sizeof(header) - 1)) {
        throw NorthstarError(ErrorCode::ProtocolError, "truncated frame header");
    }
    uint32_t size = (static_cast<uint32_t>(header[0]) << 24) | (static_cast<uint32_t>(header[1]) << 16) |
                    (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
    if (size == 0 || size > MAX_FRAME_SIZE) {
        throw NorthstarError(ErrorCode::ProtocolError, "invalid frame size " + std::to_string(size));
    }
    std::string body(size, '\0');
    if (!read_exact(fd, &body[0], size)) {
        throw NorthstarError(ErrorCode::ProtocolError, "truncated frame");
    }
    message = json::parse(body, nullptr, false);
    if (message.is_discarded()) {
        throw NorthstarError(ErrorCode::ProtocolError, "frame is not valid JSON");
    }
    return true;
}
