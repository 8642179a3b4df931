#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

constexpr uint32_t MAX_FRAME_SIZE = 4 * 1024 * 1024;

// Owns a file descriptor and closes it on destruction.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

// Both ends are close-on-exec unless cloexec is false.
Pipe make_pipe(bool cloexec = true);

bool write_all(int fd, const void* data, size_t size);
bool write_all(int fd, const std::string& data);
// Fails on error or when EOF arrives before size bytes.
bool read_exact(int fd, void* data, size_t size);
// Reads until EOF.
bool read_to_end(int fd, std::string& out);

// 4 byte big-endian length followed by compact JSON.
bool send_frame(int fd, const json& message);
// Returns false on EOF at a frame boundary; throws ProtocolError on a malformed frame.
bool recv_frame(int fd, json& message);
