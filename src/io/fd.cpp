#include "io/fd.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <unistd.h>

namespace uisync {

Fd::Fd(int fd) : fd_(fd) {}

Fd::Fd(Fd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }

Fd& Fd::operator=(Fd&& other) noexcept {
    if (this != &other) {
        Close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

Fd::~Fd() { Close(); }

int Fd::Get() const { return fd_; }

bool Fd::Valid() const { return fd_ >= 0; }

void Fd::Close() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = -1;
}

Result Fd::CloseChecked() {
    if (fd_ < 0) return Result::Ok();
    const int fd = fd_;
    fd_ = -1;
    if (::close(fd) == -1 && errno != EINTR) {
        return Result::Fail(errno, "close failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

} // namespace uisync
