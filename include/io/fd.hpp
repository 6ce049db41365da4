#pragma once

#include "util/result.hpp"

namespace uisync {

class Fd {
  public:
    Fd() = default;
    explicit Fd(int fd);

    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;

    Fd(Fd&& other) noexcept;
    Fd& operator=(Fd&& other) noexcept;

    ~Fd();

    int Get() const;
    bool Valid() const;

    void Close();

    // close(2) with its error reported; a file written through this fd is only
    // known to be complete once this succeeds.
    Result CloseChecked();

  private:
    int fd_{-1};
};

} // namespace uisync
