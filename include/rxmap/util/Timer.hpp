#pragma once

#include <chrono>

namespace rxmap {

class WallTimer {
public:
  using clock = std::chrono::steady_clock;

  WallTimer() : t0_(clock::now()) {}

  double elapsed_seconds() const {
    const auto dt = clock::now() - t0_;
    return std::chrono::duration_cast<std::chrono::duration<double>>(dt).count();
  }

private:
  clock::time_point t0_;
};

} // namespace rxmap
