#pragma once
#include <chrono>
#include <cstdint>
#include <functional>

namespace mba {

using Clock = std::function<int64_t()>;

inline int64_t systemNowMillis() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace mba
