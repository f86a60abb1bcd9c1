#include "hostgate/common/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace hostgate::common {

bool sleep_cancellable(const std::chrono::milliseconds duration, const CancellationToken &token,
                       const std::chrono::milliseconds slice) {
  const auto deadline = std::chrono::steady_clock::now() + duration;
  const auto step = std::max(slice, std::chrono::milliseconds(1));
  while (true) {
    if (token.is_cancelled()) {
      return false;
    }
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      return true;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(step, remaining + std::chrono::milliseconds(1)));
  }
}

} // namespace hostgate::common
