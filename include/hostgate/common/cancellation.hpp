#pragma once

#include <atomic>
#include <chrono>
#include <memory>

namespace hostgate::common {

/// Read side of a cooperative cancellation flag. A default-constructed token never fires.
class CancellationToken {
public:
  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<std::atomic_bool> flag) : flag_(std::move(flag)) {}

  [[nodiscard]] bool is_cancelled() const {
    return flag_ != nullptr && flag_->load(std::memory_order_acquire);
  }
  [[nodiscard]] bool can_be_cancelled() const { return flag_ != nullptr; }

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

/// Owner side. Tokens handed out share the flag, so they stay valid after the source is gone.
class CancellationSource {
public:
  CancellationSource() : flag_(std::make_shared<std::atomic_bool>(false)) {}

  [[nodiscard]] CancellationToken token() const { return CancellationToken(flag_); }
  void cancel() { flag_->store(true, std::memory_order_release); }
  [[nodiscard]] bool is_cancelled() const { return flag_->load(std::memory_order_acquire); }

private:
  std::shared_ptr<std::atomic_bool> flag_;
};

/// Sleeps in `slice` steps. Returns false as soon as `token` fires, true after the full wait.
[[nodiscard]] bool sleep_cancellable(std::chrono::milliseconds duration,
                                     const CancellationToken &token,
                                     std::chrono::milliseconds slice = std::chrono::milliseconds(10));

} // namespace hostgate::common
