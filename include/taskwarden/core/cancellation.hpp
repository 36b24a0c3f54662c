#pragma once

#include <atomic>
#include <memory>

namespace taskwarden {

class CancellationToken;

// Shared cancel flag. The source is held by whoever may cancel a job; tokens
// travel with the job and are checked at admission and before spawning.
class CancellationSource {
public:
  CancellationSource() : state_(std::make_shared<State>()) {
  }

  [[nodiscard]] auto token() const noexcept -> CancellationToken;

  // Returns true only for the call that flipped the flag.
  auto cancel() noexcept -> bool {
    return !state_->cancelled.exchange(true, std::memory_order_acq_rel);
  }

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_->cancelled.load(std::memory_order_acquire);
  }

private:
  struct State {
    std::atomic<bool> cancelled{false};
  };
  std::shared_ptr<State> state_;

  friend class CancellationToken;
};

class CancellationToken {
public:
  CancellationToken() = default;

  [[nodiscard]] auto is_cancelled() const noexcept -> bool {
    return state_ && state_->cancelled.load(std::memory_order_acquire);
  }

  [[nodiscard]] static auto none() noexcept -> CancellationToken {
    return {};
  }

private:
  explicit CancellationToken(std::shared_ptr<CancellationSource::State> state)
      : state_(std::move(state)) {
  }

  std::shared_ptr<CancellationSource::State> state_;

  friend class CancellationSource;
};

inline auto CancellationSource::token() const noexcept -> CancellationToken {
  return CancellationToken{state_};
}

}  // namespace taskwarden
