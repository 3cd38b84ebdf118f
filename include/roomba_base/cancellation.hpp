#ifndef ROOMBA_BASE_CANCELLATION_HPP__
#define ROOMBA_BASE_CANCELLATION_HPP__

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace roomba_base {

/**
 * @brief Shared cancellation flag with an optional deadline.
 *
 * Copies share state: cancelling any copy cancels all of them. Callbacks
 * registered with subscribe() run once, on the thread that calls cancel(),
 * or immediately if the token is already cancelled.
 */
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;
  using Callback = std::function<void()>;

  CancellationToken();

  /** @brief Token that is never cancelled but expires at @p deadline. */
  static CancellationToken withDeadline(Clock::time_point deadline);

  /** @brief Token that expires @p timeout from now. */
  static CancellationToken withTimeout(Clock::duration timeout);

  void cancel();
  bool isCancelled() const;

  std::optional<Clock::time_point> deadline() const;

  /** @return id for unsubscribe(). */
  std::size_t subscribe(Callback cb);
  void unsubscribe(std::size_t id);

private:
  struct State {
    mutable std::mutex mtx;
    bool cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::map<std::size_t, Callback> callbacks;
    std::size_t next_id{1};
  };

  std::shared_ptr<State> state_;
};

}  // namespace roomba_base

#endif  // ROOMBA_BASE_CANCELLATION_HPP__
