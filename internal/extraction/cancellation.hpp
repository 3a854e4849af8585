#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace carelog::extraction {

/*
  Shared cancellation flag. Copies observe the same state.

  OnCancel() callbacks run on the thread that calls Cancel(), under the
  token's lock: keep them short and never touch the token from inside one.
  A callback registered after cancellation runs immediately.
*/
class CancellationToken {
  struct State;

 public:
  // Deregisters its callback on destruction; waits for it if it is running.
  class Registration {
   public:
    Registration() = default;
    Registration(std::shared_ptr<State> state, std::uint64_t id);
    ~Registration();

    Registration(Registration&& other) noexcept;
    Registration& operator=(Registration&& other) noexcept;
    Registration(const Registration&)            = delete;
    Registration& operator=(const Registration&) = delete;

   private:
    void Reset();

    std::shared_ptr<State> state_;
    std::uint64_t          id_ = 0;
  };

  CancellationToken();

  void Cancel();
  bool IsCancelled() const;

  [[nodiscard]] Registration OnCancel(std::function<void()> callback) const;

 private:
  struct State {
    std::mutex                                      mutex;
    bool                                            cancelled = false;
    std::uint64_t                                   next_id   = 1;
    std::map<std::uint64_t, std::function<void()>> callbacks;
  };

  std::shared_ptr<State> state_;
};

} // namespace carelog::extraction
