#include "cancellation.hpp"

namespace carelog::extraction {

CancellationToken::Registration::Registration(std::shared_ptr<State> state, std::uint64_t id)
    : state_(std::move(state)), id_(id) {
}

CancellationToken::Registration::~Registration() {
  Reset();
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_) {
  other.id_ = 0;
}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& other) noexcept {
  if (this != &other) {
    Reset();
    state_    = std::move(other.state_);
    id_       = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void CancellationToken::Registration::Reset() {
  if (!state_) return;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->callbacks.erase(id_);
  }
  state_.reset();
  id_ = 0;
}

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

void CancellationToken::Cancel() {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled) return;
  state_->cancelled = true;
  for (auto& [_, callback] : state_->callbacks) {
    callback();
  }
  state_->callbacks.clear();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->cancelled;
}

CancellationToken::Registration CancellationToken::OnCancel(std::function<void()> callback) const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  if (state_->cancelled) {
    callback();
    return {};
  }
  const auto id = state_->next_id++;
  state_->callbacks.emplace(id, std::move(callback));
  return Registration(state_, id);
}

} // namespace carelog::extraction
