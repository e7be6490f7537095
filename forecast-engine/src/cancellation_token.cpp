/**
 * @file cancellation_token.cpp
 * @brief Implementation of CancellationToken
 */

#include "cancellation_token.hpp"

namespace forecast {

CancellationToken::CancellationToken()
    : state_(std::make_shared<State>()) {}

CancellationToken::CancellationToken(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

void CancellationToken::cancel() {
    state_->cancelled.store(true, std::memory_order_release);
}

bool CancellationToken::is_cancelled() const {
    for (const State* state = state_.get(); state != nullptr; state = state->parent.get()) {
        if (state->cancelled.load(std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

CancellationToken CancellationToken::child() const {
    auto state = std::make_shared<State>();
    state->parent = state_;
    return CancellationToken(std::move(state));
}

} // namespace forecast
