/**
 * @file cancellation_token.hpp
 * @brief Cooperative cancellation shared between a caller and its units
 */

#ifndef FORECAST_CANCELLATION_TOKEN_HPP
#define FORECAST_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <memory>

namespace forecast {

/**
 * @brief Shared cancellation flag with an optional parent
 *
 * Copies share state. A token reports cancelled when it or any ancestor
 * was cancelled; cancelling a child never affects the parent.
 *
 * Usage Example:
 *   @code
 *   CancellationToken forecast_token;
 *   CancellationToken unit_token = forecast_token.child();
 *
 *   forecast_token.cancel();
 *   unit_token.is_cancelled();  // true
 *   @endcode
 */
class CancellationToken {
public:
    CancellationToken();

    /**
     * @brief Request cancellation of this token and all of its children
     */
    void cancel();

    bool is_cancelled() const;

    /**
     * @brief New token that is cancelled whenever this one is
     */
    CancellationToken child() const;

private:
    struct State {
        std::atomic<bool> cancelled;
        std::shared_ptr<const State> parent;

        State() : cancelled(false) {}
    };

    explicit CancellationToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace forecast

#endif // FORECAST_CANCELLATION_TOKEN_HPP
