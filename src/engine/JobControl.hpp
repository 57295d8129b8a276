/**
 * @file JobControl.hpp
 * @brief Cooperative pause/cancel signal for one running job
 */

#pragma once

#include <atomic>

enum class ControlSignal { None, Pause, Cancel };

/**
 * @class JobControl
 * @brief Observed by the engine at every chunk boundary
 *
 * Cancel overrides a pending pause; a pause never downgrades a cancel.
 */
class JobControl {
public:
    void request_pause() {
        auto expected = ControlSignal::None;
        signal_.compare_exchange_strong(expected, ControlSignal::Pause);
    }

    void request_cancel() { signal_.store(ControlSignal::Cancel); }

    void clear() { signal_.store(ControlSignal::None); }

    [[nodiscard]] auto signal() const -> ControlSignal { return signal_.load(); }

private:
    std::atomic<ControlSignal> signal_{ControlSignal::None};
};
