#pragma once

// Reconnect and shutdown helpers shared by the telemetry source and the broker publishers

#include "mavtrack.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <random>

namespace mavtrack {

// Process-wide stop request. Every wait that may take longer than a poll interval
// goes through wait_for() so a stop request ends it early.
class ShutdownSignal {
public:
    void request() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _requested = true;
        }
        _cv.notify_all();
    }

    bool requested() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _requested;
    }

    // Returns true if a stop was requested before (or while) waiting.
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(_mutex);
        return _cv.wait_for(lock, duration, [this] { return _requested; });
    }

    void wait() {
        std::unique_lock<std::mutex> lock(_mutex);
        _cv.wait(lock, [this] { return _requested; });
    }

private:
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    bool _requested = false;
};

struct BackoffPolicy {
    std::chrono::milliseconds initial{500};
    std::chrono::milliseconds max{30000};
    double multiplier = 2.0;
    double jitter = 0.2;  // +/- fraction applied to every delay
};

// Exponential reconnect backoff, capped at policy.max, with random jitter so that
// several bridges restarting together do not hammer a broker in lockstep.
class Backoff {
public:
    explicit Backoff(const BackoffPolicy& policy, unsigned seed = std::random_device{}())
        : _policy(policy), _rng(seed) {
        if (_policy.initial.count() <= 0) _policy.initial = std::chrono::milliseconds(1);
        if (_policy.max < _policy.initial) _policy.max = _policy.initial;
        if (_policy.multiplier < 1.0) _policy.multiplier = 1.0;
        if (_policy.jitter < 0.0) _policy.jitter = 0.0;
        if (_policy.jitter > 1.0) _policy.jitter = 1.0;
    }

    std::chrono::milliseconds next_delay() {
        double base = static_cast<double>(_policy.initial.count());
        for (size_t i = 0; i < _attempts && base < static_cast<double>(_policy.max.count()); ++i) {
            base *= _policy.multiplier;
        }
        base = std::min(base, static_cast<double>(_policy.max.count()));
        _attempts++;

        if (_policy.jitter > 0.0) {
            std::uniform_real_distribution<double> dist(1.0 - _policy.jitter, 1.0 + _policy.jitter);
            base *= dist(_rng);
        }
        return std::chrono::milliseconds(static_cast<long long>(base));
    }

    void reset() { _attempts = 0; }
    size_t attempts() const { return _attempts; }
    const BackoffPolicy& policy() const { return _policy; }

private:
    BackoffPolicy _policy;
    std::mt19937 _rng;
    size_t _attempts = 0;
};

} // namespace mavtrack
