#pragma once

/**
 * @file Timer.h
 * @brief High-resolution timing and wall-clock utilities
 *
 * Provides:
 * - High-resolution time measurement (Timer)
 * - Injectable wall clock for timestamping and expiry (Clock)
 *
 * Usage:
 * @code
 * Timer timer(true);
 * // ... work ...
 * double elapsed = timer.ElapsedMs();
 *
 * auto clock = std::make_shared<SystemClock>();
 * int64_t createdAt = clock->NowMs();
 * @endcode
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <VisMatch/Core/Export.h>

namespace Vis::Match::Platform {

/**
 * @brief High-resolution timer
 *
 * Uses std::chrono::steady_clock so measurements never run backwards.
 */
class VISMATCH_API Timer {
public:
    using ClockType = std::chrono::steady_clock;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// Start or restart the timer
    void Start();

    /// Milliseconds since Start(), 0 if never started
    double ElapsedMs() const;

private:
    ClockType::time_point startTime_;
    bool started_ = false;
};

// ============================================================================
// Wall Clock
// ============================================================================

/**
 * @brief Wall clock abstraction
 *
 * Components that timestamp data (feature cache entries) take a Clock so that
 * tests can move time forward without sleeping.
 */
class VISMATCH_API Clock {
public:
    virtual ~Clock() = default;

    /// Milliseconds since the Unix epoch
    virtual int64_t NowMs() const = 0;
};

/**
 * @brief Clock backed by std::chrono::system_clock
 */
class VISMATCH_API SystemClock : public Clock {
public:
    int64_t NowMs() const override;
};

/**
 * @brief Process-wide SystemClock instance
 */
VISMATCH_API std::shared_ptr<Clock> DefaultClock();

} // namespace Vis::Match::Platform
