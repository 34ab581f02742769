/**
 * @file Timer.cpp
 * @brief Timer and clock implementation
 */

#include <VisMatch/Platform/Timer.h>

namespace Vis::Match::Platform {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    startTime_ = ClockType::now();
    started_ = true;
}

double Timer::ElapsedMs() const {
    if (!started_) {
        return 0.0;
    }
    return std::chrono::duration<double, std::milli>(ClockType::now() - startTime_).count();
}

// ============================================================================
// Clock Implementation
// ============================================================================

int64_t SystemClock::NowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::shared_ptr<Clock> DefaultClock() {
    static std::shared_ptr<Clock> instance = std::make_shared<SystemClock>();
    return instance;
}

} // namespace Vis::Match::Platform
