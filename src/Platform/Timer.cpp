/**
 * @file Timer.cpp
 * @brief Timer implementation
 */

#include <MiProbe/Platform/Timer.h>
#include <MiProbe/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <thread>

namespace Mi::Probe::Platform {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer(bool autoStart) {
    if (autoStart) {
        Start();
    }
}

void Timer::Start() {
    if (!running_) {
        startTime_ = Clock::now();
        running_ = true;
    }
}

void Timer::Stop() {
    if (running_) {
        accumulated_ += std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
        running_ = false;
    }
}

void Timer::Reset() {
    accumulated_ = Duration{0};
    running_ = false;
}

Timer::Duration Timer::Elapsed() const {
    if (running_) {
        return accumulated_ + std::chrono::duration_cast<Duration>(Clock::now() - startTime_);
    }
    return accumulated_;
}

double Timer::ElapsedSeconds() const {
    return Elapsed().count();
}

double Timer::ElapsedMs() const {
    return ElapsedSeconds() * 1000.0;
}

int32_t Timer::RemainingMs(int32_t budgetMs) const {
    double left = static_cast<double>(budgetMs) - ElapsedMs();
    if (left <= 0.0) {
        return 0;
    }
    return static_cast<int32_t>(std::ceil(left));
}

// ============================================================================
// ScopedTimer Implementation
// ============================================================================

ScopedTimer::ScopedTimer(const std::string& name)
    : name_(name)
    , timer_(true) {
}

ScopedTimer::~ScopedTimer() {
    if (Log::IsEnabled(LogLevel::Debug)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.3f", timer_.ElapsedMs());
        Log::Debug(name_ + ": " + buf + " ms");
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

void SleepMs(int64_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

} // namespace Mi::Probe::Platform
