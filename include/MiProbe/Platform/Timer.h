#pragma once

/**
 * @file Timer.h
 * @brief High-resolution timing utilities
 *
 * Provides:
 * - Elapsed time measurement for frame-wait deadlines
 * - Scoped timing (RAII) reported through Log::Debug
 *
 * Usage:
 * @code
 * Timer timer(true);
 * while (timer.ElapsedMs() < timeoutMs) { ... }
 *
 * {
 *     ScopedTimer timer("SaveProject");
 *     // ... work ...
 * }  // Logs: "SaveProject: 12.34 ms"
 * @endcode
 */

#include <MiProbe/Core/Export.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace Mi::Probe::Platform {

/**
 * @brief Monotonic timer
 *
 * Uses std::chrono::steady_clock so deadlines are immune to wall-clock changes.
 */
class MIPROBE_API Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration = std::chrono::duration<double>;

    /**
     * @brief Construct and optionally start timer
     * @param autoStart If true, timer starts immediately
     */
    explicit Timer(bool autoStart = false);

    /// Start or restart the timer
    void Start();

    /// Stop the timer
    void Stop();

    /// Reset timer to zero
    void Reset();

    bool IsRunning() const { return running_; }

    double ElapsedSeconds() const;
    double ElapsedMs() const;
    Duration Elapsed() const;

    /**
     * @brief Milliseconds left until budgetMs has elapsed (0 when expired)
     */
    int32_t RemainingMs(int32_t budgetMs) const;

private:
    TimePoint startTime_;
    Duration accumulated_{0};
    bool running_ = false;
};

/**
 * @brief RAII timer that logs elapsed time on destruction
 */
class MIPROBE_API ScopedTimer {
public:
    explicit ScopedTimer(const std::string& name);
    ~ScopedTimer();

    // Non-copyable
    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    double ElapsedMs() const { return timer_.ElapsedMs(); }

private:
    std::string name_;
    Timer timer_;
};

/**
 * @brief Sleep for specified milliseconds
 */
MIPROBE_API void SleepMs(int64_t ms);

} // namespace Mi::Probe::Platform
