#pragma once

/**
 * @file Acquisition.h
 * @brief Point reading acquisition over the serial channel
 *
 * One exchange:
 *   discard stale input -> send $SEL,<id> -> wait for a frame (timeoutMs,
 *   sliced at pollIntervalMs) -> verify checksum -> parse value and unit
 *
 * Failed exchanges are retried (maxRetries exchanges in total) with linear or
 * exponential backoff. The point is written only after a successful exchange.
 *
 * Requests run on one dedicated worker thread, in submission order, and hold
 * the channel exclusively for their whole duration.
 *
 * Cancellation is cooperative: Cancel() marks the in-flight request and every
 * request submitted before the call as cancelled. It is observed between
 * frame-wait slices and during backoff; cancelled requests fail with
 * AcquisitionException(Cancelled) and never write a value.
 */

#include <MiProbe/Core/Exception.h>
#include <MiProbe/Core/Export.h>
#include <MiProbe/Core/Types.h>
#include <MiProbe/Model/Project.h>
#include <MiProbe/Platform/Thread.h>
#include <MiProbe/Serial/SerialChannel.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>

namespace Mi::Probe {

// =============================================================================
// Constants
// =============================================================================

constexpr int32_t DEFAULT_TIMEOUT_MS = 2000;
constexpr int32_t DEFAULT_MAX_RETRIES = 3;
constexpr int32_t DEFAULT_BACKOFF_BASE_MS = 100;
constexpr int32_t DEFAULT_POLL_INTERVAL_MS = 50;

// =============================================================================
// Parameters
// =============================================================================

enum class BackoffMode {
    Linear,         ///< base * n
    Exponential     ///< base * 2^(n-1)
};

MIPROBE_API const char* BackoffModeName(BackoffMode mode);

struct MIPROBE_API AcquisitionParams {
    int32_t timeoutMs = DEFAULT_TIMEOUT_MS;             ///< Frame wait per exchange
    int32_t maxRetries = DEFAULT_MAX_RETRIES;           ///< Exchanges per request, first included
    BackoffMode backoff = BackoffMode::Linear;
    int32_t backoffBaseMs = DEFAULT_BACKOFF_BASE_MS;
    int32_t pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;  ///< Cancellation check granularity

    AcquisitionParams& SetTimeoutMs(int32_t t) { timeoutMs = t; return *this; }
    AcquisitionParams& SetMaxRetries(int32_t n) { maxRetries = n; return *this; }
    AcquisitionParams& SetBackoff(BackoffMode m) { backoff = m; return *this; }
    AcquisitionParams& SetBackoffBaseMs(int32_t b) { backoffBaseMs = b; return *this; }
    AcquisitionParams& SetPollIntervalMs(int32_t p) { pollIntervalMs = p; return *this; }

    /// @throws InvalidArgumentException on non-positive timeouts or retries
    void Validate() const;
};

/// Upper bound of a single backoff sleep
constexpr int32_t MAX_BACKOFF_MS = 600000;

/**
 * @brief Delay before the next exchange after failedAttempts failures
 *
 * Linear: base * n. Exponential: base * 2^(n-1), shift capped at 16.
 * Clamped to MAX_BACKOFF_MS.
 */
MIPROBE_API int32_t BackoffDelayMs(const AcquisitionParams& params, int32_t failedAttempts);

// =============================================================================
// Reading
// =============================================================================

struct MIPROBE_API Reading {
    int32_t pointId = 0;
    MeasurementRole role = MeasurementRole::Reference;
    double value = 0.0;
    std::string unit;
    Timestamp timestamp{};
    int32_t attempts = 0;       ///< Exchanges used, 1 = first try
};

/// Invoked on the worker thread after a reading has been stored
using ReadingCallback = std::function<void(const Reading&)>;

// =============================================================================
// AcquisitionProtocol
// =============================================================================

class MIPROBE_API AcquisitionProtocol {
public:
    /**
     * @param channel Open channel; ownership is taken
     * @param params Validated on construction
     * @throws InvalidArgumentException on null channel or invalid params
     */
    explicit AcquisitionProtocol(std::unique_ptr<Serial::SerialChannel> channel,
                                 const AcquisitionParams& params = AcquisitionParams());

    /**
     * @brief Cancels outstanding requests and joins the worker
     */
    ~AcquisitionProtocol();

    AcquisitionProtocol(const AcquisitionProtocol&) = delete;
    AcquisitionProtocol& operator=(const AcquisitionProtocol&) = delete;

    /**
     * @brief Queue an acquisition
     *
     * project must outlive the request. The future yields the stored Reading,
     * or rethrows AcquisitionException / ValidationException.
     *
     * @throws ValidationException if pointId is not in project (nothing queued)
     */
    std::future<Reading> Submit(Project& project, int32_t pointId, MeasurementRole role,
                                ReadingCallback onStored = nullptr);

    /// Submit(...).get()
    Reading Acquire(Project& project, int32_t pointId, MeasurementRole role);

    /**
     * @brief Cancel the in-flight request and everything queued before this call
     */
    void Cancel();

    /// Block until no request is queued or running
    void WaitIdle();

    /**
     * @brief Queued plus running requests
     *
     * A request stops counting before its future becomes ready.
     */
    size_t Pending() const;
    bool IsBusy() const { return Pending() > 0; }

    const AcquisitionParams& Params() const { return params_; }
    const Serial::SerialChannel& Channel() const { return *channel_; }

private:
    enum class ExchangeResult { Success, Failed, Cancelled };

    Reading Execute(Project& project, int32_t pointId, MeasurementRole role,
                    uint64_t ticket, const ReadingCallback& onStored);

    ExchangeResult Exchange(int32_t pointId, uint64_t ticket, Reading& reading,
                            AcquisitionFailure& failure, std::string& detail);

    bool IsCancelled(uint64_t ticket) const;

    /// @return false if cancelled while sleeping
    bool SleepUnlessCancelled(int32_t ms, uint64_t ticket);

    std::unique_ptr<Serial::SerialChannel> channel_;
    AcquisitionParams params_;

    std::mutex channelMutex_;
    std::atomic<uint64_t> nextTicket_{0};
    std::atomic<size_t> pending_{0};    // submitted, future not yet ready
    std::atomic<uint64_t> cancelledThrough_{0};
    std::mutex cancelMutex_;
    std::condition_variable cancelCondition_;

    // Declared last: destroyed (joined) before the channel
    Platform::TaskQueue queue_;
};

} // namespace Mi::Probe
