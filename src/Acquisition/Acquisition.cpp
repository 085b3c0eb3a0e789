#include <MiProbe/Acquisition/Acquisition.h>
#include <MiProbe/Platform/Log.h>
#include <MiProbe/Platform/Timer.h>
#include <MiProbe/Serial/FrameCodec.h>

#include <algorithm>
#include <chrono>

namespace Mi::Probe {

using Platform::Log;

namespace {

std::string RequestLabel(int32_t pointId, MeasurementRole role) {
    return "point #" + std::to_string(pointId) + " (" + RoleName(role) + ")";
}

struct PendingGuard {
    std::atomic<size_t>& count;
    ~PendingGuard() { --count; }
};

} // anonymous namespace

// =============================================================================
// Parameters
// =============================================================================

const char* BackoffModeName(BackoffMode mode) {
    return mode == BackoffMode::Linear ? "linear" : "exponential";
}

void AcquisitionParams::Validate() const {
    if (timeoutMs <= 0) {
        throw InvalidArgumentException("timeoutMs must be > 0, got " + std::to_string(timeoutMs));
    }
    if (maxRetries <= 0) {
        throw InvalidArgumentException("maxRetries must be > 0, got " + std::to_string(maxRetries));
    }
    if (backoffBaseMs < 0) {
        throw InvalidArgumentException("backoffBaseMs must be >= 0, got " +
                                       std::to_string(backoffBaseMs));
    }
    if (pollIntervalMs <= 0) {
        throw InvalidArgumentException("pollIntervalMs must be > 0, got " +
                                       std::to_string(pollIntervalMs));
    }
}

int32_t BackoffDelayMs(const AcquisitionParams& params, int32_t failedAttempts) {
    if (failedAttempts <= 0) {
        return 0;
    }
    int64_t delay = 0;
    if (params.backoff == BackoffMode::Linear) {
        delay = static_cast<int64_t>(params.backoffBaseMs) * failedAttempts;
    } else {
        int32_t shift = std::min(failedAttempts - 1, 16);
        delay = static_cast<int64_t>(params.backoffBaseMs) << shift;
    }
    return static_cast<int32_t>(std::min<int64_t>(delay, MAX_BACKOFF_MS));
}

// =============================================================================
// AcquisitionProtocol
// =============================================================================

AcquisitionProtocol::AcquisitionProtocol(std::unique_ptr<Serial::SerialChannel> channel,
                                         const AcquisitionParams& params)
    : channel_(std::move(channel))
    , params_(params)
    , queue_("acquisition") {
    if (!channel_) {
        throw InvalidArgumentException("AcquisitionProtocol: channel is null");
    }
    params_.Validate();
}

AcquisitionProtocol::~AcquisitionProtocol() {
    Cancel();
}

std::future<Reading> AcquisitionProtocol::Submit(Project& project, int32_t pointId,
                                                 MeasurementRole role,
                                                 ReadingCallback onStored) {
    if (!project.HasPoint(pointId)) {
        throw ValidationException("Submit: point #" + std::to_string(pointId) +
                                  " does not exist");
    }

    uint64_t ticket = ++nextTicket_;
    Log::Debug("Queued acquisition " + RequestLabel(pointId, role));

    ++pending_;
    try {
        return queue_.Submit([this, &project, pointId, role, ticket,
                              callback = std::move(onStored)]() {
            // Released before the future becomes ready
            PendingGuard guard{pending_};
            return Execute(project, pointId, role, ticket, callback);
        });
    } catch (const std::exception&) {
        --pending_;
        throw;
    }
}

Reading AcquisitionProtocol::Acquire(Project& project, int32_t pointId, MeasurementRole role) {
    return Submit(project, pointId, role).get();
}

void AcquisitionProtocol::Cancel() {
    {
        std::lock_guard<std::mutex> lock(cancelMutex_);
        cancelledThrough_ = nextTicket_.load();
    }
    cancelCondition_.notify_all();
}

void AcquisitionProtocol::WaitIdle() {
    queue_.WaitAll();
}

size_t AcquisitionProtocol::Pending() const {
    return pending_.load();
}

bool AcquisitionProtocol::IsCancelled(uint64_t ticket) const {
    return ticket <= cancelledThrough_.load();
}

bool AcquisitionProtocol::SleepUnlessCancelled(int32_t ms, uint64_t ticket) {
    std::unique_lock<std::mutex> lock(cancelMutex_);
    return !cancelCondition_.wait_for(lock, std::chrono::milliseconds(ms),
                                      [this, ticket]() { return IsCancelled(ticket); });
}

Reading AcquisitionProtocol::Execute(Project& project, int32_t pointId, MeasurementRole role,
                                     uint64_t ticket, const ReadingCallback& onStored) {
    const std::string label = RequestLabel(pointId, role);

    if (IsCancelled(ticket)) {
        Log::Info("Acquisition cancelled before start: " + label);
        throw AcquisitionException(AcquisitionFailure::Cancelled, label);
    }
    if (!project.HasPoint(pointId)) {
        throw ValidationException("Acquire: point #" + std::to_string(pointId) +
                                  " does not exist");
    }

    std::lock_guard<std::mutex> channelLock(channelMutex_);

    AcquisitionFailure lastFailure = AcquisitionFailure::Timeout;
    std::string lastDetail;

    for (int32_t attempt = 1; attempt <= params_.maxRetries; ++attempt) {
        Reading reading;
        ExchangeResult result = Exchange(pointId, ticket, reading, lastFailure, lastDetail);

        if (result == ExchangeResult::Cancelled) {
            Log::Info("Acquisition cancelled: " + label);
            throw AcquisitionException(AcquisitionFailure::Cancelled, label);
        }

        if (result == ExchangeResult::Success) {
            reading.role = role;
            reading.attempts = attempt;
            reading.timestamp = Now();
            project.SetMeasurement(pointId, role, reading.value, reading.unit, reading.timestamp);

            Log::Debug("Acquired " + label + ": " + std::to_string(reading.value) + " " +
                       reading.unit + " (attempt " + std::to_string(attempt) + ")");
            if (onStored) {
                onStored(reading);
            }
            return reading;
        }

        Log::Warning("Acquisition attempt " + std::to_string(attempt) + "/" +
                     std::to_string(params_.maxRetries) + " failed for " + label + ": " +
                     AcquisitionFailureName(lastFailure) + " (" + lastDetail + ")");

        if (attempt < params_.maxRetries &&
            !SleepUnlessCancelled(BackoffDelayMs(params_, attempt), ticket)) {
            Log::Info("Acquisition cancelled during backoff: " + label);
            throw AcquisitionException(AcquisitionFailure::Cancelled, label);
        }
    }

    Log::Error("Acquisition failed for " + label + " after " +
               std::to_string(params_.maxRetries) + " attempts: " +
               AcquisitionFailureName(lastFailure));
    throw AcquisitionException(lastFailure, label + " after " +
                               std::to_string(params_.maxRetries) + " attempts: " + lastDetail);
}

AcquisitionProtocol::ExchangeResult AcquisitionProtocol::Exchange(
    int32_t pointId, uint64_t ticket, Reading& reading,
    AcquisitionFailure& failure, std::string& detail) {

    channel_->Discard();

    try {
        channel_->Write(Serial::EncodeSelect(pointId));
    } catch (const IOException& e) {
        failure = AcquisitionFailure::DeviceNotResponding;
        detail = e.what();
        return ExchangeResult::Failed;
    }

    Serial::FrameAssembler assembler;
    Platform::Timer timer(true);

    while (true) {
        if (IsCancelled(ticket)) {
            return ExchangeResult::Cancelled;
        }

        int32_t remaining = timer.RemainingMs(params_.timeoutMs);
        if (remaining == 0) {
            failure = AcquisitionFailure::Timeout;
            detail = "no response within " + std::to_string(params_.timeoutMs) + " ms";
            return ExchangeResult::Failed;
        }

        std::string chunk;
        Serial::ReadStatus status;
        try {
            status = channel_->Read(chunk, std::min(remaining, params_.pollIntervalMs));
        } catch (const IOException& e) {
            failure = AcquisitionFailure::DeviceNotResponding;
            detail = e.what();
            return ExchangeResult::Failed;
        }
        if (status == Serial::ReadStatus::Timeout) {
            continue;
        }

        assembler.Append(chunk);
        while (auto raw = assembler.NextFrame()) {
            Serial::Frame frame;
            Serial::FrameStatus frameStatus = Serial::DecodeFrame(*raw, frame);

            if (frameStatus == Serial::FrameStatus::ChecksumMismatch) {
                failure = AcquisitionFailure::ChecksumMismatch;
                detail = "checksum mismatch";
                return ExchangeResult::Failed;
            }
            if (frameStatus == Serial::FrameStatus::Malformed) {
                failure = AcquisitionFailure::DeviceNotResponding;
                detail = "malformed frame";
                return ExchangeResult::Failed;
            }
            // Replies to abandoned requests may still arrive; skip them
            int32_t replyId = 0;
            if (frame.type == Serial::FRAME_ERROR) {
                std::string code;
                if (!Serial::ParseErrorFrame(frame, replyId, code)) {
                    failure = AcquisitionFailure::DeviceNotResponding;
                    detail = "malformed error frame";
                    return ExchangeResult::Failed;
                }
                if (replyId != 0 && replyId != pointId) {
                    Log::Debug("Discarding stale error frame for point #" +
                               std::to_string(replyId));
                    continue;
                }
                failure = AcquisitionFailure::DeviceNotResponding;
                detail = "device error " + code;
                return ExchangeResult::Failed;
            }
            if (Serial::ParseValueFrame(frame, replyId, reading.value, reading.unit)) {
                if (replyId != pointId) {
                    Log::Debug("Discarding stale reading for point #" +
                               std::to_string(replyId));
                    continue;
                }
                reading.pointId = pointId;
                return ExchangeResult::Success;
            }

            failure = AcquisitionFailure::DeviceNotResponding;
            detail = "unexpected frame '" + frame.type + "'";
            return ExchangeResult::Failed;
        }
    }
}

} // namespace Mi::Probe
