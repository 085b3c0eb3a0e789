#include <MiProbe/Serial/SimulatedMeter.h>
#include <MiProbe/Platform/Timer.h>

#include <algorithm>

namespace Mi::Probe::Serial {

namespace {

constexpr int32_t READ_SLICE_MS = 5;

} // anonymous namespace

SimulatedMeter::SimulatedMeter(const SimulatedMeterParams& params)
    : params_(params)
    , gen_(params.seed) {}

void SimulatedMeter::Write(const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    input_.Append(bytes);

    while (auto raw = input_.NextFrame()) {
        Frame frame;
        int32_t pointId = 0;
        if (DecodeFrame(*raw, frame) != FrameStatus::Ok || !ParseSelectFrame(frame, pointId)) {
            output_ += EncodeError(0, "E01");
            continue;
        }
        ++requests_;
        readyAt_ = std::chrono::steady_clock::now() +
                   std::chrono::milliseconds(std::max(params_.responseDelayMs, 0));

        if (!faults_.empty()) {
            SimulatedFault fault = faults_.front();
            faults_.pop_front();

            if (fault == SimulatedFault::Silent) {
                continue;
            }
            if (fault == SimulatedFault::DeviceError) {
                output_ += EncodeError(pointId, "E02");
                continue;
            }

            // BadChecksum: flip the low checksum digit
            std::string response = EncodeValue(pointId, NominalValue(pointId), params_.unit);
            size_t star = response.rfind('*');
            response[star + 2] = response[star + 2] == '0' ? '1' : '0';
            output_ += response;
            continue;
        }

        double value = NominalValue(pointId);
        if (params_.noise > 0.0) {
            std::uniform_real_distribution<double> noise(-params_.noise, params_.noise);
            value += noise(gen_);
        }
        auto offset = offsets_.find(pointId);
        if (offset != offsets_.end()) {
            value += offset->second;
        }
        output_ += EncodeValue(pointId, value, params_.unit);
    }
}

ReadStatus SimulatedMeter::Read(std::string& buffer, int32_t timeoutMs) {
    Platform::Timer timer(true);
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!output_.empty() && std::chrono::steady_clock::now() >= readyAt_) {
                buffer += output_;
                output_.clear();
                return ReadStatus::Data;
            }
        }

        int32_t remaining = timer.RemainingMs(timeoutMs);
        if (remaining == 0) {
            return ReadStatus::Timeout;
        }
        Platform::SleepMs(std::min(remaining, READ_SLICE_MS));
    }
}

void SimulatedMeter::Discard() {
    std::lock_guard<std::mutex> lock(mutex_);
    output_.clear();
}

void SimulatedMeter::SetOffset(int32_t pointId, double delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    offsets_[pointId] = delta;
}

void SimulatedMeter::InjectFault(SimulatedFault fault, int32_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int32_t i = 0; i < count; ++i) {
        faults_.push_back(fault);
    }
}

int32_t SimulatedMeter::RequestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

double SimulatedMeter::NominalValue(int32_t pointId) {
    auto it = nominal_.find(pointId);
    if (it != nominal_.end()) {
        return it->second;
    }

    double value = params_.baseValue;
    if (params_.spread > 0.0) {
        std::uniform_real_distribution<double> spread(-params_.spread, params_.spread);
        value += spread(gen_);
    }
    nominal_.emplace(pointId, value);
    return value;
}

} // namespace Mi::Probe::Serial
