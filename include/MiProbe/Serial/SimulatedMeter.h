#pragma once

/**
 * @file SimulatedMeter.h
 * @brief In-process multimeter speaking the frame protocol
 *
 * Each point gets a stable nominal value (baseValue +/- spread, drawn once per
 * point id) and every reading adds uniform noise, so reference and test
 * readings of the same point normally agree within a few percent. Offsets and
 * injected faults make divergence and failure paths reproducible.
 */

#include <MiProbe/Core/Export.h>
#include <MiProbe/Serial/FrameCodec.h>
#include <MiProbe/Serial/SerialChannel.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <random>
#include <string>

namespace Mi::Probe::Serial {

struct MIPROBE_API SimulatedMeterParams {
    double baseValue = 10.0;
    double spread = 2.0;            ///< Per-point nominal deviation (uniform +/-)
    double noise = 0.05;            ///< Per-reading deviation (uniform +/-)
    std::string unit = "V";
    int32_t responseDelayMs = 0;    ///< Delay before a response becomes readable
    uint64_t seed = 5489;

    SimulatedMeterParams& SetBaseValue(double v) { baseValue = v; return *this; }
    SimulatedMeterParams& SetSpread(double s) { spread = s; return *this; }
    SimulatedMeterParams& SetNoise(double n) { noise = n; return *this; }
    SimulatedMeterParams& SetUnit(const std::string& u) { unit = u; return *this; }
    SimulatedMeterParams& SetResponseDelayMs(int32_t d) { responseDelayMs = d; return *this; }
    SimulatedMeterParams& SetSeed(uint64_t s) { seed = s; return *this; }
};

/**
 * @brief Fault applied to the next responses
 */
enum class SimulatedFault {
    Silent,             ///< No response (timeout)
    BadChecksum,        ///< Response with corrupted checksum
    DeviceError         ///< $ERR frame
};

class MIPROBE_API SimulatedMeter : public SerialChannel {
public:
    explicit SimulatedMeter(const SimulatedMeterParams& params = SimulatedMeterParams());

    void Write(const std::string& bytes) override;
    ReadStatus Read(std::string& buffer, int32_t timeoutMs) override;
    void Discard() override;
    bool IsOpen() const override { return true; }
    std::string Description() const override { return "simulated meter"; }

    /// Add delta to every later reading of pointId (simulates a faulty board)
    void SetOffset(int32_t pointId, double delta);

    /// Apply fault to the next count requests
    void InjectFault(SimulatedFault fault, int32_t count = 1);

    /// Number of select requests received
    int32_t RequestCount() const;

private:
    double NominalValue(int32_t pointId);

    SimulatedMeterParams params_;
    mutable std::mutex mutex_;
    std::mt19937_64 gen_;
    std::map<int32_t, double> nominal_;
    std::map<int32_t, double> offsets_;
    std::deque<SimulatedFault> faults_;
    FrameAssembler input_;
    std::string output_;
    std::chrono::steady_clock::time_point readyAt_;
    int32_t requests_ = 0;
};

} // namespace Mi::Probe::Serial
