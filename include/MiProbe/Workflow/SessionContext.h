#pragma once

/**
 * @file SessionContext.h
 * @brief Per-session dependencies handed to WorkflowController
 *
 * Built once at startup and passed by reference; there is no global
 * application state.
 */

#include <MiProbe/Config/Settings.h>
#include <MiProbe/Core/Export.h>
#include <MiProbe/Serial/SerialChannel.h>

#include <functional>
#include <memory>

namespace Mi::Probe {

/// Opens the meter channel when measurement starts
using ChannelFactory =
    std::function<std::unique_ptr<Serial::SerialChannel>(const Serial::SerialConfig&)>;

class MIPROBE_API SessionContext {
public:
    /**
     * @param settings Validated session settings
     * @param channelFactory Defaults to Serial::OpenSerialChannel
     * @throws InvalidArgumentException if settings are invalid
     */
    explicit SessionContext(const Settings& settings = Settings(),
                            ChannelFactory channelFactory = nullptr);

    const Settings& GetSettings() const { return settings_; }

    /**
     * @brief Open the meter channel described by GetSettings().serial
     * @throws IOException if the channel cannot be opened
     */
    std::unique_ptr<Serial::SerialChannel> OpenChannel() const;

private:
    Settings settings_;
    ChannelFactory channelFactory_;
};

} // namespace Mi::Probe
