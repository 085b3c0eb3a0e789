#include <MiProbe/Workflow/SessionContext.h>
#include <MiProbe/Core/Exception.h>

namespace Mi::Probe {

SessionContext::SessionContext(const Settings& settings, ChannelFactory channelFactory)
    : settings_(settings)
    , channelFactory_(std::move(channelFactory)) {
    settings_.Validate();
    if (!channelFactory_) {
        channelFactory_ = [](const Serial::SerialConfig& config) {
            return Serial::OpenSerialChannel(config);
        };
    }
}

std::unique_ptr<Serial::SerialChannel> SessionContext::OpenChannel() const {
    std::unique_ptr<Serial::SerialChannel> channel = channelFactory_(settings_.serial);
    if (!channel) {
        throw IOException("OpenChannel: channel factory returned no channel for " +
                          settings_.serial.devicePath);
    }
    return channel;
}

} // namespace Mi::Probe
