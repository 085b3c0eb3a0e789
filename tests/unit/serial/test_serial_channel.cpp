/**
 * @file test_serial_channel.cpp
 * @brief termios channel exercised over a pseudo-terminal
 */

#include <MiProbe/Core/Exception.h>
#include <MiProbe/Serial/FrameCodec.h>
#include <MiProbe/Serial/SerialChannel.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <memory>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

using namespace Mi::Probe;
using namespace Mi::Probe::Serial;

class PtyChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (master_ < 0 || ::grantpt(master_) != 0 || ::unlockpt(master_) != 0) {
            GTEST_SKIP() << "pseudo-terminals unavailable";
        }
        const char* name = ::ptsname(master_);
        if (!name) {
            GTEST_SKIP() << "ptsname failed";
        }
        slavePath_ = name;
    }

    void TearDown() override {
        channel_.reset();
        if (master_ >= 0) {
            ::close(master_);
        }
    }

    std::string ReadMaster(size_t expected, int timeoutMs = 500) {
        std::string out;
        while (out.size() < expected) {
            pollfd pfd{};
            pfd.fd = master_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, timeoutMs) <= 0) {
                break;
            }
            char chunk[128];
            ssize_t n = ::read(master_, chunk, sizeof(chunk));
            if (n <= 0) {
                break;
            }
            out.append(chunk, static_cast<size_t>(n));
        }
        return out;
    }

    int master_ = -1;
    std::string slavePath_;
    std::unique_ptr<SerialChannel> channel_;
};

TEST_F(PtyChannelTest, OpenDescribesLine) {
    channel_ = OpenSerialChannel(SerialConfig().SetDevicePath(slavePath_).SetBaudRate(19200));
    EXPECT_TRUE(channel_->IsOpen());
    EXPECT_EQ(channel_->Description(), slavePath_ + " @ 19200 8N1");
}

TEST_F(PtyChannelTest, WriteReachesDevice) {
    channel_ = OpenSerialChannel(SerialConfig().SetDevicePath(slavePath_));
    std::string request = EncodeSelect(7);
    channel_->Write(request);
    EXPECT_EQ(ReadMaster(request.size()), request);
}

TEST_F(PtyChannelTest, ReadAppendsDeviceBytes) {
    channel_ = OpenSerialChannel(SerialConfig().SetDevicePath(slavePath_));
    std::string response = EncodeValue(7, 10.4, "V");
    ASSERT_EQ(::write(master_, response.data(), response.size()),
              static_cast<ssize_t>(response.size()));

    std::string buffer = "prefix:";
    std::string received;
    for (int i = 0; i < 10 && received.size() < response.size(); ++i) {
        std::string chunk;
        if (channel_->Read(chunk, 100) == ReadStatus::Data) {
            received += chunk;
        }
    }
    EXPECT_EQ(received, response);

    ASSERT_EQ(channel_->Read(buffer, 10), ReadStatus::Timeout);
    EXPECT_EQ(buffer, "prefix:");
}

TEST_F(PtyChannelTest, UnsupportedBaudRate) {
    EXPECT_THROW(OpenSerialChannel(SerialConfig().SetDevicePath(slavePath_).SetBaudRate(12345)),
                 InvalidArgumentException);
}
