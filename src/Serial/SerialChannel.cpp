#include <MiProbe/Serial/SerialChannel.h>
#include <MiProbe/Core/Exception.h>
#include <MiProbe/Platform/Log.h>

#include <cerrno>
#include <cstring>

#ifdef _WIN32
// POSIX serial only
#else
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#endif

namespace Mi::Probe::Serial {

const char* ParityName(Parity parity) {
    switch (parity) {
        case Parity::None: return "none";
        case Parity::Odd:  return "odd";
        case Parity::Even: return "even";
    }
    return "unknown";
}

void SerialConfig::Validate() const {
    if (devicePath.empty()) {
        throw InvalidArgumentException("serial device path is empty");
    }
    if (baudRate <= 0) {
        throw InvalidArgumentException("baud rate must be > 0, got " + std::to_string(baudRate));
    }
    if (dataBits < 5 || dataBits > 8) {
        throw InvalidArgumentException("data bits must be in [5, 8], got " +
                                       std::to_string(dataBits));
    }
    if (stopBits != 1 && stopBits != 2) {
        throw InvalidArgumentException("stop bits must be 1 or 2, got " +
                                       std::to_string(stopBits));
    }
}

#ifdef _WIN32

std::unique_ptr<SerialChannel> OpenSerialChannel(const SerialConfig& config) {
    config.Validate();
    throw IOException("OpenSerialChannel: serial devices are not supported on this platform");
}

#else

namespace {

speed_t ToSpeed(int32_t baudRate) {
    switch (baudRate) {
        case 1200:   return B1200;
        case 2400:   return B2400;
        case 4800:   return B4800;
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
        default:
            throw InvalidArgumentException("unsupported baud rate " + std::to_string(baudRate));
    }
}

tcflag_t ToCharSize(int32_t dataBits) {
    switch (dataBits) {
        case 5:  return CS5;
        case 6:  return CS6;
        case 7:  return CS7;
        default: return CS8;
    }
}

std::string ErrnoText() {
    return std::strerror(errno);
}

/**
 * @brief termios-backed channel, raw mode, no flow control
 */
class PosixSerialChannel : public SerialChannel {
public:
    explicit PosixSerialChannel(const SerialConfig& config)
        : config_(config) {
        fd_ = ::open(config.devicePath.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            throw IOException("OpenSerialChannel: cannot open " + config.devicePath + ": " +
                              ErrnoText());
        }

        try {
            Configure();
        } catch (...) {
            ::close(fd_);
            fd_ = -1;
            throw;
        }

        Platform::Log::Info("Serial channel opened: " + Description());
    }

    ~PosixSerialChannel() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    PosixSerialChannel(const PosixSerialChannel&) = delete;
    PosixSerialChannel& operator=(const PosixSerialChannel&) = delete;

    void Write(const std::string& bytes) override {
        size_t written = 0;
        while (written < bytes.size()) {
            ssize_t n = ::write(fd_, bytes.data() + written, bytes.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    WaitWritable();
                    continue;
                }
                throw IOException("serial write failed: " + ErrnoText());
            }
            written += static_cast<size_t>(n);
        }
        if (::tcdrain(fd_) != 0) {
            throw IOException("serial drain failed: " + ErrnoText());
        }
    }

    ReadStatus Read(std::string& buffer, int32_t timeoutMs) override {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;

        int rc = ::poll(&pfd, 1, timeoutMs < 0 ? 0 : timeoutMs);
        if (rc < 0) {
            if (errno == EINTR) {
                return ReadStatus::Timeout;
            }
            throw IOException("serial poll failed: " + ErrnoText());
        }
        if (rc == 0) {
            return ReadStatus::Timeout;
        }
        if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
            throw IOException("serial device disconnected: " + config_.devicePath);
        }

        char chunk[256];
        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) {
                return ReadStatus::Timeout;
            }
            throw IOException("serial read failed: " + ErrnoText());
        }
        if (n == 0) {
            return ReadStatus::Timeout;
        }
        buffer.append(chunk, static_cast<size_t>(n));
        return ReadStatus::Data;
    }

    void Discard() override {
        if (::tcflush(fd_, TCIFLUSH) != 0) {
            Platform::Log::Warning("serial flush failed: " + ErrnoText());
        }
    }

    bool IsOpen() const override { return fd_ >= 0; }

    std::string Description() const override {
        char parity = config_.parity == Parity::None ? 'N'
                    : config_.parity == Parity::Odd  ? 'O' : 'E';
        return config_.devicePath + " @ " + std::to_string(config_.baudRate) + " " +
               std::to_string(config_.dataBits) + parity + std::to_string(config_.stopBits);
    }

private:
    void Configure() {
        termios tty{};
        if (::tcgetattr(fd_, &tty) != 0) {
            throw IOException("OpenSerialChannel: tcgetattr failed: " + ErrnoText());
        }

        ::cfmakeraw(&tty);
        speed_t speed = ToSpeed(config_.baudRate);
        ::cfsetispeed(&tty, speed);
        ::cfsetospeed(&tty, speed);

        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~CSIZE;
        tty.c_cflag |= ToCharSize(config_.dataBits);
        tty.c_cflag &= ~CRTSCTS;

        tty.c_cflag &= ~(PARENB | PARODD);
        if (config_.parity != Parity::None) {
            tty.c_cflag |= PARENB;
            if (config_.parity == Parity::Odd) {
                tty.c_cflag |= PARODD;
            }
        }

        if (config_.stopBits == 2) {
            tty.c_cflag |= CSTOPB;
        } else {
            tty.c_cflag &= ~CSTOPB;
        }

        // Non-blocking reads; waiting is done with poll()
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
            throw IOException("OpenSerialChannel: tcsetattr failed: " + ErrnoText());
        }
        ::tcflush(fd_, TCIOFLUSH);
    }

    void WaitWritable() {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLOUT;
        if (::poll(&pfd, 1, 1000) <= 0) {
            throw IOException("serial write timed out: " + config_.devicePath);
        }
    }

    SerialConfig config_;
    int fd_ = -1;
};

} // anonymous namespace

std::unique_ptr<SerialChannel> OpenSerialChannel(const SerialConfig& config) {
    config.Validate();
    return std::make_unique<PosixSerialChannel>(config);
}

#endif

} // namespace Mi::Probe::Serial
