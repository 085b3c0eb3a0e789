#include <MiProbe/Serial/FrameCodec.h>
#include <MiProbe/Platform/Checksum.h>

#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace Mi::Probe::Serial {

namespace {

// "$" + "*XX" + "\r\n"
constexpr size_t FRAME_OVERHEAD = 6;

int HexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::vector<std::string> Split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

bool ParseId(const std::string& text, int32_t minId, int32_t& id) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = std::strtol(text.c_str(), &end, 10);
    if (*end != '\0' || errno == ERANGE || parsed < minId || parsed > INT32_MAX) {
        return false;
    }
    id = static_cast<int32_t>(parsed);
    return true;
}

} // anonymous namespace

const char* FrameStatusName(FrameStatus status) {
    switch (status) {
        case FrameStatus::Ok:               return "ok";
        case FrameStatus::ChecksumMismatch: return "checksum mismatch";
        case FrameStatus::Malformed:        return "malformed";
    }
    return "unknown";
}

// =============================================================================
// Encoding
// =============================================================================

std::string EncodeFrame(const std::string& payload) {
    char checksum[3];
    std::snprintf(checksum, sizeof(checksum), "%02X", Platform::XorChecksum(payload));
    return "$" + payload + "*" + checksum + "\r\n";
}

std::string EncodeSelect(int32_t pointId) {
    return EncodeFrame(std::string(FRAME_SELECT) + "," + std::to_string(pointId));
}

std::string EncodeValue(int32_t pointId, double value, const std::string& unit) {
    char number[32];
    std::snprintf(number, sizeof(number), "%.6g", value);
    return EncodeFrame(std::string(FRAME_VALUE) + "," + std::to_string(pointId) + "," +
                       number + "," + unit);
}

std::string EncodeError(int32_t pointId, const std::string& code) {
    return EncodeFrame(std::string(FRAME_ERROR) + "," + std::to_string(pointId) + "," + code);
}

// =============================================================================
// Decoding
// =============================================================================

FrameStatus DecodeFrame(const std::string& raw, Frame& frame) {
    if (raw.size() > MAX_FRAME_LENGTH || raw.size() < FRAME_OVERHEAD) {
        return FrameStatus::Malformed;
    }
    if (raw.front() != '$' || raw.compare(raw.size() - 2, 2, "\r\n") != 0) {
        return FrameStatus::Malformed;
    }

    size_t star = raw.size() - 5;
    if (raw[star] != '*') {
        return FrameStatus::Malformed;
    }

    int hi = HexDigit(raw[star + 1]);
    int lo = HexDigit(raw[star + 2]);
    if (hi < 0 || lo < 0) {
        return FrameStatus::Malformed;
    }

    std::string payload = raw.substr(1, star - 1);
    if (payload.find_first_of("$*\r\n") != std::string::npos) {
        return FrameStatus::Malformed;
    }

    if (Platform::XorChecksum(payload) != static_cast<uint8_t>(hi * 16 + lo)) {
        return FrameStatus::ChecksumMismatch;
    }

    std::vector<std::string> parts = Split(payload, ',');
    if (parts.front().empty()) {
        return FrameStatus::Malformed;
    }

    frame.type = parts.front();
    frame.fields.assign(parts.begin() + 1, parts.end());
    return FrameStatus::Ok;
}

bool ParseValueFrame(const Frame& frame, int32_t& pointId, double& value,
                     std::string& unit) {
    if (frame.type != FRAME_VALUE || frame.fields.size() != 3 || frame.fields[1].empty()) {
        return false;
    }

    int32_t id = 0;
    if (!ParseId(frame.fields[0], 1, id)) {
        return false;
    }

    const char* text = frame.fields[1].c_str();
    char* end = nullptr;
    errno = 0;
    double parsed = std::strtod(text, &end);
    if (end == text || *end != '\0' || errno == ERANGE || !std::isfinite(parsed)) {
        return false;
    }

    pointId = id;
    value = parsed;
    unit = frame.fields[2];
    return true;
}

bool ParseErrorFrame(const Frame& frame, int32_t& pointId, std::string& code) {
    if (frame.type != FRAME_ERROR || frame.fields.size() != 2 || frame.fields[1].empty()) {
        return false;
    }
    if (!ParseId(frame.fields[0], 0, pointId)) {
        return false;
    }
    code = frame.fields[1];
    return true;
}

bool ParseSelectFrame(const Frame& frame, int32_t& pointId) {
    if (frame.type != FRAME_SELECT || frame.fields.size() != 1) {
        return false;
    }
    return ParseId(frame.fields[0], 1, pointId);
}

// =============================================================================
// FrameAssembler
// =============================================================================

void FrameAssembler::Append(const std::string& bytes) {
    buffer_ += bytes;
}

std::optional<std::string> FrameAssembler::NextFrame() {
    if (skipLine_) {
        size_t newline = buffer_.find('\n');
        if (newline == std::string::npos) {
            buffer_.clear();
            return std::nullopt;
        }
        buffer_.erase(0, newline + 1);
        skipLine_ = false;
    }

    size_t start = buffer_.find('$');
    if (start == std::string::npos) {
        buffer_.clear();
        return std::nullopt;
    }
    buffer_.erase(0, start);

    size_t end = buffer_.find("\r\n");
    if (end != std::string::npos) {
        std::string frame = buffer_.substr(0, end + 2);
        buffer_.erase(0, end + 2);
        return frame;
    }

    if (buffer_.size() > MAX_FRAME_LENGTH) {
        std::string frame = buffer_.substr(0, MAX_FRAME_LENGTH + 1);
        buffer_.erase(0, MAX_FRAME_LENGTH + 1);
        skipLine_ = true;
        return frame;
    }
    return std::nullopt;
}

void FrameAssembler::Reset() {
    buffer_.clear();
    skipLine_ = false;
}

} // namespace Mi::Probe::Serial
