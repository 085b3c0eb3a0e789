/**
 * @file FileIO.cpp
 * @brief File I/O implementation
 */

#include <MiProbe/Platform/FileIO.h>

#include <algorithm>
#include <cstdio>
#include <fstream>

namespace Mi::Probe::Platform {

// ============================================================================
// Binary File I/O
// ============================================================================

bool ReadBinaryFile(const std::string& path, std::vector<uint8_t>& data) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }

    std::streamsize size = file.tellg();
    if (size <= 0) {
        data.clear();
        return true;
    }

    file.seekg(0, std::ios::beg);
    data.resize(static_cast<size_t>(size));

    if (!file.read(reinterpret_cast<char*>(data.data()), size)) {
        return false;
    }

    return true;
}

bool WriteBinaryFile(const std::string& path, const std::vector<uint8_t>& data) {
    std::ofstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }

    if (!data.empty()) {
        file.write(reinterpret_cast<const char*>(data.data()),
                   static_cast<std::streamsize>(data.size()));
    }

    file.flush();
    return file.good();
}

bool WriteBinaryFileAtomic(const std::string& path, const std::vector<uint8_t>& data) {
    const std::string tempPath = path + ".tmp";

    if (!WriteBinaryFile(tempPath, data)) {
        std::remove(tempPath.c_str());
        return false;
    }

#ifdef _WIN32
    // rename() does not replace an existing file on Windows
    std::remove(path.c_str());
#endif
    if (std::rename(tempPath.c_str(), path.c_str()) != 0) {
        std::remove(tempPath.c_str());
        return false;
    }
    return true;
}

// ============================================================================
// Text File I/O
// ============================================================================

bool WriteTextFile(const std::string& path, const std::string& content) {
    std::ofstream file(path);
    if (!file.is_open()) {
        return false;
    }

    file << content;
    return file.good();
}

std::string TrimString(const std::string& str) {
    const char* whitespace = " \t\r\n";
    size_t start = str.find_first_not_of(whitespace);
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

bool ReadTextLines(const std::string& path, std::vector<std::string>& lines,
                   bool trimLines) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    lines.clear();
    std::string line;
    while (std::getline(file, line)) {
        if (trimLines) {
            lines.push_back(TrimString(line));
        } else {
            lines.push_back(line);
        }
    }

    return true;
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::WriteString(const std::string& str) {
    Write<uint64_t>(str.size());
    WriteBytes(str.data(), str.size());
}

void ByteWriter::WriteBytes(const void* data, size_t size) {
    if (size > 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        buffer_.insert(buffer_.end(), bytes, bytes + size);
    }
}

// ============================================================================
// ByteReader
// ============================================================================

bool ByteReader::Take(size_t size) {
    if (overrun_ || size > size_ - pos_) {
        overrun_ = true;
        return false;
    }
    pos_ += size;
    return true;
}

std::string ByteReader::ReadString() {
    uint64_t len = Read<uint64_t>();
    if (overrun_ || len > Remaining()) {
        overrun_ = true;
        return "";
    }
    if (len == 0) return "";

    std::string str(reinterpret_cast<const char*>(data_ + pos_), static_cast<size_t>(len));
    pos_ += static_cast<size_t>(len);
    return str;
}

void ByteReader::ReadBytes(void* data, size_t size) {
    if (size > 0 && Take(size)) {
        std::memcpy(data, data_ + pos_ - size, size);
    }
}

std::vector<uint8_t> ByteReader::ReadBlock(size_t size) {
    if (!Take(size)) {
        return {};
    }
    return std::vector<uint8_t>(data_ + pos_ - size, data_ + pos_);
}

} // namespace Mi::Probe::Platform
