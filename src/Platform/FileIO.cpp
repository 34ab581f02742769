/**
 * @file FileIO.cpp
 * @brief File I/O implementation
 */

#include <VisMatch/Platform/FileIO.h>
#include <VisMatch/Core/Exception.h>

#include <cstdio>
#include <fstream>

// Platform-specific includes
#ifdef _WIN32
#include <direct.h>
#include <io.h>
#define ACCESS _access
#define MKDIR(path) _mkdir(path)
#else
#include <sys/stat.h>
#include <unistd.h>
#define ACCESS access
#define MKDIR(path) mkdir(path, 0755)
#endif

namespace Vis::Match::Platform {

namespace {

bool DirectoryExists(const std::string& path) {
    if (path.empty()) return false;

#ifdef _WIN32
    struct _stat info;
    if (_stat(path.c_str(), &info) != 0) return false;
    return (info.st_mode & _S_IFDIR) != 0;
#else
    struct stat info;
    if (stat(path.c_str(), &info) != 0) return false;
    return S_ISDIR(info.st_mode);
#endif
}

// Path without its last component
std::string ParentDirectory(const std::string& path) {
    size_t pos = path.find_last_of("/\\");
    if (pos == std::string::npos) {
        return "";
    }
    return path.substr(0, pos);
}

} // anonymous namespace

// ============================================================================
// Path Utilities
// ============================================================================

bool FileExists(const std::string& path) {
    if (path.empty()) return false;
    return ACCESS(path.c_str(), 0) == 0;
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (name.empty()) return dir;

    char lastChar = dir.back();
    if (lastChar == '/' || lastChar == '\\') {
        return dir + name;
    }

#ifdef _WIN32
    return dir + "\\" + name;
#else
    return dir + "/" + name;
#endif
}

bool CreateDirectory(const std::string& path) {
    if (path.empty()) return false;
    if (DirectoryExists(path)) return true;

    // Create parent directories first
    std::string parent = ParentDirectory(path);
    if (!parent.empty() && !DirectoryExists(parent)) {
        if (!CreateDirectory(parent)) {
            return false;
        }
    }

    return MKDIR(path.c_str()) == 0;
}

bool DeleteFile(const std::string& path) {
    if (!FileExists(path)) return true;
    return std::remove(path.c_str()) == 0;
}

// ============================================================================
// Binary File I/O
// ============================================================================

bool ReadBinaryFile(const std::string& path, std::string& data) {
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

    if (!file.read(&data[0], size)) {
        return false;
    }

    return true;
}

bool WriteBinaryFile(const std::string& path, const void* data, size_t size) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    if (size > 0) {
        file.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
    }

    file.flush();
    return file.good();
}

// ============================================================================
// ByteWriter
// ============================================================================

void ByteWriter::WriteString(const std::string& str) {
    uint64_t len = str.size();
    Write(len);
    WriteBytes(str.data(), str.size());
}

void ByteWriter::WriteBytes(const void* data, size_t size) {
    if (size > 0) {
        buffer_.append(static_cast<const char*>(data), size);
    }
}

// ============================================================================
// ByteReader
// ============================================================================

void ByteReader::Require(size_t size) const {
    if (size > Remaining()) {
        throw IOException("truncated data: need " + std::to_string(size) +
                          " bytes, " + std::to_string(Remaining()) + " left");
    }
}

std::string ByteReader::ReadString() {
    uint64_t len = Read<uint64_t>();
    Require(static_cast<size_t>(len));
    std::string str = buffer_.substr(pos_, static_cast<size_t>(len));
    pos_ += static_cast<size_t>(len);
    return str;
}

void ByteReader::ReadBytes(void* data, size_t size) {
    if (size == 0) return;
    Require(size);
    std::memcpy(data, buffer_.data() + pos_, size);
    pos_ += size;
}

} // namespace Vis::Match::Platform
