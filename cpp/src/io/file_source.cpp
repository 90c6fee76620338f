// ==============================================================================
// file_source.cpp - MOD-0005: Источник файлов
// ==============================================================================
//
// MOD-0005 io::file_source
// ADR-0010: std::filesystem::path
//
// ==============================================================================

#include "luarestore/file_source.hpp"

#include "luarestore/platform.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

namespace luarestore::io {

namespace {

constexpr std::size_t READ_CHUNK = 64 * 1024;

ReadResult fail(ReadErrorKind kind, std::string message, const std::filesystem::path& path) {
    ReadResult result;
    result.ok = false;
    result.error.kind = kind;
    result.error.message = std::move(message);
    result.error.path = platform::path_to_utf8(path);
    return result;
}

ReadErrorKind kind_from_errno(int err) {
    switch (err) {
    case ENOENT:
    case ENOTDIR:
        return ReadErrorKind::FileNotFound;
    case EACCES:
    case EPERM:
        return ReadErrorKind::PermissionDenied;
    default:
        return ReadErrorKind::IoError;
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// ReadError
// ----------------------------------------------------------------------------

const char* read_error_kind_to_string(ReadErrorKind kind) {
    switch (kind) {
    case ReadErrorKind::FileNotFound:
        return "file not found";
    case ReadErrorKind::PermissionDenied:
        return "permission denied";
    case ReadErrorKind::Timeout:
        return "read timed out";
    case ReadErrorKind::IoError:
    default:
        return "I/O error";
    }
}

std::string ReadError::format() const {
    return "failed to read file '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// DiskFileSource
// ----------------------------------------------------------------------------

DiskFileSource::DiskFileSource(std::chrono::milliseconds read_timeout)
    : read_timeout_(read_timeout) {}

bool DiskFileSource::is_regular_file(const std::filesystem::path& path) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

std::filesystem::path DiskFileSource::canonical(const std::filesystem::path& path) const {
    std::error_code ec;
    auto result = std::filesystem::canonical(path, ec);
    if (ec) {
        return {};
    }
    return result;
}

ReadResult DiskFileSource::read(const std::filesystem::path& path) const {
    const auto started = std::chrono::steady_clock::now();

#ifdef _WIN32
    FILE* f = _wfopen(path.c_str(), L"rb");
#else
    FILE* f = std::fopen(platform::path_to_utf8(path).c_str(), "rb");
#endif
    if (f == nullptr) {
        int err = errno;
        return fail(kind_from_errno(err), std::strerror(err), path);
    }

    ReadResult result;
    std::array<char, READ_CHUNK> chunk{};
    while (true) {
        std::size_t n = std::fread(chunk.data(), 1, chunk.size(), f);
        result.content.append(chunk.data(), n);

        if (n < chunk.size() && std::ferror(f) != 0) {
            std::fclose(f);
            return fail(ReadErrorKind::IoError, "read failed", path);
        }

        // Срок проверяется после каждого блока, включая последний:
        // просроченное чтение не отдаётся даже для короткого файла
        if (std::chrono::steady_clock::now() - started >= read_timeout_) {
            std::fclose(f);
            return fail(ReadErrorKind::Timeout,
                        "read exceeded " + std::to_string(read_timeout_.count()) + " ms", path);
        }
        if (n < chunk.size()) {
            break;
        }
    }
    std::fclose(f);

    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// MemoryFileSource
// ----------------------------------------------------------------------------

std::filesystem::path MemoryFileSource::normalize(const std::filesystem::path& path) {
    std::filesystem::path p = path.lexically_normal();
    if (p.is_relative()) {
        p = (std::filesystem::path("/") / p).lexically_normal();
    }
    return p;
}

void MemoryFileSource::add_file(const std::filesystem::path& path, std::string content) {
    auto key = normalize(path);
    unreadable_.erase(key);
    files_[key] = std::move(content);
}

void MemoryFileSource::add_unreadable(const std::filesystem::path& path, ReadErrorKind kind) {
    auto key = normalize(path);
    files_.erase(key);
    unreadable_[key] = kind;
}

bool MemoryFileSource::is_regular_file(const std::filesystem::path& path) const {
    auto key = normalize(path);
    return files_.count(key) > 0 || unreadable_.count(key) > 0;
}

std::filesystem::path MemoryFileSource::canonical(const std::filesystem::path& path) const {
    if (!is_regular_file(path)) {
        return {};
    }
    return normalize(path);
}

ReadResult MemoryFileSource::read(const std::filesystem::path& path) const {
    ++reads_;
    auto key = normalize(path);

    auto bad = unreadable_.find(key);
    if (bad != unreadable_.end()) {
        return fail(bad->second, read_error_kind_to_string(bad->second), path);
    }

    auto it = files_.find(key);
    if (it == files_.end()) {
        return fail(ReadErrorKind::FileNotFound, "no such file", path);
    }

    ReadResult result;
    result.ok = true;
    result.content = it->second;
    return result;
}

std::size_t MemoryFileSource::read_count() const {
    return reads_.load();
}

}  // namespace luarestore::io
