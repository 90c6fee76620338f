// ==============================================================================
// platform.cpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
// ADR-0010: std::filesystem::path + явные преобразования path <-> UTF-8
// GUIDE-0001 G-010: платформенная специфика изолирована здесь
//
// ==============================================================================

#include "luarestore/platform.hpp"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace luarestore::platform {

namespace {

bool is_tty(FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Преобразования путей (ADR-0010)
// ----------------------------------------------------------------------------

// u8path/u8string в C++17 возвращают UTF-8 без ручной перекодировки
std::filesystem::path path_from_utf8(std::string_view u8str) {
    return std::filesystem::u8path(u8str.begin(), u8str.end());
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.u8string();
}

std::string path_key(const std::filesystem::path& p) {
    // generic-форма: '/' на всех платформах, ключи сравниваются побайтово
    return p.generic_u8string();
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
    return is_tty(stdout);
}

bool is_tty_stderr() {
    return is_tty(stderr);
}

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

std::vector<std::filesystem::path> default_lua_roots() {
#ifdef _WIN32
    return {"lua", "C:\\lua", "C:\\Program Files\\lua"};
#elif defined(__APPLE__)
    return {"lua", "/usr/local/lib/lua", "/opt/lua", "/usr/lib/lua"};
#else
    return {"lua", "/usr/lib/lua", "/usr/local/lib/lua", "/opt/lua"};
#endif
}

}  // namespace luarestore::platform
