// ==============================================================================
// luarestore/platform.hpp - MOD-0004: Платформенные абстракции
// ==============================================================================
//
// MOD-0004 platform
// ADR-0010: std::filesystem::path + явные преобразования path <-> UTF-8
// GUIDE-0001 G-010: платформенная специфика изолирована здесь
//
// Назначение:
// - Преобразования path <-> UTF-8
// - Ключи узлов графа (канонический путь в generic-форме)
// - TTY detection для цветного вывода
// - Пути поиска Lua-модулей по умолчанию
//
// ==============================================================================

#ifndef LUARESTORE_PLATFORM_HPP
#define LUARESTORE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace luarestore::platform {

// ----------------------------------------------------------------------------
// Преобразования путей (ADR-0010)
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка (native разделители)
std::string path_to_utf8(const std::filesystem::path& p);

/// Ключ узла графа: UTF-8, разделители '/' на всех платформах.
/// Путь должен быть уже канонизирован вызывающей стороной.
std::string path_key(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Информация о платформе
// ----------------------------------------------------------------------------

/// "Windows", "Linux", "macOS" или "Unknown"
std::string os_name();

/// Корни поиска Lua-модулей, если конфигурация их не задаёт.
/// Первый элемент всегда относительный каталог "lua".
std::vector<std::filesystem::path> default_lua_roots();

}  // namespace luarestore::platform

#endif  // LUARESTORE_PLATFORM_HPP
