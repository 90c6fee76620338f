// ==============================================================================
// luarestore/config.hpp - MOD-0008: Конфигурация (YAML)
// ==============================================================================
//
// MOD-0008 config
// ADR-0004: yaml-cpp для YAML
// ADR-0010: std::filesystem::path
//
// Назначение:
// - Загрузка YAML-конфигурации прогона
// - Нормализация путей относительно каталога конфигурации
// - Значения по умолчанию (корни поиска, расширения, таймаут, воркеры)
//
// Неизвестные ключи игнорируются: в том же файле лежат настройки
// внешнего сервиса восстановления кода.
//
// ==============================================================================

#ifndef LUARESTORE_CONFIG_HPP
#define LUARESTORE_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace luarestore::config {

// ----------------------------------------------------------------------------
// Значения по умолчанию
// ----------------------------------------------------------------------------

constexpr std::chrono::milliseconds DEFAULT_READ_TIMEOUT{5000};
constexpr const char* DEFAULT_EXTENSION = ".lua";

/// Верхняя граница workers: один поток на элемент пакета
constexpr std::size_t MAX_WORKERS = 64;

// ----------------------------------------------------------------------------
// Config - параметры одного прогона
// ----------------------------------------------------------------------------

struct Config {
    /// Стартовый файл (может быть переопределён из командной строки)
    std::optional<std::filesystem::path> start_file;

    /// Корни поиска модулей в порядке приоритета
    std::vector<std::filesystem::path> search_roots;

    /// Расширения в порядке приоритета, с ведущей точкой (".lua.unluac", ".lua")
    std::vector<std::string> extensions{DEFAULT_EXTENSION};

    /// Ограничение времени чтения одного файла
    std::chrono::milliseconds read_timeout = DEFAULT_READ_TIMEOUT;

    /// Число параллельных читателей, 1..MAX_WORKERS
    std::size_t workers = 1;

    /// Максимальная глубина раскрытия от корня; nullopt - без ограничения
    std::optional<std::size_t> max_depth;

    /// Файл журнала
    std::optional<std::filesystem::path> log_file;

    /// Куда писать JSON-план; nullopt - stdout
    std::optional<std::filesystem::path> plan_output;

    int verbose = 0;
    bool quiet = false;
};

// ----------------------------------------------------------------------------
// ConfigError
// ----------------------------------------------------------------------------

enum class ConfigErrorKind {
    FileNotFound,  // Файл конфигурации не открывается
    ParseError,    // Синтаксическая ошибка YAML
    InvalidValue,  // Значение неверного типа или вне диапазона
};

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::ParseError;
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Загрузить конфигурацию из файла.
/// Относительные пути разрешаются от каталога файла конфигурации.
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из текста YAML.
/// @param base_dir каталог для разрешения относительных путей
ConfigResult parse_config(std::string_view yaml_text, const std::filesystem::path& base_dir);

/// Привести расширение к виду с ведущей точкой ("lua" -> ".lua")
std::string normalize_extension(std::string_view ext);

}  // namespace luarestore::config

#endif  // LUARESTORE_CONFIG_HPP
