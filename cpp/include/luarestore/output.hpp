// ==============================================================================
// luarestore/output.hpp - MOD-0003: Пользовательский вывод и журнал
// ==============================================================================
//
// MOD-0003 output
// ADR-0003: RapidJSON для JSON сериализации
// GUIDE-0001 G-011: только этот модуль пишет в stdout/stderr
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Уровни сообщений [+] [!] [x] [*] [~], цвет только на TTY
// - Копия сообщений, прошедших фильтр уровня, в файл журнала
// - План восстановления в файл (output_path) или stdout
// - Таблица для итоговой сводки
//
// Writer не синхронизирован: вызывается из одного потока.
//
// ==============================================================================

#ifndef LUARESTORE_OUTPUT_HPP
#define LUARESTORE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace luarestore::output {

enum class Stream { Stdout, Stderr };

/// Уровень сообщения; определяет префикс, цвет и фильтр
enum class Level {
    Info,   // [+] подавляется quiet
    Warn,   // [!] подавляется quiet
    Error,  // [x] всегда
    Debug,  // [*] verbose >= 1
    Trace,  // [~] verbose >= 2
};

struct OutputConfig {
    bool quiet = false;
    int verbose = 0;

    /// Файл для stdout-вывода (план восстановления)
    std::optional<std::filesystem::path> output_path;

    /// Файл журнала, дописывается
    std::optional<std::filesystem::path> log_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    /// Файлы из cfg открываются сразу; неудача видна через has_*_file()
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Сырые байты; Stdout уходит в output file, если он открыт
    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Сообщение уровня level в stderr и журнал (если уровень включён)
    void message(Level level, std::string_view text);

    void info(std::string_view text) { message(Level::Info, text); }
    void warn(std::string_view text) { message(Level::Warn, text); }
    void error(std::string_view text) { message(Level::Error, text); }
    void debug(std::string_view text) { message(Level::Debug, text); }
    void trace(std::string_view text) { message(Level::Trace, text); }

    bool enabled(Level level) const;

    /// Компактный JSON в stdout (или output file)
    void write_json(const rapidjson::Value& value);

    /// JSON с отступом 2 и переводом строки
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    bool has_output_file() const { return output_file_ != nullptr; }
    bool has_log_file() const { return log_file_ != nullptr; }

private:
    FILE* target(Stream s) const;

    OutputConfig config_;
    bool color_stderr_ = false;
    FILE* output_file_ = nullptr;
    FILE* log_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - рамка из Unicode box-drawing символов
// ----------------------------------------------------------------------------

class Table {
public:
    void set_headers(std::vector<std::string> headers);
    void add_row(std::vector<std::string> cells);

    /// Минимальная ширина столбца в символах
    void set_column_width(std::size_t col, std::size_t width);

    std::string to_string() const;

    void print(Writer& w, Stream s = Stream::Stderr) const;

    std::size_t row_count() const { return rows_.size(); }

private:
    std::vector<std::size_t> column_widths() const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<std::size_t> min_widths_;
};

/// "<prefix> <text>\n" без цвета
std::string format_message(Level level, std::string_view text);

/// Проверить, поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

/// Длина UTF-8 строки в code points
std::size_t display_width(std::string_view text);

}  // namespace luarestore::output

#endif  // LUARESTORE_OUTPUT_HPP
