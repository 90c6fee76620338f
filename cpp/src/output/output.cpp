// ==============================================================================
// output.cpp - MOD-0003: Пользовательский вывод и журнал
// ==============================================================================
//
// MOD-0003 output
// ADR-0003: RapidJSON для JSON сериализации
// GUIDE-0001 G-032: байты первичны, избегаем std::endl
//
// ==============================================================================

#include "luarestore/output.hpp"

#include "luarestore/platform.hpp"

#include <algorithm>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>
#include <system_error>
#include <utility>

namespace luarestore::output {

namespace {

struct LevelStyle {
    const char* prefix;
    const char* color;  // ANSI SGR
};

LevelStyle style_of(Level level) {
    switch (level) {
    case Level::Info:
        return {"[+]", "\x1b[32m"};
    case Level::Warn:
        return {"[!]", "\x1b[33m"};
    case Level::Error:
        return {"[x]", "\x1b[31m"};
    case Level::Debug:
        return {"[*]", "\x1b[36m"};
    case Level::Trace:
    default:
        return {"[~]", "\x1b[35m"};
    }
}

constexpr const char* ANSI_RESET = "\x1b[0m";

FILE* open_for(const std::filesystem::path& path, bool append) {
    // Каталоги журнала (logs/...) создаются по требованию; ошибку покажет fopen
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
#ifdef _WIN32
    return _wfopen(path.c_str(), append ? L"ab" : L"wb");
#else
    return std::fopen(platform::path_to_utf8(path).c_str(), append ? "ab" : "wb");
#endif
}

void close_file(FILE*& f) {
    if (f != nullptr) {
        std::fflush(f);
        std::fclose(f);
        f = nullptr;
    }
}

// Рамка таблицы: ┌─┬─┐ / ├─┼─┤ / └─┴─┘
struct Border {
    const char* left;
    const char* middle;
    const char* right;
};

constexpr Border BORDER_TOP{"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};
constexpr Border BORDER_MID{"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};
constexpr Border BORDER_BOTTOM{"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};
constexpr const char* BOX_H = "\xe2\x94\x80";  // ─
constexpr const char* BOX_V = "\xe2\x94\x82";  // │

void append_border(std::string& out, const std::vector<std::size_t>& widths, const Border& b) {
    out += b.left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            out += BOX_H;
        }
        out += (i + 1 < widths.size()) ? b.middle : b.right;
    }
    out += '\n';
}

void append_row(std::string& out, const std::vector<std::size_t>& widths,
                const std::vector<std::string>& cells) {
    out += BOX_V;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string empty;
        const std::string& cell = i < cells.size() ? cells[i] : empty;
        out += ' ';
        out += cell;
        out.append(widths[i] - std::min(widths[i], display_width(cell)) + 1, ' ');
        out += BOX_V;
    }
    out += '\n';
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg)
    : config_(cfg), color_stderr_(supports_color(Stream::Stderr)) {
    if (config_.output_path) {
        output_file_ = open_for(*config_.output_path, false);
    }
    if (config_.log_path) {
        log_file_ = open_for(*config_.log_path, true);
    }
}

Writer::~Writer() {
    close_file(output_file_);
    close_file(log_file_);
    flush();
}

FILE* Writer::target(Stream s) const {
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Debug:
        return config_.verbose >= 1;
    case Level::Trace:
        return config_.verbose >= 2;
    case Level::Error:
    default:
        return true;
    }
}

void Writer::message(Level level, std::string_view text) {
    if (!enabled(level)) {
        return;
    }
    const LevelStyle style = style_of(level);

    if (color_stderr_) {
        write(Stream::Stderr, style.color);
        write(Stream::Stderr, style.prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, style.prefix);
    }
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, text);

    if (log_file_ != nullptr) {
        const std::string line = format_message(level, text);
        std::fwrite(line.data(), 1, line.size(), log_file_);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);
    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);
    write_line(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::flush() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(std::vector<std::string> headers) {
    headers_ = std::move(headers);
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

void Table::set_column_width(std::size_t col, std::size_t width) {
    if (col >= min_widths_.size()) {
        min_widths_.resize(col + 1, 0);
    }
    min_widths_[col] = width;
}

std::vector<std::size_t> Table::column_widths() const {
    std::vector<std::size_t> widths = min_widths_;
    auto fit = [&widths](const std::vector<std::string>& cells) {
        if (widths.size() < cells.size()) {
            widths.resize(cells.size(), 0);
        }
        for (std::size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    fit(headers_);
    for (const auto& row : rows_) {
        fit(row);
    }
    return widths;
}

std::string Table::to_string() const {
    const std::vector<std::size_t> widths = column_widths();

    std::string out;
    append_border(out, widths, BORDER_TOP);
    if (!headers_.empty()) {
        append_row(out, widths, headers_);
        append_border(out, widths, BORDER_MID);
    }
    for (const auto& row : rows_) {
        append_row(out, widths, row);
    }
    append_border(out, widths, BORDER_BOTTOM);
    return out;
}

void Table::print(Writer& w, Stream s) const {
    w.write(s, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_message(Level level, std::string_view text) {
    std::string out = style_of(level).prefix;
    out += ' ';
    out.append(text);
    out += '\n';
    return out;
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

std::size_t display_width(std::string_view text) {
    // Продолжения UTF-8 (10xxxxxx) не считаются
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

}  // namespace luarestore::output
