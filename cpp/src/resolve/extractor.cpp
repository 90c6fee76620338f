// ==============================================================================
// extractor.cpp - MOD-0006: Извлечение ссылок на модули
// ==============================================================================
//
// MOD-0006 resolve::extractor
//
// Однопроходный сканер: комментарии, короткие и длинные строки пропускаются
// целиком, поэтому "require" внутри них не даёт ссылок.
//
// ==============================================================================

#include "luarestore/extractor.hpp"

#include <cctype>

namespace luarestore::resolve {

namespace {

bool is_name_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// ----------------------------------------------------------------------------
// Scanner
// ----------------------------------------------------------------------------

class Scanner {
public:
    explicit Scanner(std::string_view src) : src_(src) {}

    ExtractionResult run() {
        while (!at_end()) {
            char c = peek();

            if (c == '-' && peek(1) == '-') {
                skip_comment();
                continue;
            }
            if (c == '"' || c == '\'') {
                std::string ignored;
                read_quoted(ignored);
                mark('"');
                continue;
            }
            if (c == '[') {
                int level = long_bracket_level();
                if (level >= 0) {
                    read_long_bracket(level);
                    mark('"');
                    continue;
                }
            }
            if (c == '.' && peek(1) == '.') {
                // Конкатенация (и "...") - не доступ к полю
                while (peek() == '.') {
                    advance();
                }
                mark('~');
                continue;
            }
            if (is_name_char(c)) {
                std::size_t start = pos_;
                std::size_t line = line_;
                while (!at_end() && is_name_char(peek())) {
                    advance();
                }
                std::string_view word = src_.substr(start, pos_ - start);

                if (word == "require" && prev_sig_ != '.' && prev_sig_ != ':' &&
                    prev_word_ != "function") {
                    handle_require(line);
                    continue;
                }
                prev_word_ = std::string(word);
                prev_sig_ = 'a';
                continue;
            }

            if (!is_space(c)) {
                mark(c);
            }
            advance();
        }
        return std::move(result_);
    }

private:
    bool at_end() const { return pos_ >= src_.size(); }

    char peek(std::size_t off = 0) const {
        return pos_ + off < src_.size() ? src_[pos_ + off] : '\0';
    }

    void advance(std::size_t n = 1) {
        for (std::size_t i = 0; i < n && !at_end(); ++i) {
            if (src_[pos_] == '\n') {
                ++line_;
            }
            ++pos_;
        }
    }

    void mark(char sig) {
        prev_sig_ = sig;
        prev_word_.clear();
    }

    /// Уровень длинной скобки [==[ в текущей позиции, -1 если её нет
    int long_bracket_level() const {
        if (peek() != '[') {
            return -1;
        }
        std::size_t off = 1;
        while (peek(off) == '=') {
            ++off;
        }
        return peek(off) == '[' ? static_cast<int>(off - 1) : -1;
    }

    /// Читает длинную строку/комментарий, текущая позиция - на открывающей скобке
    std::string read_long_bracket(int level) {
        advance(static_cast<std::size_t>(level) + 2);
        // Перевод строки сразу после открывающей скобки не входит в содержимое
        if (peek() == '\r') {
            advance();
        }
        if (peek() == '\n') {
            advance();
        }

        std::string out;
        while (!at_end()) {
            if (peek() == ']') {
                std::size_t off = 1;
                while (peek(off) == '=') {
                    ++off;
                }
                if (peek(off) == ']' && static_cast<int>(off - 1) == level) {
                    advance(off + 1);
                    return out;
                }
            }
            out += peek();
            advance();
        }
        return out;
    }

    /// Читает строку в кавычках; escape-последовательности сохраняются как есть.
    /// Незакрытая строка заканчивается на переводе строки.
    bool read_quoted(std::string& out) {
        char quote = peek();
        advance();
        while (!at_end()) {
            char c = peek();
            if (c == '\\') {
                out += c;
                advance();
                if (!at_end()) {
                    out += peek();
                    advance();
                }
                continue;
            }
            if (c == quote) {
                advance();
                return true;
            }
            if (c == '\n') {
                return false;
            }
            out += c;
            advance();
        }
        return false;
    }

    void skip_comment() {
        advance(2);
        int level = long_bracket_level();
        if (level >= 0) {
            read_long_bracket(level);
            return;
        }
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    void skip_space_and_comments() {
        while (!at_end()) {
            if (is_space(peek())) {
                advance();
            } else if (peek() == '-' && peek(1) == '-') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    /// Пытается прочитать строковый литерал в текущей позиции
    bool try_read_literal(std::string& out) {
        char c = peek();
        if (c == '"' || c == '\'') {
            read_quoted(out);
            return true;
        }
        int level = long_bracket_level();
        if (level >= 0) {
            out = read_long_bracket(level);
            return true;
        }
        return false;
    }

    void record_literal(std::string literal, std::size_t line) {
        if (is_valid_module_name(literal)) {
            result_.references.emplace_back(ModuleReference{std::move(literal), line});
        } else {
            result_.references.emplace_back(MalformedReference{std::move(literal), line});
        }
    }

    /// Позиция - сразу после слова require
    void handle_require(std::size_t line) {
        const std::size_t save_pos = pos_;
        const std::size_t save_line = line_;

        skip_space_and_comments();

        // require "m" / require [[m]]
        std::string literal;
        if (try_read_literal(literal)) {
            record_literal(std::move(literal), line);
            mark('"');
            return;
        }

        // require { ... } - аргумент-таблица
        if (peek() == '{') {
            result_.references.emplace_back(DynamicReference{line});
            mark('a');
            return;
        }

        if (peek() == '(') {
            advance();
            const std::size_t inner_pos = pos_;
            const std::size_t inner_line = line_;
            skip_space_and_comments();

            if (peek() == ')') {
                advance();
                result_.references.emplace_back(MalformedReference{"", line});
                mark(')');
                return;
            }

            if (try_read_literal(literal)) {
                skip_space_and_comments();
                // Лишние аргументы require игнорирует
                if (peek() == ')' || peek() == ',') {
                    record_literal(std::move(literal), line);
                } else {
                    result_.references.emplace_back(DynamicReference{line});
                }
                mark('"');
                return;
            }

            // Аргумент - выражение; его содержимое сканируется обычным образом
            result_.references.emplace_back(DynamicReference{line});
            pos_ = inner_pos;
            line_ = inner_line;
            mark('(');
            return;
        }

        // require как значение (local r = require) - не вызов
        pos_ = save_pos;
        line_ = save_line;
        prev_word_ = "require";
        prev_sig_ = 'a';
    }

    std::string_view src_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;

    // Последний значимый символ и последнее слово вне строк и комментариев
    char prev_sig_ = '\0';
    std::string prev_word_;

    ExtractionResult result_;
};

}  // anonymous namespace

// ----------------------------------------------------------------------------
// ExtractionResult
// ----------------------------------------------------------------------------

std::vector<std::string> ExtractionResult::identifiers() const {
    std::vector<std::string> names;
    for (const auto& ref : references) {
        if (const auto* module = std::get_if<ModuleReference>(&ref)) {
            names.push_back(module->name);
        }
    }
    return names;
}

std::size_t ExtractionResult::dynamic_count() const {
    std::size_t count = 0;
    for (const auto& ref : references) {
        if (std::holds_alternative<DynamicReference>(ref)) {
            ++count;
        }
    }
    return count;
}

std::size_t ExtractionResult::malformed_count() const {
    std::size_t count = 0;
    for (const auto& ref : references) {
        if (std::holds_alternative<MalformedReference>(ref)) {
            ++count;
        }
    }
    return count;
}

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

ExtractionResult extract_references(std::string_view source) {
    return Scanner(source).run();
}

bool is_valid_module_name(std::string_view name) {
    if (name.empty()) {
        return false;
    }

    bool segment_start = true;
    for (char c : name) {
        if (c == '.') {
            if (segment_start) {
                return false;  // пустой сегмент: ".a", "a..b"
            }
            segment_start = true;
            continue;
        }
        if (segment_start ? !is_name_start(c) : !is_name_char(c)) {
            return false;
        }
        segment_start = false;
    }
    return !segment_start;  // "a." - пустой последний сегмент
}

}  // namespace luarestore::resolve
