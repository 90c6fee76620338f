// ==============================================================================
// luarestore/extractor.hpp - MOD-0006: Извлечение ссылок на модули
// ==============================================================================
//
// MOD-0006 resolve::extractor
//
// Назначение:
// - Поиск вызовов require в тексте Lua (в т.ч. вывод unluac)
// - Явный размеченный результат: модуль | динамическая ссылка | некорректная
//
// Распознаются формы:
//   require("a.b")  require('a.b')  require "a.b"  require 'a.b'
//   require [[a.b]]  require([==[a.b]==])
// Комментарии и строковые литералы пропускаются. x.require(...) и
// x:require(...) - вызовы чужих методов, не ссылки.
//
// ==============================================================================

#ifndef LUARESTORE_EXTRACTOR_HPP
#define LUARESTORE_EXTRACTOR_HPP

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace luarestore::resolve {

// ----------------------------------------------------------------------------
// Reference - одна найденная ссылка
// ----------------------------------------------------------------------------

/// Статически известное имя модуля
struct ModuleReference {
    std::string name;
    std::size_t line = 0;  // 1-based
};

/// Аргумент не является одиночным строковым литералом (переменная, конкатенация...)
struct DynamicReference {
    std::size_t line = 0;
};

/// Строковый литерал, который не является именем модуля ("", "a b", "a/b")
struct MalformedReference {
    std::string raw;
    std::size_t line = 0;
};

using Reference = std::variant<ModuleReference, DynamicReference, MalformedReference>;

// ----------------------------------------------------------------------------
// ExtractionResult
// ----------------------------------------------------------------------------

struct ExtractionResult {
    /// Ссылки в порядке появления в тексте
    std::vector<Reference> references;

    /// Имена модулей в порядке появления (с повторами)
    std::vector<std::string> identifiers() const;

    std::size_t dynamic_count() const;
    std::size_t malformed_count() const;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Извлечь ссылки require из исходного текста. Не бросает исключений:
/// незакрытые строки и комментарии просто заканчиваются концом текста.
ExtractionResult extract_references(std::string_view source);

/// Имя модуля: Name { '.' Name }, где Name = [A-Za-z_][A-Za-z0-9_]*
bool is_valid_module_name(std::string_view name);

}  // namespace luarestore::resolve

#endif  // LUARESTORE_EXTRACTOR_HPP
