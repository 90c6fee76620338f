// ==============================================================================
// luarestore/resolver.hpp - MOD-0007: Разрешение имён модулей в пути
// ==============================================================================
//
// MOD-0007 resolve::resolver
// ADR-0010: std::filesystem::path
// ADR-0011: детерминизм (порядок корней и расширений задаётся конфигурацией)
//
// Назначение:
// - "a.b.c" -> <root>/a/b/c<ext> для первого существующего файла
// - Корни перебираются в порядке приоритета, внутри корня - расширения
// - Кэш результатов принадлежит экземпляру (время жизни = один прогон)
// - Обратное отображение путь -> имя модуля для отчётов
//
// ==============================================================================

#ifndef LUARESTORE_RESOLVER_HPP
#define LUARESTORE_RESOLVER_HPP

#include "luarestore/file_source.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace luarestore::resolve {

// ----------------------------------------------------------------------------
// ResolveResult
// ----------------------------------------------------------------------------

enum class ResolveStatus {
    Resolved,    // Найден файл
    Unresolved,  // Ни один корень не содержит файла
    Malformed,   // Имя не является допустимым именем модуля
};

const char* resolve_status_to_string(ResolveStatus status);

struct ResolveResult {
    ResolveStatus status = ResolveStatus::Unresolved;

    /// Канонический путь найденного файла (только для Resolved)
    std::filesystem::path path;

    /// Ключ узла графа для path (только для Resolved)
    std::string key;

    explicit operator bool() const { return status == ResolveStatus::Resolved; }
};

// ----------------------------------------------------------------------------
// PathResolver
// ----------------------------------------------------------------------------

class PathResolver {
public:
    /// @param files источник файлов; должен жить дольше резолвера
    /// @param roots корни поиска в порядке приоритета
    /// @param extensions расширения с ведущей точкой в порядке приоритета
    PathResolver(const io::FileSource& files, std::vector<std::filesystem::path> roots,
                 std::vector<std::string> extensions);

    PathResolver(const PathResolver&) = delete;
    PathResolver& operator=(const PathResolver&) = delete;

    /// Разрешить имя модуля. Потокобезопасно.
    ResolveResult resolve(std::string_view identifier) const;

    /// Относительный путь кандидата: "a.b.c" + ".lua" -> "a/b/c.lua"
    static std::filesystem::path candidate_relative_path(std::string_view identifier,
                                                         std::string_view extension);

    /// Имя модуля для файла: путь внутри корня без расширения, через точки.
    /// Вне корней - имя файла без известного расширения.
    std::string module_name_for(const std::filesystem::path& file) const;

    /// Добавить корень в конец списка (дубликаты игнорируются).
    /// Только до начала прогона: сбрасывает кэш.
    void add_search_root(const std::filesystem::path& root);

    const std::vector<std::filesystem::path>& search_roots() const { return roots_; }
    const std::vector<std::string>& extensions() const { return extensions_; }

    void clear_cache();
    std::size_t cache_size() const;

private:
    ResolveResult lookup(std::string_view identifier) const;

    const io::FileSource& files_;
    std::vector<std::filesystem::path> roots_;
    std::vector<std::string> extensions_;

    mutable std::mutex cache_mutex_;
    mutable std::unordered_map<std::string, ResolveResult> cache_;
};

}  // namespace luarestore::resolve

#endif  // LUARESTORE_RESOLVER_HPP
