// ==============================================================================
// resolver.cpp - MOD-0007: Разрешение имён модулей в пути
// ==============================================================================
//
// MOD-0007 resolve::resolver
// ADR-0010: std::filesystem::path
// ADR-0011: детерминизм
//
// ==============================================================================

#include "luarestore/resolver.hpp"

#include "luarestore/extractor.hpp"
#include "luarestore/platform.hpp"

#include <algorithm>

namespace luarestore::resolve {

namespace {

/// Имя файла заканчивается на ext (".lua.unluac" сравнивается целиком)
bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // anonymous namespace

const char* resolve_status_to_string(ResolveStatus status) {
    switch (status) {
    case ResolveStatus::Resolved:
        return "resolved";
    case ResolveStatus::Malformed:
        return "malformed";
    case ResolveStatus::Unresolved:
    default:
        return "unresolved";
    }
}

// ----------------------------------------------------------------------------
// PathResolver
// ----------------------------------------------------------------------------

PathResolver::PathResolver(const io::FileSource& files, std::vector<std::filesystem::path> roots,
                           std::vector<std::string> extensions)
    : files_(files), roots_(std::move(roots)), extensions_(std::move(extensions)) {}

std::filesystem::path PathResolver::candidate_relative_path(std::string_view identifier,
                                                            std::string_view extension) {
    std::filesystem::path rel;
    std::size_t start = 0;
    while (true) {
        std::size_t dot = identifier.find('.', start);
        std::string_view part = identifier.substr(start, dot == std::string_view::npos
                                                             ? std::string_view::npos
                                                             : dot - start);
        if (dot == std::string_view::npos) {
            rel /= platform::path_from_utf8(std::string(part) + std::string(extension));
            break;
        }
        rel /= platform::path_from_utf8(part);
        start = dot + 1;
    }
    return rel;
}

ResolveResult PathResolver::resolve(std::string_view identifier) const {
    {
        std::lock_guard<std::mutex> lock(cache_mutex_);
        auto it = cache_.find(std::string(identifier));
        if (it != cache_.end()) {
            return it->second;
        }
    }

    // Поиск по файловой системе идёт без блокировки; при гонке двух потоков
    // оба получат одинаковый результат, в кэше останется первый
    ResolveResult result = lookup(identifier);

    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.emplace(std::string(identifier), result).first->second;
}

ResolveResult PathResolver::lookup(std::string_view identifier) const {
    ResolveResult result;

    if (!is_valid_module_name(identifier)) {
        result.status = ResolveStatus::Malformed;
        return result;
    }

    for (const auto& root : roots_) {
        for (const auto& ext : extensions_) {
            std::filesystem::path candidate = root / candidate_relative_path(identifier, ext);
            if (!files_.is_regular_file(candidate)) {
                continue;
            }
            std::filesystem::path canonical = files_.canonical(candidate);
            if (canonical.empty()) {
                continue;
            }
            result.status = ResolveStatus::Resolved;
            result.path = canonical;
            result.key = platform::path_key(canonical);
            return result;
        }
    }

    result.status = ResolveStatus::Unresolved;
    return result;
}

std::string PathResolver::module_name_for(const std::filesystem::path& file) const {
    std::string filename = platform::path_to_utf8(file.filename());

    // Самое длинное подходящее расширение: ".lua.unluac" раньше ".lua"
    std::string matched_ext;
    for (const auto& ext : extensions_) {
        if (ends_with(filename, ext) && ext.size() > matched_ext.size()) {
            matched_ext = ext;
        }
    }
    if (matched_ext.empty()) {
        matched_ext = platform::path_to_utf8(file.extension());
    }

    std::filesystem::path normalized = file.lexically_normal();
    for (const auto& root : roots_) {
        std::filesystem::path root_canonical = files_.canonical(root);
        const std::filesystem::path& base =
            root_canonical.empty() ? root.lexically_normal() : root_canonical;

        std::filesystem::path rel = normalized.lexically_relative(base);
        if (rel.empty() || *rel.begin() == "..") {
            continue;
        }

        std::string name;
        for (const auto& part : rel) {
            if (!name.empty()) {
                name += '.';
            }
            name += platform::path_to_utf8(part);
        }
        return name.substr(0, name.size() - matched_ext.size());
    }

    return filename.substr(0, filename.size() - matched_ext.size());
}

void PathResolver::add_search_root(const std::filesystem::path& root) {
    if (std::find(roots_.begin(), roots_.end(), root) != roots_.end()) {
        return;
    }
    roots_.push_back(root);
    clear_cache();
}

void PathResolver::clear_cache() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    cache_.clear();
}

std::size_t PathResolver::cache_size() const {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    return cache_.size();
}

}  // namespace luarestore::resolve
