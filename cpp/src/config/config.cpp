// ==============================================================================
// config.cpp - MOD-0008: Конфигурация (YAML)
// ==============================================================================
//
// MOD-0008 config
// ADR-0004: yaml-cpp для YAML
//
// ==============================================================================

#include "luarestore/config.hpp"

#include "luarestore/platform.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace luarestore::config {

namespace {

std::filesystem::path resolve_against(const std::filesystem::path& base_dir,
                                      const std::filesystem::path& p) {
    if (p.is_relative() && !base_dir.empty()) {
        return (base_dir / p).lexically_normal();
    }
    return p.lexically_normal();
}

ConfigResult invalid(const std::string& message) {
    ConfigResult result;
    result.ok = false;
    result.error.kind = ConfigErrorKind::InvalidValue;
    result.error.message = message;
    return result;
}

/// Неотрицательное целое из скаляра; nullopt при ошибке
std::optional<long long> read_non_negative(const YAML::Node& node) {
    if (!node.IsScalar()) {
        return std::nullopt;
    }
    long long value = 0;
    if (!YAML::convert<long long>::decode(node, value) || value < 0) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::filesystem::path> read_path(const YAML::Node& node,
                                               const std::filesystem::path& base_dir) {
    if (!node || !node.IsScalar()) {
        return std::nullopt;
    }
    auto text = node.as<std::string>();
    if (text.empty()) {
        return std::nullopt;
    }
    return resolve_against(base_dir, platform::path_from_utf8(text));
}

/// Повторный корень не добавляется: порядок первого появления сохраняется
void add_root(std::vector<std::filesystem::path>& roots, std::filesystem::path root) {
    if (std::find(roots.begin(), roots.end(), root) == roots.end()) {
        roots.push_back(std::move(root));
    }
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// ConfigError
// ----------------------------------------------------------------------------

std::string ConfigError::format() const {
    if (path.empty()) {
        return "failed to load config - " + message;
    }
    return "failed to load config '" + path + "' - " + message;
}

std::string normalize_extension(std::string_view ext) {
    if (ext.empty() || ext.front() == '.') {
        return std::string(ext);
    }
    return "." + std::string(ext);
}

// ----------------------------------------------------------------------------
// parse_config
// ----------------------------------------------------------------------------

ConfigResult parse_config(std::string_view yaml_text, const std::filesystem::path& base_dir) {
    ConfigResult result;
    result.ok = false;

    try {
        YAML::Node root = YAML::Load(std::string(yaml_text));
        Config& cfg = result.config;

        // Пустой документ допустим: всё по умолчанию
        if (root.IsNull()) {
            cfg.search_roots = platform::default_lua_roots();
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            return invalid("top-level YAML node must be a mapping");
        }

        cfg.start_file = read_path(root["start_file"], base_dir);

        // search_roots (optional): порядок в файле = приоритет
        if (const auto roots = root["search_roots"]) {
            if (!roots.IsSequence()) {
                return invalid("'search_roots' must be a sequence");
            }
            for (const auto& r : roots) {
                auto p = read_path(r, base_dir);
                if (!p) {
                    return invalid("'search_roots' entries must be non-empty strings");
                }
                add_root(cfg.search_roots, std::move(*p));
            }
        }

        // source_dir (optional): каталог с выводом unluac и его подкаталог lua/
        if (root["source_dir"]) {
            auto source_dir = read_path(root["source_dir"], base_dir);
            if (!source_dir) {
                return invalid("'source_dir' must be a non-empty string");
            }
            add_root(cfg.search_roots, *source_dir);
            std::error_code ec;
            if (std::filesystem::is_directory(*source_dir / "lua", ec)) {
                add_root(cfg.search_roots, *source_dir / "lua");
            }
        }

        if (cfg.search_roots.empty()) {
            cfg.search_roots = platform::default_lua_roots();
        }

        if (const auto exts = root["extensions"]) {
            if (!exts.IsSequence() || exts.size() == 0) {
                return invalid("'extensions' must be a non-empty sequence");
            }
            cfg.extensions.clear();
            for (const auto& e : exts) {
                auto ext = normalize_extension(e.as<std::string>());
                if (ext.size() < 2) {
                    return invalid("'extensions' entries must be non-empty");
                }
                cfg.extensions.push_back(std::move(ext));
            }
        }

        if (root["read_timeout_ms"]) {
            auto ms = read_non_negative(root["read_timeout_ms"]);
            if (!ms || *ms == 0) {
                return invalid("'read_timeout_ms' must be a positive integer");
            }
            cfg.read_timeout = std::chrono::milliseconds(*ms);
        }

        if (root["workers"]) {
            auto workers = read_non_negative(root["workers"]);
            if (!workers || *workers == 0) {
                return invalid("'workers' must be a positive integer");
            }
            if (static_cast<std::size_t>(*workers) > MAX_WORKERS) {
                return invalid("'workers' must not exceed " + std::to_string(MAX_WORKERS));
            }
            cfg.workers = static_cast<std::size_t>(*workers);
        }

        if (root["max_depth"] && !root["max_depth"].IsNull()) {
            auto depth = read_non_negative(root["max_depth"]);
            if (!depth) {
                return invalid("'max_depth' must be a non-negative integer");
            }
            cfg.max_depth = static_cast<std::size_t>(*depth);
        }

        cfg.log_file = read_path(root["log_file"], base_dir);
        cfg.plan_output = read_path(root["plan_output"], base_dir);

        if (root["verbose"]) {
            auto verbose = read_non_negative(root["verbose"]);
            if (!verbose) {
                return invalid("'verbose' must be a non-negative integer");
            }
            cfg.verbose = static_cast<int>(*verbose);
        }
        if (root["quiet"]) {
            cfg.quiet = root["quiet"].as<bool>();
        }

        result.ok = true;
        return result;

    } catch (const YAML::ParserException& e) {
        result.error.kind = ConfigErrorKind::ParseError;
        result.error.message = std::string("YAML parse error: ") + e.what();
        return result;
    } catch (const YAML::Exception& e) {
        result.error.kind = ConfigErrorKind::InvalidValue;
        result.error.message = std::string("invalid value: ") + e.what();
        return result;
    }
}

// ----------------------------------------------------------------------------
// load_config
// ----------------------------------------------------------------------------

ConfigResult load_config(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ConfigResult result;
        result.error.kind = ConfigErrorKind::FileNotFound;
        result.error.message = "cannot open config file";
        result.error.path = platform::path_to_utf8(path);
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str(), path.parent_path());
    if (!result.ok) {
        result.error.path = platform::path_to_utf8(path);
    }
    return result;
}

}  // namespace luarestore::config
