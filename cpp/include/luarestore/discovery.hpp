// ==============================================================================
// luarestore/discovery.hpp - MOD-0011: Обход зависимостей
// ==============================================================================
//
// MOD-0011 discovery
// ADR-0011: детерминизм (результаты применяются в порядке очереди FIFO)
//
// Назначение:
// - Обход в ширину от корневого файла: чтение -> ссылки -> резолвер -> граф
// - Чтение и разбор для нескольких узлов идут параллельно (workers),
//   в граф пишет только координирующий поток
// - Ограничение глубины (max_depth) и отмена между элементами очереди
//
// Ошибки:
// - Корень не найден / не прочитан - прогон прерывается (DiscoveryResult.ok = false)
// - Любой другой файл не прочитан - узел Error, обход продолжается
//
// ==============================================================================

#ifndef LUARESTORE_DISCOVERY_HPP
#define LUARESTORE_DISCOVERY_HPP

#include "luarestore/file_source.hpp"
#include "luarestore/graph.hpp"
#include "luarestore/resolver.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace luarestore::output {
class Writer;
}

namespace luarestore::discovery {

// ----------------------------------------------------------------------------
// CancellationToken
// ----------------------------------------------------------------------------

/// Флаг отмены. cancel() можно вызывать из любого потока и из обработчика сигнала.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

private:
    std::atomic<bool> cancelled_{false};
};

// ----------------------------------------------------------------------------
// Options / Result
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Сколько узлов читать и разбирать одновременно (>= 1)
    std::size_t workers = 1;

    /// Узлы глубже max_depth создаются, но не раскрываются (state = Unresolved)
    std::optional<std::size_t> max_depth;
};

enum class DiscoveryErrorKind {
    RootNotFound,    // Корневой файл не существует
    RootUnreadable,  // Корневой файл не прочитан
};

const char* discovery_error_kind_to_string(DiscoveryErrorKind kind);

struct DiscoveryError {
    DiscoveryErrorKind kind = DiscoveryErrorKind::RootNotFound;
    std::string message;
    std::string path;

    /// "cannot start discovery at '<path>' - <message>"
    std::string format() const;
};

struct DiscoveryResult {
    bool ok = false;

    /// Прогон отменён; граф пуст
    bool cancelled = false;

    graph::DependencyGraph graph;

    /// Ключ корневого узла
    std::string root_key;

    DiscoveryError error;
};

// ----------------------------------------------------------------------------
// DiscoveryDriver
// ----------------------------------------------------------------------------

class DiscoveryDriver {
public:
    /// @param files, resolver должны жить дольше драйвера
    /// @param log необязательный вывод диагностики (только из координирующего потока)
    DiscoveryDriver(const io::FileSource& files, const resolve::PathResolver& resolver,
                    DiscoveryOptions options, output::Writer* log = nullptr);

    /// Построить граф, достижимый из root_path
    DiscoveryResult run(const std::filesystem::path& root_path,
                        const CancellationToken* cancel = nullptr) const;

    const DiscoveryOptions& options() const { return options_; }

private:
    const io::FileSource& files_;
    const resolve::PathResolver& resolver_;
    DiscoveryOptions options_;
    output::Writer* log_;
};

}  // namespace luarestore::discovery

#endif  // LUARESTORE_DISCOVERY_HPP
