// ==============================================================================
// discovery.cpp - MOD-0011: Обход зависимостей
// ==============================================================================
//
// MOD-0011 discovery
// ADR-0011: детерминизм
//
// Очередь разбирается пакетами по workers элементов с головы. Чтение,
// извлечение ссылок и резолвинг пакета выполняются в рабочих потоках;
// результаты применяются к графу координирующим потоком строго в порядке
// очереди, поэтому граф не зависит от числа потоков.
//
// ==============================================================================

#include "luarestore/discovery.hpp"

#include "luarestore/extractor.hpp"
#include "luarestore/output.hpp"
#include "luarestore/platform.hpp"

#include <algorithm>
#include <deque>
#include <exception>
#include <map>
#include <set>
#include <thread>
#include <utility>
#include <vector>

namespace luarestore::discovery {

namespace {

/// Результат обработки одного узла вне графа
struct WorkItem {
    std::string key;
    std::filesystem::path path;

    io::ReadResult read;
    resolve::ExtractionResult extraction;

    /// По одному на каждую ModuleReference, в том же порядке
    std::vector<resolve::ResolveResult> resolved;

    std::exception_ptr failure;
};

void process_item(const io::FileSource& files, const resolve::PathResolver& resolver,
                  WorkItem& item) {
    item.read = files.read(item.path);
    if (!item.read.ok) {
        return;
    }
    item.extraction = resolve::extract_references(item.read.content);
    for (const auto& ref : item.extraction.references) {
        if (const auto* module = std::get_if<resolve::ModuleReference>(&ref)) {
            item.resolved.push_back(resolver.resolve(module->name));
        }
    }
}

void process_batch(const io::FileSource& files, const resolve::PathResolver& resolver,
                   std::vector<WorkItem>& batch) {
    if (batch.size() == 1) {
        process_item(files, resolver, batch.front());
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(batch.size());
    auto join_all = [&threads]() {
        for (auto& thread : threads) {
            thread.join();
        }
    };
    try {
        for (auto& item : batch) {
            threads.emplace_back([&files, &resolver, &item]() {
                try {
                    process_item(files, resolver, item);
                } catch (...) {
                    item.failure = std::current_exception();
                }
            });
        }
    } catch (...) {
        // Уже запущенные потоки ссылаются на batch: дождаться их до выхода
        join_all();
        throw;
    }
    join_all();
    for (const auto& item : batch) {
        if (item.failure) {
            std::rethrow_exception(item.failure);
        }
    }
}

DiscoveryResult cancelled_result(const std::string& root_key) {
    DiscoveryResult result;
    result.cancelled = true;
    result.root_key = root_key;
    return result;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// DiscoveryError
// ----------------------------------------------------------------------------

const char* discovery_error_kind_to_string(DiscoveryErrorKind kind) {
    switch (kind) {
    case DiscoveryErrorKind::RootNotFound:
        return "RootNotFound";
    case DiscoveryErrorKind::RootUnreadable:
    default:
        return "RootUnreadable";
    }
}

std::string DiscoveryError::format() const {
    return "cannot start discovery at '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// DiscoveryDriver
// ----------------------------------------------------------------------------

DiscoveryDriver::DiscoveryDriver(const io::FileSource& files,
                                 const resolve::PathResolver& resolver, DiscoveryOptions options,
                                 output::Writer* log)
    : files_(files), resolver_(resolver), options_(std::move(options)), log_(log) {
    if (options_.workers == 0) {
        options_.workers = 1;
    }
}

DiscoveryResult DiscoveryDriver::run(const std::filesystem::path& root_path,
                                     const CancellationToken* cancel) const {
    DiscoveryResult result;

    const std::filesystem::path root = files_.canonical(root_path);
    if (root.empty() || !files_.is_regular_file(root)) {
        result.error.kind = DiscoveryErrorKind::RootNotFound;
        result.error.message = "file not found";
        result.error.path = platform::path_to_utf8(root_path);
        return result;
    }

    result.root_key = platform::path_key(root);
    graph::DependencyGraph& graph = result.graph;
    graph.add_node(result.root_key, 0);

    std::deque<std::string> queue{result.root_key};
    std::set<std::string> enqueued{result.root_key};
    std::map<std::string, std::filesystem::path> paths{{result.root_key, root}};

    auto expandable = [this](std::size_t depth) {
        return !options_.max_depth || depth <= *options_.max_depth;
    };

    while (!queue.empty()) {
        if (cancel != nullptr && cancel->is_cancelled()) {
            return cancelled_result(result.root_key);
        }

        const std::size_t batch_size = std::min(options_.workers, queue.size());
        std::vector<WorkItem> batch(batch_size);
        for (auto& item : batch) {
            item.key = std::move(queue.front());
            queue.pop_front();
            item.path = paths.at(item.key);
            graph.mark_reading(item.key);
            if (log_ != nullptr) {
                log_->debug("reading " + item.key);
            }
        }

        process_batch(files_, resolver_, batch);

        for (auto& item : batch) {
            if (cancel != nullptr && cancel->is_cancelled()) {
                return cancelled_result(result.root_key);
            }

            if (!item.read.ok) {
                const std::string cause = item.read.error.format();
                if (item.key == result.root_key) {
                    DiscoveryResult failed;
                    failed.root_key = result.root_key;
                    failed.error.kind = DiscoveryErrorKind::RootUnreadable;
                    failed.error.message = item.read.error.message;
                    failed.error.path = result.root_key;
                    return failed;
                }
                graph.mark_error(item.key, cause);
                if (log_ != nullptr) {
                    log_->warn(cause);
                }
                continue;
            }

            graph.set_content(item.key, std::move(item.read.content));

            std::size_t next_resolved = 0;
            for (const auto& ref : item.extraction.references) {
                if (std::holds_alternative<resolve::DynamicReference>(ref)) {
                    graph.add_dynamic_reference(item.key);
                    continue;
                }
                if (std::holds_alternative<resolve::MalformedReference>(ref)) {
                    graph.add_malformed_reference(item.key);
                    continue;
                }

                const auto& module = std::get<resolve::ModuleReference>(ref);
                const resolve::ResolveResult& resolved = item.resolved[next_resolved++];
                graph.add_raw_reference(item.key, module.name);

                if (!resolved) {
                    graph.add_unresolved(item.key, module.name);
                    if (log_ != nullptr) {
                        log_->warn("unresolved module '" + module.name + "' required by " +
                                   item.key + " (line " + std::to_string(module.line) + ")");
                    }
                    continue;
                }

                graph.add_edge(item.key, resolved.key);
                if (log_ != nullptr) {
                    log_->trace(item.key + " -> " + resolved.key);
                }

                const std::size_t depth = graph.at(resolved.key).depth;
                if (expandable(depth) && enqueued.insert(resolved.key).second) {
                    paths.emplace(resolved.key, resolved.path);
                    queue.push_back(resolved.key);
                }
            }

            graph.mark_resolved(item.key);
        }
    }

    // Не раскрытые из-за max_depth
    std::vector<std::string> pending;
    for (const auto& node : graph.nodes()) {
        if (node.state == graph::NodeState::Discovered) {
            pending.push_back(node.key);
        }
    }
    for (const auto& key : pending) {
        graph.mark_unresolved(key);
        if (log_ != nullptr) {
            log_->debug("max depth reached, not expanding " + key);
        }
    }

    result.ok = true;
    return result;
}

}  // namespace luarestore::discovery
