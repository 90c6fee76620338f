// ==============================================================================
// luarestore/graph.hpp - MOD-0009: Граф зависимостей
// ==============================================================================
//
// MOD-0009 graph
// ADR-0011: детерминизм (ключи и рёбра хранятся упорядоченными)
//
// Назначение:
// - Узлы (файлы) в арене, индекс ключ -> позиция
// - Рёбра - ключи зависимостей, разрешаются только поиском по индексу;
//   владеющих указателей между узлами нет, циклы выражаются свободно
// - Жизненный цикл узла: Discovered -> Reading -> Resolved | Error,
//   Discovered -> Unresolved | Error
// - Неизменяемый снимок для линеаризации
//
// Граф не синхронизирован: запись ведёт один владелец (см. discovery).
//
// ==============================================================================

#ifndef LUARESTORE_GRAPH_HPP
#define LUARESTORE_GRAPH_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace luarestore::graph {

// ----------------------------------------------------------------------------
// NodeState
// ----------------------------------------------------------------------------

enum class NodeState {
    Discovered,  // Файл найден, ещё не читался
    Reading,     // Чтение и разбор ссылок
    Resolved,    // Ссылки обработаны (часть могла не разрешиться)
    Unresolved,  // Файл известен, но его ссылки не раскрывались (max_depth)
    Error,       // Файл не прочитан; исходящие рёбра неполны
};

const char* node_state_to_string(NodeState state);

// ----------------------------------------------------------------------------
// Node
// ----------------------------------------------------------------------------

struct Node {
    /// Канонический абсолютный путь (platform::path_key)
    std::string key;

    NodeState state = NodeState::Discovered;

    /// Имена модулей из текста в порядке появления, с повторами
    std::vector<std::string> raw_references;

    /// Текст файла; задаётся один раз и дальше не меняется
    std::shared_ptr<const std::string> content;

    /// Ключи узлов, от которых зависит этот узел
    std::set<std::string> dependencies;

    /// Имена модулей без файла, без повторов, в порядке первого появления
    std::vector<std::string> unresolved;

    std::size_t dynamic_references = 0;
    std::size_t malformed_references = 0;

    /// Причина для state == Error
    std::string error;

    /// Расстояние от корня обхода
    std::size_t depth = 0;

    bool has_self_loop() const { return dependencies.count(key) > 0; }
};

// ----------------------------------------------------------------------------
// GraphStatistics
// ----------------------------------------------------------------------------

struct GraphStatistics {
    std::size_t total_nodes = 0;
    std::size_t total_edges = 0;
    std::size_t unresolved_references = 0;
    std::size_t dynamic_references = 0;
    std::size_t malformed_references = 0;
    std::size_t error_nodes = 0;
    std::size_t unresolved_nodes = 0;
    std::size_t max_dependencies = 0;
    std::size_t min_dependencies = 0;
    double avg_dependencies = 0.0;
};

using NodeIndex = std::map<std::string, std::size_t, std::less<>>;

// ----------------------------------------------------------------------------
// GraphSnapshot - неизменяемый вид графа
// ----------------------------------------------------------------------------

class GraphSnapshot {
public:
    GraphSnapshot() = default;

    const Node* find(std::string_view key) const;

    /// @throws std::out_of_range если узла нет
    const Node& at(std::string_view key) const;

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    /// Узлы в порядке вставки
    const std::vector<Node>& nodes() const { return nodes_; }

    /// Все ключи в лексикографическом порядке
    std::vector<std::string> keys() const;

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const;

    /// @throws std::out_of_range если узла нет
    const std::set<std::string>& dependencies(std::string_view key) const {
        return at(key).dependencies;
    }

    /// Узлы, зависящие от key (обратные рёбра), по возрастанию ключа
    std::vector<std::string> dependents(std::string_view key) const;

    /// Все прямые и косвенные зависимости key (без самого key)
    /// @throws std::out_of_range если узла нет
    std::set<std::string> transitive_dependencies(std::string_view key) const;

    GraphStatistics statistics() const;

private:
    friend class DependencyGraph;

    GraphSnapshot(std::vector<Node> nodes, NodeIndex index)
        : nodes_(std::move(nodes)), index_(std::move(index)) {}

    std::vector<Node> nodes_;
    NodeIndex index_;
};

// ----------------------------------------------------------------------------
// DependencyGraph - изменяемый граф одного прогона
// ----------------------------------------------------------------------------

class DependencyGraph {
public:
    DependencyGraph() = default;

    /// Добавить узел в состоянии Discovered. Повторный вызов ничего не меняет.
    /// @return true если узел создан
    bool add_node(const std::string& key, std::size_t depth = 0);

    /// Добавить ребро from -> to (from зависит от to). Идемпотентно.
    /// Узел to создаётся в состоянии Discovered с глубиной from.depth + 1.
    /// @return true если ребро новое
    /// @throws std::out_of_range если узла from нет
    bool add_edge(const std::string& from, const std::string& to);

    // Переходы состояний; недопустимый переход - std::logic_error,
    // неизвестный ключ - std::out_of_range
    void mark_reading(std::string_view key);
    void mark_resolved(std::string_view key);
    void mark_unresolved(std::string_view key);

    /// Узел остаётся в графе вместе с уже добавленными рёбрами
    void mark_error(std::string_view key, std::string cause);

    /// @throws std::logic_error при повторной установке
    void set_content(std::string_view key, std::string content);

    void add_raw_reference(std::string_view key, std::string identifier);

    /// Повторное имя для того же узла не добавляется
    void add_unresolved(std::string_view key, const std::string& identifier);

    void add_dynamic_reference(std::string_view key, std::size_t count = 1);
    void add_malformed_reference(std::string_view key, std::size_t count = 1);

    const Node* find(std::string_view key) const;

    /// @throws std::out_of_range если узла нет
    const Node& at(std::string_view key) const;

    bool contains(std::string_view key) const { return find(key) != nullptr; }

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edge_count_; }

    /// Узлы в порядке вставки
    const std::vector<Node>& nodes() const { return nodes_; }

    GraphStatistics statistics() const;

    /// Копия для чтения; содержимое файлов разделяется, не копируется
    GraphSnapshot snapshot() const;

    void clear();

private:
    Node& mutable_at(std::string_view key);

    static void transition(Node& node, NodeState to);

    std::vector<Node> nodes_;
    NodeIndex index_;
    std::size_t edge_count_ = 0;
};

/// Статистика по набору узлов
GraphStatistics compute_statistics(const std::vector<Node>& nodes);

}  // namespace luarestore::graph

#endif  // LUARESTORE_GRAPH_HPP
