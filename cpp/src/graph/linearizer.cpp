// ==============================================================================
// linearizer.cpp - MOD-0010: Поиск циклов и линеаризация
// ==============================================================================
//
// MOD-0010 graph::linearizer
// ADR-0011: детерминизм
//
// Узлы нумеруются по возрастанию ключа, поэтому сравнение индексов
// совпадает со сравнением ключей. Представитель компоненты - её
// наименьший индекс.
//
// ==============================================================================

#include "luarestore/linearizer.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <limits>
#include <queue>
#include <set>

namespace luarestore::graph {

namespace {

constexpr std::size_t kUnvisited = std::numeric_limits<std::size_t>::max();

struct IndexedGraph {
    std::vector<std::string> keys;
    std::vector<std::vector<std::size_t>> adjacency;  // по возрастанию
};

IndexedGraph build_indexed(const GraphSnapshot& snapshot, const std::set<std::string>* subset) {
    IndexedGraph g;
    for (auto& key : snapshot.keys()) {
        if (subset == nullptr || subset->count(key) > 0) {
            g.keys.push_back(std::move(key));
        }
    }

    auto index_of = [&g](const std::string& key) {
        auto it = std::lower_bound(g.keys.begin(), g.keys.end(), key);
        if (it == g.keys.end() || *it != key) {
            return kUnvisited;
        }
        return static_cast<std::size_t>(it - g.keys.begin());
    };

    g.adjacency.resize(g.keys.size());
    for (std::size_t i = 0; i < g.keys.size(); ++i) {
        // std::set отсортирован - смежность тоже
        for (const auto& dep : snapshot.at(g.keys[i]).dependencies) {
            const std::size_t j = index_of(dep);
            if (j != kUnvisited) {
                g.adjacency[i].push_back(j);
            }
        }
    }
    return g;
}

// ----------------------------------------------------------------------------
// Тарьян без рекурсии
// ----------------------------------------------------------------------------

/// @return номер компоненты для каждого узла; компоненты нумеруются
///         в порядке завершения (обратный топологический)
std::vector<std::size_t> strongly_connected(const IndexedGraph& g, std::size_t& component_count) {
    const std::size_t n = g.keys.size();
    std::vector<std::size_t> index(n, kUnvisited);
    std::vector<std::size_t> lowlink(n, 0);
    std::vector<bool> on_stack(n, false);
    std::vector<std::size_t> component(n, kUnvisited);
    std::vector<std::size_t> stack;

    struct Frame {
        std::size_t node;
        std::size_t next_edge;
    };
    std::vector<Frame> call_stack;

    std::size_t counter = 0;
    component_count = 0;

    for (std::size_t root = 0; root < n; ++root) {
        if (index[root] != kUnvisited) {
            continue;
        }
        call_stack.push_back({root, 0});
        index[root] = lowlink[root] = counter++;
        stack.push_back(root);
        on_stack[root] = true;

        while (!call_stack.empty()) {
            Frame& frame = call_stack.back();
            const std::size_t v = frame.node;

            if (frame.next_edge < g.adjacency[v].size()) {
                const std::size_t w = g.adjacency[v][frame.next_edge++];
                if (index[w] == kUnvisited) {
                    index[w] = lowlink[w] = counter++;
                    stack.push_back(w);
                    on_stack[w] = true;
                    call_stack.push_back({w, 0});
                } else if (on_stack[w]) {
                    lowlink[v] = std::min(lowlink[v], index[w]);
                }
                continue;
            }

            if (lowlink[v] == index[v]) {
                std::size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component[w] = component_count;
                } while (w != v);
                ++component_count;
            }

            call_stack.pop_back();
            if (!call_stack.empty()) {
                const std::size_t parent = call_stack.back().node;
                lowlink[parent] = std::min(lowlink[parent], lowlink[v]);
            }
        }
    }
    return component;
}

/// BFS внутри группы от её наименьшего участника
std::vector<std::string> shortest_cycle(const IndexedGraph& g,
                                        const std::vector<std::size_t>& component,
                                        std::size_t start) {
    const std::size_t group = component[start];
    std::vector<std::size_t> parent(g.keys.size(), kUnvisited);
    std::deque<std::size_t> queue{start};
    parent[start] = start;

    while (!queue.empty()) {
        const std::size_t v = queue.front();
        queue.pop_front();
        for (std::size_t w : g.adjacency[v]) {
            if (component[w] != group) {
                continue;
            }
            if (w == start) {
                std::vector<std::string> path{g.keys[start]};
                for (std::size_t u = v; u != start; u = parent[u]) {
                    path.push_back(g.keys[u]);
                }
                std::reverse(path.begin() + 1, path.end());
                path.push_back(g.keys[start]);
                return path;
            }
            if (parent[w] == kUnvisited) {
                parent[w] = v;
                queue.push_back(w);
            }
        }
    }
    return {};
}

Linearization linearize_indexed(const IndexedGraph& g) {
    Linearization result;
    const std::size_t n = g.keys.size();
    if (n == 0) {
        return result;
    }

    std::size_t component_count = 0;
    const std::vector<std::size_t> component = strongly_connected(g, component_count);

    // Участники компонент по возрастанию индекса
    std::vector<std::vector<std::size_t>> members(component_count);
    for (std::size_t v = 0; v < n; ++v) {
        members[component[v]].push_back(v);
    }

    // Конденсация: remaining[c] - число различных компонент-зависимостей c,
    // dependents[c] - компоненты, зависящие от c
    std::vector<std::set<std::size_t>> condensed(component_count);
    std::vector<std::vector<std::size_t>> dependents(component_count);
    std::vector<std::size_t> remaining(component_count, 0);
    std::vector<bool> cyclic(component_count, false);

    for (std::size_t v = 0; v < n; ++v) {
        const std::size_t cv = component[v];
        for (std::size_t w : g.adjacency[v]) {
            const std::size_t cw = component[w];
            if (cv == cw) {
                cyclic[cv] = true;
                continue;
            }
            if (condensed[cv].insert(cw).second) {
                dependents[cw].push_back(cv);
                ++remaining[cv];
            }
        }
    }

    // Кан: очередь по представителю (наименьший индекс = наименьший ключ)
    using Entry = std::pair<std::size_t, std::size_t>;  // (представитель, компонента)
    std::priority_queue<Entry, std::vector<Entry>, std::greater<>> ready;
    for (std::size_t c = 0; c < component_count; ++c) {
        if (remaining[c] == 0) {
            ready.emplace(members[c].front(), c);
        }
    }

    result.order.reserve(n);
    while (!ready.empty()) {
        const std::size_t c = ready.top().second;
        ready.pop();
        for (std::size_t v : members[c]) {
            result.order.push_back(g.keys[v]);
        }
        for (std::size_t d : dependents[c]) {
            if (--remaining[d] == 0) {
                ready.emplace(members[d].front(), d);
            }
        }
    }

    // Группы циклов по возрастанию наименьшего участника
    std::vector<std::size_t> cyclic_components;
    for (std::size_t c = 0; c < component_count; ++c) {
        if (cyclic[c]) {
            cyclic_components.push_back(c);
        }
    }
    std::sort(cyclic_components.begin(), cyclic_components.end(),
              [&members](std::size_t a, std::size_t b) {
                  return members[a].front() < members[b].front();
              });

    for (std::size_t c : cyclic_components) {
        CycleGroup group;
        for (std::size_t v : members[c]) {
            group.members.push_back(g.keys[v]);
        }
        group.example_path = shortest_cycle(g, component, members[c].front());
        result.cycles.push_back(std::move(group));
    }
    return result;
}

}  // anonymous namespace

bool Linearization::is_in_cycle(std::string_view key) const {
    for (const auto& group : cycles) {
        if (std::binary_search(group.members.begin(), group.members.end(), key)) {
            return true;
        }
    }
    return false;
}

Linearization linearize(const GraphSnapshot& snapshot) {
    return linearize_indexed(build_indexed(snapshot, nullptr));
}

Linearization linearize_from(const GraphSnapshot& snapshot, std::string_view start) {
    std::set<std::string> subset = snapshot.transitive_dependencies(start);
    subset.insert(std::string(start));
    return linearize_indexed(build_indexed(snapshot, &subset));
}

}  // namespace luarestore::graph
