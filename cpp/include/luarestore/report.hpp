// ==============================================================================
// luarestore/report.hpp - MOD-0012: План восстановления и сводка
// ==============================================================================
//
// MOD-0012 report
//
// Назначение:
// - План: упорядоченные записи {ключ, модуль, содержимое, зависимости}
//   и список групп циклов - вход внешнего этапа восстановления
// - JSON плана (RapidJSON)
// - Сводная таблица и предупреждения о циклах в stderr
//
// ==============================================================================

#ifndef LUARESTORE_REPORT_HPP
#define LUARESTORE_REPORT_HPP

#include "luarestore/graph.hpp"
#include "luarestore/linearizer.hpp"

#include <rapidjson/document.h>

#include <string>
#include <vector>

namespace luarestore::resolve {
class PathResolver;
}

namespace luarestore::output {
class Writer;
}

namespace luarestore::report {

struct RestorationRecord {
    std::string key;
    std::string module;
    graph::NodeState state = graph::NodeState::Discovered;

    /// Пусто для узлов без прочитанного содержимого
    std::string content;

    std::vector<std::string> dependencies;
    std::vector<std::string> unresolved;
    bool in_cycle = false;
};

struct RestorationPlan {
    /// В порядке линеаризации
    std::vector<RestorationRecord> records;
    std::vector<graph::CycleGroup> cycles;
    graph::GraphStatistics statistics;
};

/// Собрать план. resolver (необязательный) даёт имена модулей; без него - имя файла.
/// @throws std::out_of_range если порядок ссылается на ключ вне снимка
RestorationPlan build_plan(const graph::GraphSnapshot& snapshot,
                           const graph::Linearization& linearization,
                           const resolve::PathResolver* resolver = nullptr);

/// {"order": [...], "cycles": [...], "statistics": {...}}
void plan_to_json(const RestorationPlan& plan, rapidjson::Document& doc);

std::string plan_to_json_string(const RestorationPlan& plan, bool pretty);

/// Таблица статистики и по одному предупреждению на группу цикла
void print_summary(output::Writer& writer, const RestorationPlan& plan);

}  // namespace luarestore::report

#endif  // LUARESTORE_REPORT_HPP
