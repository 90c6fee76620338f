// ==============================================================================
// luarestore/linearizer.hpp - MOD-0010: Поиск циклов и линеаризация
// ==============================================================================
//
// MOD-0010 graph::linearizer
// ADR-0011: детерминизм (при равенстве - лексикографический порядок ключей)
//
// Назначение:
// - Компоненты сильной связности (Тарьян, итеративно)
// - Граф конденсации, алгоритм Кана с очередью по минимальному ключу
// - Зависимость всегда раньше зависимого (вне групп циклов)
// - Для каждой группы цикла - пример пути цикла для отчёта
//
// ==============================================================================

#ifndef LUARESTORE_LINEARIZER_HPP
#define LUARESTORE_LINEARIZER_HPP

#include "luarestore/graph.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace luarestore::graph {

// ----------------------------------------------------------------------------
// CycleGroup
// ----------------------------------------------------------------------------

struct CycleGroup {
    /// Участники по возрастанию ключа
    std::vector<std::string> members;

    /// Кратчайший цикл от members.front() обратно к нему же:
    /// {A, B, A} для A <-> B, {A, A} для петли
    std::vector<std::string> example_path;
};

// ----------------------------------------------------------------------------
// Linearization
// ----------------------------------------------------------------------------

struct Linearization {
    /// Порядок обработки; каждый ключ ровно один раз
    std::vector<std::string> order;

    /// Группы циклов по возрастанию наименьшего участника
    std::vector<CycleGroup> cycles;

    bool is_in_cycle(std::string_view key) const;
};

/// Линеаризация всего снимка
Linearization linearize(const GraphSnapshot& snapshot);

/// Линеаризация start и всех его транзитивных зависимостей
/// @throws std::out_of_range если узла start нет
Linearization linearize_from(const GraphSnapshot& snapshot, std::string_view start);

}  // namespace luarestore::graph

#endif  // LUARESTORE_LINEARIZER_HPP
