// ==============================================================================
// report.cpp - MOD-0012: План восстановления и сводка
// ==============================================================================

#include "luarestore/report.hpp"

#include "luarestore/output.hpp"
#include "luarestore/platform.hpp"
#include "luarestore/resolver.hpp"

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <cstdint>
#include <cstdio>

namespace luarestore::report {

namespace {

using Allocator = rapidjson::Document::AllocatorType;

rapidjson::Value string_value(const std::string& s, Allocator& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

rapidjson::Value string_array(const std::vector<std::string>& items, Allocator& alloc) {
    rapidjson::Value arr(rapidjson::kArrayType);
    for (const auto& item : items) {
        arr.PushBack(string_value(item, alloc), alloc);
    }
    return arr;
}

std::string format_average(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

}  // anonymous namespace

RestorationPlan build_plan(const graph::GraphSnapshot& snapshot,
                           const graph::Linearization& linearization,
                           const resolve::PathResolver* resolver) {
    RestorationPlan plan;
    plan.cycles = linearization.cycles;
    plan.statistics = snapshot.statistics();

    plan.records.reserve(linearization.order.size());
    for (const auto& key : linearization.order) {
        const graph::Node& node = snapshot.at(key);
        const auto path = platform::path_from_utf8(key);

        RestorationRecord record;
        record.key = key;
        record.module = resolver != nullptr ? resolver->module_name_for(path)
                                            : platform::path_to_utf8(path.filename());
        record.state = node.state;
        if (node.content) {
            record.content = *node.content;
        }
        record.dependencies.assign(node.dependencies.begin(), node.dependencies.end());
        record.unresolved = node.unresolved;
        record.in_cycle = linearization.is_in_cycle(key);
        plan.records.push_back(std::move(record));
    }
    return plan;
}

void plan_to_json(const RestorationPlan& plan, rapidjson::Document& doc) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    rapidjson::Value order(rapidjson::kArrayType);
    for (const auto& record : plan.records) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("key", string_value(record.key, alloc), alloc);
        entry.AddMember("module", string_value(record.module, alloc), alloc);
        entry.AddMember("state", rapidjson::StringRef(graph::node_state_to_string(record.state)),
                        alloc);
        entry.AddMember("content", string_value(record.content, alloc), alloc);
        entry.AddMember("dependencies", string_array(record.dependencies, alloc), alloc);
        entry.AddMember("unresolved", string_array(record.unresolved, alloc), alloc);
        entry.AddMember("in_cycle", record.in_cycle, alloc);
        order.PushBack(entry, alloc);
    }
    doc.AddMember("order", order, alloc);

    rapidjson::Value cycles(rapidjson::kArrayType);
    for (const auto& group : plan.cycles) {
        rapidjson::Value entry(rapidjson::kObjectType);
        entry.AddMember("members", string_array(group.members, alloc), alloc);
        entry.AddMember("example_path", string_array(group.example_path, alloc), alloc);
        cycles.PushBack(entry, alloc);
    }
    doc.AddMember("cycles", cycles, alloc);

    const auto& s = plan.statistics;
    rapidjson::Value stats(rapidjson::kObjectType);
    stats.AddMember("total_nodes", static_cast<uint64_t>(s.total_nodes), alloc);
    stats.AddMember("total_edges", static_cast<uint64_t>(s.total_edges), alloc);
    stats.AddMember("unresolved_references", static_cast<uint64_t>(s.unresolved_references), alloc);
    stats.AddMember("dynamic_references", static_cast<uint64_t>(s.dynamic_references), alloc);
    stats.AddMember("malformed_references", static_cast<uint64_t>(s.malformed_references), alloc);
    stats.AddMember("error_nodes", static_cast<uint64_t>(s.error_nodes), alloc);
    stats.AddMember("unresolved_nodes", static_cast<uint64_t>(s.unresolved_nodes), alloc);
    stats.AddMember("cycle_groups", static_cast<uint64_t>(plan.cycles.size()), alloc);
    stats.AddMember("max_dependencies", static_cast<uint64_t>(s.max_dependencies), alloc);
    stats.AddMember("min_dependencies", static_cast<uint64_t>(s.min_dependencies), alloc);
    stats.AddMember("avg_dependencies", s.avg_dependencies, alloc);
    doc.AddMember("statistics", stats, alloc);
}

std::string plan_to_json_string(const RestorationPlan& plan, bool pretty) {
    rapidjson::Document doc;
    plan_to_json(plan, doc);

    rapidjson::StringBuffer buffer;
    if (pretty) {
        rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
        writer.SetIndent(' ', 2);
        doc.Accept(writer);
    } else {
        rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
        doc.Accept(writer);
    }
    return std::string(buffer.GetString(), buffer.GetSize());
}

void print_summary(output::Writer& writer, const RestorationPlan& plan) {
    const auto& s = plan.statistics;

    output::Table table;
    table.set_headers({"metric", "value"});
    table.add_row({"files", std::to_string(s.total_nodes)});
    table.add_row({"dependencies", std::to_string(s.total_edges)});
    table.add_row({"unresolved references", std::to_string(s.unresolved_references)});
    table.add_row({"dynamic references", std::to_string(s.dynamic_references)});
    table.add_row({"malformed references", std::to_string(s.malformed_references)});
    table.add_row({"read errors", std::to_string(s.error_nodes)});
    table.add_row({"not expanded (max depth)", std::to_string(s.unresolved_nodes)});
    table.add_row({"cycle groups", std::to_string(plan.cycles.size())});
    table.add_row({"max dependencies", std::to_string(s.max_dependencies)});
    table.add_row({"min dependencies", std::to_string(s.min_dependencies)});
    table.add_row({"avg dependencies", format_average(s.avg_dependencies)});
    table.print(writer);

    for (const auto& group : plan.cycles) {
        std::string path;
        for (const auto& key : group.example_path) {
            if (!path.empty()) {
                path += " -> ";
            }
            path += key;
        }
        writer.warn("circular dependency (" + std::to_string(group.members.size()) +
                    " files): " + path);
    }
}

}  // namespace luarestore::report
