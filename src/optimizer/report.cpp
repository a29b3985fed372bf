/**
 * @file report.cpp
 * @brief OptimizationReport JSON serialization.
 */

#include "optimizer/report.hpp"

#include "core/logger.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace cut_shoot {

namespace {

template <typename T>
void write_list(std::ostringstream& oss, const std::vector<T>& values) {
    oss << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) oss << ",";
        oss << values[i];
    }
    oss << "]";
}

}  // anonymous namespace

std::string OptimizationReport::to_json() const {
    std::ostringstream oss;
    oss << std::setprecision(std::numeric_limits<double>::max_digits10);
    oss << "{\n"
        << R"(  "pipeline": ")" << to_string(pipeline) << "\",\n"
        << R"(  "objective_mode": ")" << to_string(mode) << "\",\n"
        << R"(  "status": ")" << to_string(status) << "\",\n"
        << R"(  "objective": )" << objective << ",\n"
        << R"(  "makespan": )" << allocation.makespan << ",\n"
        << R"(  "qos_penalty": )" << allocation.qos_penalty << ",\n"
        << R"(  "postprocessing_time": )" << allocation.postprocessing_time << ",\n"
        << R"(  "wall_time_s": )" << wall_time.count() << ",\n"
        << R"(  "cut_count": )" << partition.cut_count << ",\n";

    oss << R"(  "partition_assignment": )";
    write_list(oss, partition.assignment);
    oss << ",\n";

    oss << R"(  "cut_edges": [)";
    for (size_t i = 0; i < partition.cut_edges.size(); ++i) {
        const auto& cut = partition.cut_edges[i];
        if (i > 0) oss << ",";
        oss << R"({"edge":)" << cut.edge << R"(,"partition":)" << cut.partition << "}";
    }
    oss << "],\n";

    // Only partitions that own vertices are reported, matched in order
    // with the allocation entries.
    oss << R"(  "partitions": [)";
    size_t slot = 0;
    for (uint32_t c = 0; c < partition.vertices.size(); ++c) {
        if (partition.vertices[c].empty()) continue;
        const auto& agg = partition.aggregates[c];
        oss << (slot > 0 ? ",\n" : "\n")
            << R"(    {"id":)" << c
            << R"(,"vertices":)";
        write_list(oss, partition.vertices[c]);
        oss << R"(,"a":)" << agg.a
            << R"(,"p":)" << agg.p
            << R"(,"o":)" << agg.o
            << R"(,"f":)" << agg.f
            << R"(,"d":)" << agg.d
            << R"(,"cuts":{"in":)";
        write_list(oss, partition.cut_in[c]);
        oss << R"(,"out":)";
        write_list(oss, partition.cut_out[c]);
        oss << "}";

        oss << R"(,"shots":{)";
        if (slot < allocation.partitions.size()) {
            const auto& shots = allocation.partitions[slot];
            for (size_t i = 0; i < shots.size(); ++i) {
                if (i > 0) oss << ",";
                oss << "\"" << json_escape(shots[i].backend_id) << "\":" << shots[i].shots;
            }
        }
        oss << "}}";
        ++slot;
    }
    oss << (slot > 0 ? "\n  ]\n" : "]\n") << "}\n";
    return oss.str();
}

}  // namespace cut_shoot
