/**
 * @file run_recorder.cpp
 * @brief RunRecorder implementation.
 */

#include "telemetry/run_recorder.hpp"

#include <sstream>

namespace cut_shoot {

RunRecorder::RunRecorder(Logger& logger) : logger_(logger) {}

void RunRecorder::record(const OptimizationReport& report) {
    std::ostringstream oss;
    oss << R"({"event":"run_finished")"
        << R"(,"pipeline":")" << to_string(report.pipeline) << "\""
        << R"(,"mode":")" << to_string(report.mode) << "\""
        << R"(,"status":")" << to_string(report.status) << "\""
        << R"(,"objective":)" << report.objective
        << R"(,"cuts":)" << report.partition.cut_count
        << R"(,"partitions":)" << report.partition.used_partitions()
        << R"(,"backends":)" << report.allocation.used_backends().size()
        << R"(,"makespan":)" << report.makespan()
        << R"(,"wall_time_s":)" << report.wall_time.count()
        << "}";
    logger_.event(oss.str());
    ++recorded_;
}

void RunRecorder::record_failure(Pipeline pipeline, const Error& error) {
    std::ostringstream oss;
    oss << R"({"event":"run_failed")"
        << R"(,"pipeline":")" << to_string(pipeline) << "\""
        << R"(,"code":")" << to_string(error.code) << "\""
        << R"(,"likely_cause":")" << json_escape(error.likely_cause) << "\""
        << R"(,"message":")" << json_escape(error.message) << "\""
        << "}";
    logger_.event(oss.str());
    ++recorded_;
}

}  // namespace cut_shoot
