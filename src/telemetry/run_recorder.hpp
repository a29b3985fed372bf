/**
 * @file run_recorder.hpp
 * @brief One structured NDJSON event per finished optimization run.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "optimizer/report.hpp"

#include <atomic>
#include <string_view>

namespace cut_shoot {

class RunRecorder {
public:
    explicit RunRecorder(Logger& logger);

    void record(const OptimizationReport& report);
    void record_failure(Pipeline pipeline, const Error& error);

    [[nodiscard]] size_t recorded() const noexcept { return recorded_.load(); }

private:
    Logger& logger_;
    std::atomic<size_t> recorded_{0};
};

}  // namespace cut_shoot
