/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, console stream, memory and null.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace cut_shoot {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<prefix>.ndjson`; on rotation it is renamed to
 * `<prefix>.1.ndjson`, older files shift up and anything beyond
 * `max_files` is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t generation) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to a console stream, stdout unless told otherwise.
 *
 * The CLI points it at stderr when the report itself goes to stdout.
 */
class StreamSink : public ILogSink {
public:
    explicit StreamSink(std::ostream& out = std::cout) : out_(out) {}

    void write(std::string_view json_line) override;
    void flush() override;

private:
    std::ostream& out_;
};

/**
 * @brief Keeps every line in memory; used by tests to inspect output.
 */
class MemorySink : public ILogSink {
public:
    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

    [[nodiscard]] const std::vector<std::string>& lines() const noexcept { return lines_; }

private:
    std::vector<std::string> lines_;
};

/**
 * @brief Discards all output for benchmarking.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace cut_shoot
