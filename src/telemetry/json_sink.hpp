/**
 * @file json_sink.hpp
 * @brief NDJSON log sinks: rotating file, stdout, tee and null.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>

namespace lanwake {

/**
 * @brief Writes NDJSON to size-rotated log files.
 *
 * The active file is `<dir>/<prefix>.ndjson`. When it grows past the size
 * limit it is renamed to `<prefix>.1.ndjson`, older generations shift up by
 * one, and anything beyond `max_files` generations is deleted.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 100,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view json_line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t generation) const;

    /// Test hook: rotate at a byte threshold below one megabyte.
    void set_max_file_size_bytes(uint64_t bytes) noexcept { max_file_size_bytes_ = bytes; }

private:
    void rotate_if_needed();
    void open_current();

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    uint64_t current_size_{0};
};

/**
 * @brief Writes to stdout.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view json_line) override;
    void flush() override;
};

/**
 * @brief Duplicates every record to two sinks (log_output = "both").
 */
class TeeSink : public ILogSink {
public:
    TeeSink(std::unique_ptr<ILogSink> first, std::unique_ptr<ILogSink> second);

    void write(std::string_view json_line) override;
    void flush() override;

private:
    std::unique_ptr<ILogSink> first_;
    std::unique_ptr<ILogSink> second_;
};

/**
 * @brief Discards all output. Used by tests.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*json_line*/) override {}
    void flush() override {}
};

}  // namespace lanwake
