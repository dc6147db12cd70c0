/**
 * @file json_sink.hpp
 * @brief Log sinks: rotating NDJSON files, stdout, null.
 */

#pragma once

#include "core/logger.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace tracie {

/**
 * @brief Writes one line per record to `<log_dir>/<prefix>.ndjson`.
 *
 * When the file exceeds max_file_size_mb it is shifted to `<prefix>.1.ndjson`
 * (older files to .2, .3, ...), keeping at most max_files rotated files.
 */
class JsonFileSink : public ILogSink {
public:
    JsonFileSink(const std::filesystem::path& log_dir,
                 const std::string& prefix,
                 uint32_t max_file_size_mb = 50,
                 uint32_t max_files = 5);
    ~JsonFileSink() override;

    void write(std::string_view line) override;
    void flush() override;

    [[nodiscard]] std::filesystem::path current_path() const;
    [[nodiscard]] bool is_open() const noexcept { return current_file_.is_open(); }

private:
    void rotate_if_needed();
    [[nodiscard]] std::filesystem::path rotated_path(uint32_t index) const;

    std::filesystem::path log_dir_;
    std::string prefix_;
    uint64_t max_file_size_bytes_;
    uint32_t max_files_;
    std::ofstream current_file_;
    size_t current_size_{0};
};

/**
 * @brief Writes to stdout — console output of the CLIs.
 */
class StdoutSink : public ILogSink {
public:
    void write(std::string_view line) override;
    void flush() override;
};

/**
 * @brief Discards all output — used when events are disabled and in tests.
 */
class NullSink : public ILogSink {
public:
    void write(std::string_view /*line*/) override {}
    void flush() override {}
};

}  // namespace tracie
