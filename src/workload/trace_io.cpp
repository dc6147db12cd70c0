/**
 * @file trace_io.cpp
 * @brief Trace CSV writer and validating loader.
 */

#include "workload/trace_io.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <fstream>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace tracie {

namespace {

constexpr std::string_view kJobsHeader = "job_id,arrival_time_sec,job_type,app_type,task_count";
constexpr std::string_view kTasksHeader = "job_id,task_arrival_timestamps_within_job";

Error trace_error(std::string message) {
    return Error{ErrorCode::TraceFileError, std::move(message)};
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    return s;
}

template <typename T>
std::optional<T> parse_number(std::string_view text) {
    text = trim(text);
    if (text.empty()) return std::nullopt;
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

bool is_blank(std::string_view line) {
    return trim(line).empty();
}

/**
 * @brief Column positions of the jobs table, resolved from its header.
 */
struct JobColumns {
    size_t job_id;
    size_t arrival;
    size_t job_type;
    size_t app_type;
    size_t task_count;
    size_t width;
};

Result<JobColumns> resolve_job_columns(const std::vector<std::string>& header,
                                       const std::filesystem::path& path) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < header.size(); ++i) {
        index.emplace(std::string{trim(header[i])}, i);
    }

    auto column = [&](const char* name) -> std::optional<size_t> {
        auto it = index.find(name);
        if (it == index.end()) return std::nullopt;
        return it->second;
    };

    auto id = column("job_id");
    auto arrival = column("arrival_time_sec");
    auto type = column("job_type");
    auto app = column("app_type");
    auto count = column("task_count");
    if (!id || !arrival || !type || !app || !count) {
        return trace_error(std::format("{}: header must contain the columns {}",
                                       path.string(), kJobsHeader));
    }
    return JobColumns{*id, *arrival, *type, *app, *count, header.size()};
}

Result<std::vector<JobRecord>> read_jobs(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return trace_error("Jobs file not found: " + path.string());
    }

    std::string line;
    if (!std::getline(in, line)) {
        return trace_error("Jobs file is empty: " + path.string());
    }
    auto columns = resolve_job_columns(split_csv_line(line), path);
    if (!columns) {
        return columns.error();
    }

    std::vector<JobRecord> jobs;
    std::unordered_set<JobId> seen;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) continue;

        auto fields = split_csv_line(line);
        if (fields.size() < columns->width) {
            return trace_error(std::format("{}:{}: expected {} fields, got {}",
                                           path.string(), line_no, columns->width, fields.size()));
        }

        auto id = parse_number<JobId>(fields[columns->job_id]);
        auto arrival = parse_number<double>(fields[columns->arrival]);
        auto job_class = parse_job_class(trim(fields[columns->job_type]));
        auto count = parse_number<uint32_t>(fields[columns->task_count]);

        if (!id) {
            return trace_error(std::format("{}:{}: bad job_id '{}'",
                                           path.string(), line_no, fields[columns->job_id]));
        }
        if (!arrival || !std::isfinite(*arrival) || *arrival < 0.0) {
            return trace_error(std::format("{}:{}: bad arrival_time_sec '{}'",
                                           path.string(), line_no, fields[columns->arrival]));
        }
        if (!job_class) {
            return trace_error(std::format("{}:{}: unknown job_type '{}' (expected B or UF)",
                                           path.string(), line_no, fields[columns->job_type]));
        }
        if (!count || *count < 1) {
            return trace_error(std::format("{}:{}: task_count must be an integer >= 1, got '{}'",
                                           path.string(), line_no, fields[columns->task_count]));
        }
        if (!seen.insert(*id).second) {
            return trace_error(std::format("{}:{}: duplicate job_id {}", path.string(), line_no, *id));
        }

        jobs.push_back(JobRecord{
            .job_id = *id,
            .arrival_time_sec = *arrival,
            .job_class = *job_class,
            .app_type = std::string{trim(fields[columns->app_type])},
            .task_count = *count
        });
    }
    return jobs;
}

Result<TaskArrivalTable> read_tasks(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return trace_error("Tasks file not found: " + path.string());
    }

    std::string line;
    if (!std::getline(in, line)) {
        return trace_error("Tasks file is empty: " + path.string());
    }
    auto header = split_csv_line(line);
    if (header.empty() || trim(header[0]) != "job_id") {
        return trace_error(std::format("{}: first column must be job_id", path.string()));
    }

    TaskArrivalTable table;
    size_t line_no = 1;
    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) continue;

        auto fields = split_csv_line(line);
        auto id = parse_number<JobId>(fields[0]);
        if (!id) {
            return trace_error(std::format("{}:{}: bad job_id '{}'", path.string(), line_no, fields[0]));
        }

        TaskOffsets offsets;
        offsets.reserve(fields.size() - 1);
        for (size_t i = 1; i < fields.size(); ++i) {
            auto offset = parse_number<double>(fields[i]);
            if (!offset || !std::isfinite(*offset) || *offset < 0.0) {
                return trace_error(std::format("{}:{}: bad task offset '{}'",
                                               path.string(), line_no, fields[i]));
            }
            if (!offsets.empty() && *offset < offsets.back()) {
                return trace_error(std::format("{}:{}: task offsets of job {} are not sorted",
                                               path.string(), line_no, *id));
            }
            offsets.push_back(*offset);
        }

        if (!table.emplace(*id, std::move(offsets)).second) {
            return trace_error(std::format("{}:{}: duplicate job_id {}", path.string(), line_no, *id));
        }
    }
    return table;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// CSV helpers
// ─────────────────────────────────────────────

std::vector<std::string> split_csv_line(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::vector<std::string> fields;
    std::string current;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                current += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(std::move(current));
    return fields;
}

std::string csv_field(std::string_view value) {
    if (value.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{value};
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string format_seconds(double seconds) {
    return std::format("{}", seconds);
}

void sort_by_arrival(std::vector<JobRecord>& jobs) {
    std::sort(jobs.begin(), jobs.end(), [](const JobRecord& a, const JobRecord& b) {
        if (a.arrival_time_sec != b.arrival_time_sec) return a.arrival_time_sec < b.arrival_time_sec;
        return a.job_id < b.job_id;
    });
}

// ─────────────────────────────────────────────
// Writing
// ─────────────────────────────────────────────

Result<void> write_trace(const std::vector<GeneratedJob>& jobs,
                         const std::filesystem::path& jobs_path,
                         const std::filesystem::path& tasks_path) {
    std::vector<JobRecord> records;
    records.reserve(jobs.size());
    for (const auto& job : jobs) records.push_back(job.record);
    sort_by_arrival(records);

    std::ofstream jobs_out(jobs_path, std::ios::trunc);
    if (!jobs_out.is_open()) {
        return trace_error("Cannot write jobs file: " + jobs_path.string());
    }
    std::ofstream tasks_out(tasks_path, std::ios::trunc);
    if (!tasks_out.is_open()) {
        return trace_error("Cannot write tasks file: " + tasks_path.string());
    }

    jobs_out << kJobsHeader << '\n';
    for (const auto& r : records) {
        jobs_out << r.job_id << ','
                 << format_seconds(r.arrival_time_sec) << ','
                 << to_token(r.job_class) << ','
                 << csv_field(r.app_type) << ','
                 << r.task_count << '\n';
    }

    tasks_out << kTasksHeader << '\n';
    for (const auto& job : jobs) {
        tasks_out << job.record.job_id;
        for (double offset : job.task_offsets) {
            tasks_out << ',' << format_seconds(offset);
        }
        tasks_out << '\n';
    }

    jobs_out.flush();
    tasks_out.flush();
    if (!jobs_out) {
        return trace_error("Failed while writing jobs file: " + jobs_path.string());
    }
    if (!tasks_out) {
        return trace_error("Failed while writing tasks file: " + tasks_path.string());
    }
    return {};
}

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

Result<Trace> load_trace(const std::filesystem::path& jobs_path,
                         const std::filesystem::path& tasks_path) {
    auto jobs = read_jobs(jobs_path);
    if (!jobs) {
        return jobs.error();
    }
    auto tasks = read_tasks(tasks_path);
    if (!tasks) {
        return tasks.error();
    }

    for (const auto& job : *jobs) {
        auto it = tasks->find(job.job_id);
        if (it == tasks->end()) {
            return trace_error(std::format("Job {} has no row in {}", job.job_id, tasks_path.string()));
        }
        if (it->second.size() != job.task_count) {
            return trace_error(std::format("Job {} declares {} tasks but {} lists {} offsets",
                                           job.job_id, job.task_count, tasks_path.string(),
                                           it->second.size()));
        }
    }

    Trace trace{.jobs = std::move(*jobs), .tasks = std::move(*tasks)};
    sort_by_arrival(trace.jobs);
    return trace;
}

}  // namespace tracie
