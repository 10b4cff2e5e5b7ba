#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

enum class TaskStatus { Pending, Running, Completed, Failed };

std::string_view to_string(TaskStatus status);

struct Task {
    using TimePoint = std::chrono::system_clock::time_point;

    std::string id;
    TaskStatus status = TaskStatus::Pending;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    bool terminal() const { return status == TaskStatus::Completed || status == TaskStatus::Failed; }

    // {"task_id", "status", "created_at", ...} with "result" or "error" once terminal.
    nlohmann::json to_json() const;
};

// Runs each submitted operation on its own thread and keeps its state
// pollable. State moves pending -> running -> completed|failed, once each.
class TaskTracker {
public:
    using Clock = std::function<Task::TimePoint()>;
    using Operation = std::function<std::expected<nlohmann::json, std::string>()>;

    explicit TaskTracker(std::chrono::seconds max_age = std::chrono::hours(1),
                         Clock clock = [] { return std::chrono::system_clock::now(); });
    ~TaskTracker();

    TaskTracker(const TaskTracker&) = delete;
    TaskTracker& operator=(const TaskTracker&) = delete;

    // Returns immediately with the new task id. Terminal tasks older than the
    // configured max age are swept first.
    std::string submit(Operation op);

    std::optional<Task> status(const std::string& id) const;

    // Drops terminal tasks whose completion is older than max_age. Returns
    // the number removed.
    size_t sweep(std::chrono::seconds max_age);
    size_t sweep() { return sweep(max_age_); }

    // Waits for every worker. Used at shutdown.
    void join_all();

    size_t size() const;

private:
    struct Entry {
        Task task;
        std::jthread worker;
    };

    void execute(const std::string& id, const Operation& op);
    void finish(const std::string& id, std::expected<nlohmann::json, std::string> outcome);

    std::chrono::seconds max_age_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> tasks_;
};
