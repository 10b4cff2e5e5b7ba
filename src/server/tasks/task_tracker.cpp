#include "task_tracker.hpp"

#include "../log.hpp"
#include "../util/uuid.hpp"

#include <exception>
#include <vector>

using json = nlohmann::json;

namespace {

double epoch_seconds(Task::TimePoint tp) {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

} // namespace

std::string_view to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

json Task::to_json() const {
    json j = {
        {"task_id", id},
        {"status", to_string(status)},
        {"created_at", epoch_seconds(created_at)},
        {"started_at", started_at ? json(epoch_seconds(*started_at)) : json(nullptr)},
        {"completed_at", completed_at ? json(epoch_seconds(*completed_at)) : json(nullptr)},
    };
    if (status == TaskStatus::Completed && result) j["result"] = *result;
    if (status == TaskStatus::Failed) j["error"] = error.value_or("unknown error");
    return j;
}

TaskTracker::TaskTracker(std::chrono::seconds max_age, Clock clock)
    : max_age_(max_age), clock_(std::move(clock)) {}

TaskTracker::~TaskTracker() {
    join_all();
}

std::string TaskTracker::submit(Operation op) {
    sweep();

    auto id = generate_uuid();
    std::lock_guard lock(mutex_);
    auto& entry = tasks_[id];
    entry.task = Task{.id = id, .status = TaskStatus::Pending, .created_at = clock_()};
    // The worker blocks on mutex_ until this entry is fully set up
    entry.worker = std::jthread([this, id, op = std::move(op)](std::stop_token) {
        execute(id, op);
    });
    logging::info("tasks", "submitted {}", id);
    return id;
}

void TaskTracker::execute(const std::string& id, const Operation& op) {
    {
        std::lock_guard lock(mutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) return;
        it->second.task.status = TaskStatus::Running;
        it->second.task.started_at = clock_();
    }

    std::expected<json, std::string> outcome;
    try {
        outcome = op();
    } catch (const std::exception& e) {
        outcome = std::unexpected(std::string(e.what()));
    } catch (...) {
        outcome = std::unexpected(std::string("unknown error"));
    }
    finish(id, std::move(outcome));
}

void TaskTracker::finish(const std::string& id, std::expected<json, std::string> outcome) {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return;

    auto& task = it->second.task;
    task.completed_at = clock_();
    if (outcome) {
        task.status = TaskStatus::Completed;
        task.result = std::move(*outcome);
        logging::info("tasks", "{} completed", id);
    } else {
        task.status = TaskStatus::Failed;
        task.error = std::move(outcome.error());
        logging::warn("tasks", "{} failed: {}", id, *task.error);
    }
}

std::optional<Task> TaskTracker::status(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = tasks_.find(id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second.task;
}

size_t TaskTracker::sweep(std::chrono::seconds max_age) {
    std::vector<std::jthread> finished;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_();
        for (auto it = tasks_.begin(); it != tasks_.end();) {
            const auto& task = it->second.task;
            if (task.terminal() && task.completed_at && now - *task.completed_at > max_age) {
                finished.push_back(std::move(it->second.worker));
                it = tasks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    if (!finished.empty()) logging::debug("tasks", "swept {} tasks", finished.size());
    // jthread destructors join outside the lock
    return finished.size();
}

void TaskTracker::join_all() {
    std::vector<std::jthread> workers;
    {
        std::lock_guard lock(mutex_);
        for (auto& [id, entry] : tasks_) {
            if (entry.worker.joinable()) workers.push_back(std::move(entry.worker));
        }
    }
    for (auto& w : workers) w.join();
}

size_t TaskTracker::size() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}
