#include <catch2/catch_test_macros.hpp>

#include "tasks/task_tracker.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

std::optional<Task> wait_terminal(const TaskTracker& tracker, const std::string& id) {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (std::chrono::steady_clock::now() < deadline) {
        auto t = tracker.status(id);
        if (!t || t->terminal()) return t;
        std::this_thread::sleep_for(5ms);
    }
    return tracker.status(id);
}

// Wall clock shifted by an adjustable offset.
struct ShiftedClock {
    std::atomic<int64_t> offset_s{0};
    TaskTracker::Clock fn() {
        return [this] { return std::chrono::system_clock::now() + std::chrono::seconds(offset_s.load()); };
    }
};

} // namespace

TEST_CASE("TaskTracker", "[tasks]") {

    SECTION("SubmitDoesNotBlock") {
        TaskTracker tracker;
        std::promise<void> gate;
        auto opened = gate.get_future().share();

        auto start = std::chrono::steady_clock::now();
        auto id = tracker.submit([opened]() -> std::expected<json, std::string> {
            opened.wait();
            return json{{"text", "done"}};
        });
        REQUIRE(std::chrono::steady_clock::now() - start < 1s);

        auto t = tracker.status(id);
        REQUIRE(t.has_value());
        REQUIRE((t->status == TaskStatus::Pending || t->status == TaskStatus::Running));
        REQUIRE_FALSE(t->result.has_value());

        gate.set_value();
        t = wait_terminal(tracker, id);
        REQUIRE(t->status == TaskStatus::Completed);
        REQUIRE((*t->result)["text"] == "done");
        REQUIRE_FALSE(t->error.has_value());
    }

    SECTION("TimestampsAreOrdered") {
        TaskTracker tracker;
        auto id = tracker.submit([]() -> std::expected<json, std::string> { return json::object(); });
        auto t = wait_terminal(tracker, id);
        REQUIRE(t->started_at.has_value());
        REQUIRE(t->completed_at.has_value());
        REQUIRE(t->created_at <= *t->started_at);
        REQUIRE(*t->started_at <= *t->completed_at);
    }

    SECTION("ErrorBecomesFailed") {
        TaskTracker tracker;
        auto id = tracker.submit([]() -> std::expected<json, std::string> {
            return std::unexpected("Error processing audio");
        });
        auto t = wait_terminal(tracker, id);
        REQUIRE(t->status == TaskStatus::Failed);
        REQUIRE(t->error == "Error processing audio");
        REQUIRE_FALSE(t->result.has_value());
    }

    SECTION("ExceptionBecomesFailed") {
        TaskTracker tracker;
        auto id = tracker.submit([]() -> std::expected<json, std::string> {
            throw std::runtime_error("boom");
        });
        auto t = wait_terminal(tracker, id);
        REQUIRE(t->status == TaskStatus::Failed);
        REQUIRE(t->error == "boom");
    }

    SECTION("UnknownId") {
        TaskTracker tracker;
        REQUIRE_FALSE(tracker.status("no-such-task").has_value());
    }

    SECTION("IdsAreUnique") {
        TaskTracker tracker;
        auto op = []() -> std::expected<json, std::string> { return json::object(); };
        REQUIRE(tracker.submit(op) != tracker.submit(op));
    }

    SECTION("SweepRemovesOnlyOldTerminalTasks") {
        ShiftedClock clock;
        TaskTracker tracker(60s, clock.fn());

        std::promise<void> gate;
        auto opened = gate.get_future().share();
        auto done = tracker.submit([]() -> std::expected<json, std::string> { return json::object(); });
        auto blocked = tracker.submit([opened]() -> std::expected<json, std::string> {
            opened.wait();
            return json::object();
        });
        REQUIRE(wait_terminal(tracker, done)->terminal());

        REQUIRE(tracker.sweep() == 0);
        REQUIRE(tracker.status(done).has_value());

        clock.offset_s = 120;
        REQUIRE(tracker.sweep() == 1);
        REQUIRE_FALSE(tracker.status(done).has_value());
        REQUIRE(tracker.status(blocked).has_value());

        gate.set_value();
        REQUIRE(wait_terminal(tracker, blocked)->status == TaskStatus::Completed);
        clock.offset_s = 240;
        REQUIRE(tracker.sweep(0s) == 1);
        REQUIRE(tracker.size() == 0);
    }

    SECTION("SubmitSweepsExpiredTasks") {
        ShiftedClock clock;
        TaskTracker tracker(60s, clock.fn());
        auto old = tracker.submit([]() -> std::expected<json, std::string> { return json::object(); });
        REQUIRE(wait_terminal(tracker, old)->terminal());

        clock.offset_s = 3600;
        tracker.submit([]() -> std::expected<json, std::string> { return json::object(); });
        REQUIRE_FALSE(tracker.status(old).has_value());
    }

    SECTION("StatusJson") {
        TaskTracker tracker;
        auto ok = tracker.submit([]() -> std::expected<json, std::string> { return json{{"text", "hi"}}; });
        auto bad = tracker.submit([]() -> std::expected<json, std::string> { return std::unexpected("nope"); });

        auto ok_json = wait_terminal(tracker, ok)->to_json();
        REQUIRE(ok_json["task_id"] == ok);
        REQUIRE(ok_json["status"] == "completed");
        REQUIRE(ok_json["result"]["text"] == "hi");
        REQUIRE_FALSE(ok_json.contains("error"));

        auto bad_json = wait_terminal(tracker, bad)->to_json();
        REQUIRE(bad_json["status"] == "failed");
        REQUIRE(bad_json["error"] == "nope");
        REQUIRE_FALSE(bad_json.contains("result"));
    }
}
