#include <catch2/catch_test_macros.hpp>

#include "cache/ttl_cache.hpp"

#include <chrono>
#include <string>

using namespace std::chrono_literals;

namespace {

struct FakeClock {
    std::chrono::steady_clock::time_point now{};
    TtlCache<std::string, int>::Now fn() {
        return [this] { return now; };
    }
};

} // namespace

TEST_CASE("TtlCache", "[cache]") {
    FakeClock clock;
    TtlCache<std::string, int> cache(10s, clock.fn());

    SECTION("MissOnEmpty") {
        REQUIRE_FALSE(cache.get("a").has_value());
    }

    SECTION("HitWithinTtl") {
        cache.set("a", 1);
        clock.now += 9s;
        REQUIRE(cache.get("a") == 1);
    }

    SECTION("ExpiresAtTtl") {
        cache.set("a", 1);
        clock.now += 10s;
        REQUIRE_FALSE(cache.get("a").has_value());
    }

    SECTION("OverwriteRefreshesTimestamp") {
        cache.set("a", 1);
        clock.now += 8s;
        cache.set("a", 2);
        clock.now += 8s;
        REQUIRE(cache.get("a") == 2);
    }

    SECTION("GetOrComputeCallsOncePerTtl") {
        int calls = 0;
        auto make = [&calls] { return ++calls; };
        REQUIRE(cache.get_or_compute("k", make) == 1);
        REQUIRE(cache.get_or_compute("k", make) == 1);
        clock.now += 11s;
        REQUIRE(cache.get_or_compute("k", make) == 2);
        REQUIRE(calls == 2);
    }

    SECTION("Clear") {
        cache.set("a", 1);
        cache.clear();
        REQUIRE_FALSE(cache.get("a").has_value());
    }
}
