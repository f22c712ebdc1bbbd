#include <catch2/catch_test_macros.hpp>

#include "core/types/ProbeTask.hpp"

#include <algorithm>
#include <vector>

using namespace portsweep::core;

TEST_CASE("ProbeTask formatting and ordering", "[ProbeTask]") {
    SECTION("toString joins host and port") {
        ProbeTask task{"10.0.0.1", 22};
        REQUIRE(task.toString() == "10.0.0.1:22");
    }

    SECTION("Orders by host, then numerically by port") {
        std::vector<ProbeTask> tasks{{"10.0.0.2", 22}, {"10.0.0.1", 443}, {"10.0.0.1", 80}};
        std::sort(tasks.begin(), tasks.end());

        REQUIRE(tasks[0] == ProbeTask{"10.0.0.1", 80});
        REQUIRE(tasks[1] == ProbeTask{"10.0.0.1", 443});
        REQUIRE(tasks[2] == ProbeTask{"10.0.0.2", 22});
    }

    SECTION("Hosts compare as strings") {
        REQUIRE(ProbeTask{"10.0.0.10", 1} < ProbeTask{"10.0.0.9", 1});
    }
}

TEST_CASE("ProbeResult", "[ProbeTask]") {
    SECTION("Default outcome is NotOpen") {
        ProbeResult result;
        REQUIRE_FALSE(result.isOpen());
        REQUIRE(result.outcome == ProbeOutcome::NotOpen);
    }

    SECTION("isOpen reflects the outcome") {
        ProbeResult result{{"example.com", 443}, ProbeOutcome::Open};
        REQUIRE(result.isOpen());
    }

    SECTION("outcomeToString") {
        REQUIRE(ProbeResult::outcomeToString(ProbeOutcome::Open) == "Open");
        REQUIRE(ProbeResult::outcomeToString(ProbeOutcome::NotOpen) == "NotOpen");
    }
}

TEST_CASE("ServiceDetector", "[ProbeTask]") {
    SECTION("Known ports") {
        REQUIRE(ServiceDetector::detectService(22) == "ssh");
        REQUIRE(ServiceDetector::detectService(80) == "http");
        REQUIRE(ServiceDetector::detectService(443) == "https");
        REQUIRE(ServiceDetector::detectService(6379) == "redis");
    }

    SECTION("Unknown port returns empty string") {
        REQUIRE(ServiceDetector::detectService(12345).empty());
    }

    SECTION("Alternate web ports share a name") {
        REQUIRE(ServiceDetector::detectService(8000) == "http-alt");
        REQUIRE(ServiceDetector::detectService(8080) == "http-alt");
        REQUIRE(ServiceDetector::detectService(3306) == "mysql");
    }
}
