#include <catch2/catch_test_macros.hpp>

#include "core/types/ScanError.hpp"

#include <stdexcept>
#include <string>

using namespace portsweep::core;

TEST_CASE("ScanError", "[ScanError]") {
    SECTION("Carries code and message") {
        ScanError error(ErrorCode::InvalidPortSpec, "bad token 'abc'");
        REQUIRE(error.code() == ErrorCode::InvalidPortSpec);
        REQUIRE(std::string(error.what()) == "bad token 'abc'");
    }

    SECTION("Is a std::runtime_error") {
        REQUIRE_THROWS_AS(throw ScanError(ErrorCode::EmptyTargetSpec, "none"), std::runtime_error);
    }

    SECTION("Usage errors exit with status 2") {
        REQUIRE(ScanError(ErrorCode::InvalidArgument, "x").exitStatus() == 2);
    }

    SECTION("Other errors exit with status 1") {
        REQUIRE(ScanError(ErrorCode::InvalidTargetSpec, "x").exitStatus() == 1);
        REQUIRE(ScanError(ErrorCode::EmptyPortSpec, "x").exitStatus() == 1);
        REQUIRE(ScanError(ErrorCode::UnsupportedOutputFormat, "x").exitStatus() == 1);
        REQUIRE(ScanError(ErrorCode::OutputWriteFailed, "x").exitStatus() == 1);
    }
}

TEST_CASE("errorCodeToString", "[ScanError]") {
    REQUIRE(errorCodeToString(ErrorCode::InvalidTargetSpec) == "InvalidTargetSpec");
    REQUIRE(errorCodeToString(ErrorCode::EmptyTargetSpec) == "EmptyTargetSpec");
    REQUIRE(errorCodeToString(ErrorCode::InvalidPortSpec) == "InvalidPortSpec");
    REQUIRE(errorCodeToString(ErrorCode::EmptyPortSpec) == "EmptyPortSpec");
    REQUIRE(errorCodeToString(ErrorCode::UnsupportedOutputFormat) == "UnsupportedOutputFormat");
    REQUIRE(errorCodeToString(ErrorCode::OutputWriteFailed) == "OutputWriteFailed");
    REQUIRE(errorCodeToString(ErrorCode::InvalidArgument) == "InvalidArgument");
}
