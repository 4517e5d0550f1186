// quarry_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/core/error.hpp>
#include <string>
#include <vector>

using namespace quarry_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("QueryError::access_conflict") {
        Error err = QueryError::access_conflict("Position", "exclusive borrow of table 1");
        REQUIRE(err.code() == ErrorCode::Conflict);
        REQUIRE(err.is<QueryError>());
        REQUIRE(err.as<QueryError>()->kind == QueryError::Kind::AccessConflict);
        REQUIRE(err.as<QueryError>()->component == "Position");
        REQUIRE(err.message().find("Position") != std::string::npos);
    }

    SECTION("QueryError::duplicate_entity") {
        Error err = QueryError::duplicate_entity("3v0");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.as<QueryError>()->entity == "3v0");
    }

    SECTION("QueryError::structural_change") {
        Error err = QueryError::structural_change("spawn an entity");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message().find("spawn an entity") != std::string::npos);
    }

    SECTION("QueryError::invalid_query") {
        Error err = QueryError::invalid_query("Velocity", "written twice");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
    }

    SECTION("TaskPoolError::not_initialized") {
        Error err = TaskPoolError::not_initialized("ComputeTaskPool");
        REQUIRE(err.code() == ErrorCode::NotInitialized);
        REQUIRE(err.message().find("ComputeTaskPool::init()") != std::string::npos);
        REQUIRE_FALSE(err.is<QueryError>());
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = QueryError::duplicate_entity("7v1");
    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[AlreadyExists]") != std::string::npos);
    REQUIRE(chain.find("[QueryError]") != std::string::npos);
    REQUIRE(chain.find("7v1") != std::string::npos);
}

// =============================================================================
// UsageError Tests
// =============================================================================

TEST_CASE("fail_usage throws UsageError", "[core][error]") {
    std::uint64_t before = debug::total_error_count();

    try {
        fail_usage(TaskPoolError::not_initialized("ComputeTaskPool"));
        FAIL("fail_usage returned");
    } catch (const UsageError& e) {
        REQUIRE(e.code() == ErrorCode::NotInitialized);
        REQUIRE(e.error().is<TaskPoolError>());
        REQUIRE(std::string(e.what()).find("ComputeTaskPool") != std::string::npos);
    }

    REQUIRE(debug::total_error_count() == before + 1);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with message") {
        Result<int> r = Err<int>(Error("Something failed"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "Something failed");
    }

    SECTION("Err with query error") {
        Result<int> r = Err<int>(QueryError::duplicate_entity("1v0"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::AlreadyExists);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("move value out") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        std::vector<int> v = std::move(r).value();
        REQUIRE(v.size() == 3);
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map on Err keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "gone"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }

    SECTION("and_then on Ok") {
        Result<int> r = Ok(42);
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.value() == "42");
    }
}
