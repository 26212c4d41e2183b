#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/core/result.hpp>

#include <memory>
#include <string>

using namespace workflow_tracker;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    CHECK_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err holds error", "[result]") {
    auto r = Result<int, std::string>::Err("boom");
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "boom");
    CHECK(r.ValueOr(7) == 7);
}

TEST_CASE("Result: AndThen chains and short-circuits", "[result]") {
    auto half = [](int v) {
        if (v % 2 != 0) {
            return Result<int, std::string>::Err("odd");
        }
        return Result<int, std::string>::Ok(v / 2);
    };

    auto ok = Result<int, std::string>::Ok(8).AndThen(half).AndThen(half);
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 2);

    auto stopped = Result<int, std::string>::Ok(6).AndThen(half).AndThen(half);
    REQUIRE(stopped.IsErr());
    CHECK(stopped.Error() == "odd");
}

TEST_CASE("Result: Map changes type and passes Err through", "[result]") {
    auto mapped = Result<int, std::string>::Ok(3).Map([](int v) { return std::to_string(v); });
    REQUIRE(mapped.IsOk());
    CHECK(mapped.Value() == "3");

    auto err = Result<int, std::string>::Err("bad").Map([](int v) { return v * 2; });
    CHECK(err.IsErr());
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 5);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, std::string>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, std::string>::Err("nope");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "nope");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString with path and detail", "[error]") {
    Error e{"ScanFile", "/repo/a.cs", "scanner failed", std::string("regex too complex"),
            ErrorCategory::Scan};
    CHECK(e.ToString() == "ScanFile [/repo/a.cs]: scanner failed (regex too complex)");
}

TEST_CASE("Error: ToString without optional parts", "[error]") {
    Error e{"ConfigLoader", "", "missing repository", std::nullopt,
            ErrorCategory::Configuration};
    CHECK(e.ToString() == "ConfigLoader: missing repository");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"Op", "", "msg", std::nullopt};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: ExitCode mapping", "[error]") {
    auto code = [](ErrorCategory c) { return Error{"", "", "", std::nullopt, c}.ExitCode(); };
    CHECK(code(ErrorCategory::Configuration) == 2);
    CHECK(code(ErrorCategory::InvalidRepository) == 2);
    CHECK(code(ErrorCategory::Output) == 3);
    CHECK(code(ErrorCategory::FileRead) == 99);
    CHECK(code(ErrorCategory::Encoding) == 99);
    CHECK(code(ErrorCategory::Scan) == 99);
    CHECK(code(ErrorCategory::Schema) == 99);
}

TEST_CASE("Error: CategoryName", "[error]") {
    CHECK(Error{"", "", "", std::nullopt, ErrorCategory::InvalidRepository}.CategoryName() ==
          "invalid_repository");
    CHECK(Error{"", "", "", std::nullopt, ErrorCategory::Encoding}.CategoryName() == "encoding");
}

TEST_CASE("Error: equality includes category", "[error]") {
    Error a{"Op", "p", "m", std::nullopt, ErrorCategory::Scan};
    Error b{"Op", "p", "m", std::nullopt, ErrorCategory::Scan};
    Error c{"Op", "p", "m", std::nullopt, ErrorCategory::FileRead};
    CHECK(a == b);
    CHECK(a != c);
}
