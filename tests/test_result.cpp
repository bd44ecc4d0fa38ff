//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_result.cpp
// Purpose: GoogleTests for the Result<T, E> value type
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "rr/result/ApiError.h"
#include "rr/result/Result.h"

using namespace rr;

using IntResult = Result<int, std::string>;

TEST(Result, SuccessHoldsValue) {
    auto r = IntResult::Success(42);
    EXPECT_TRUE(r.IsSuccess());
    EXPECT_FALSE(r.IsFailure());
    EXPECT_EQ(r.Value(), 42);
    EXPECT_THROW((void)r.Error(), BadResultAccess);
}

TEST(Result, FailureHoldsError) {
    auto r = IntResult::Failure("boom");
    EXPECT_TRUE(r.IsFailure());
    EXPECT_EQ(r.Error(), "boom");
    EXPECT_THROW((void)r.Value(), BadResultAccess);
}

TEST(Result, SameTypeOnBothSidesKeepsSide) {
    auto ok = Result<std::string, std::string>::Success("v");
    auto bad = Result<std::string, std::string>::Failure("e");
    EXPECT_TRUE(ok.IsSuccess());
    EXPECT_TRUE(bad.IsFailure());
    EXPECT_EQ(ok.Value(), "v");
    EXPECT_EQ(bad.Error(), "e");
}

TEST(Result, ValueOrAndValueOrElse) {
    EXPECT_EQ(IntResult::Success(1).ValueOr(7), 1);
    EXPECT_EQ(IntResult::Failure("x").ValueOr(7), 7);
    EXPECT_EQ(IntResult::Failure("abc").ValueOrElse([](const std::string& e) { return static_cast<int>(e.size()); }), 3);
}

TEST(Result, ValueOrThrowUsesMappedException) {
    auto r = IntResult::Failure("bad input");
    try {
        (void)r.ValueOrThrow([](const std::string& e) { return std::runtime_error(e); });
        FAIL() << "expected throw";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "bad input");
    }
    EXPECT_EQ(IntResult::Success(5).ValueOrThrow([](const std::string& e) { return std::runtime_error(e); }), 5);
}

TEST(Result, MapTransformsOnlySuccess) {
    auto doubled = IntResult::Success(21).Map([](int v) { return v * 2; });
    EXPECT_EQ(doubled.Value(), 42);

    bool called = false;
    auto untouched = IntResult::Failure("e").Map([&called](int v) { called = true; return std::to_string(v); });
    EXPECT_FALSE(called);
    EXPECT_EQ(untouched.Error(), "e");
}

TEST(Result, MapErrorTransformsOnlyFailure) {
    auto r = IntResult::Failure("nope").MapError([](const std::string& e) { return ApiError::Config(e); });
    ASSERT_TRUE(r.IsFailure());
    EXPECT_TRUE(r.Error().Is(ErrorType::ConfigError));
    EXPECT_EQ(r.Error().message, "nope");

    auto s = IntResult::Success(3).MapError([](const std::string& e) { return e.size(); });
    EXPECT_EQ(s.Value(), 3);
}

TEST(Result, CallbacksAndMatch) {
    int seen = 0;
    std::string err;
    IntResult::Success(9).IfSuccess([&seen](int v) { seen = v; }).IfFailure([&err](const std::string& e) { err = e; });
    EXPECT_EQ(seen, 9);
    EXPECT_TRUE(err.empty());

    auto text = IntResult::Failure("x").Match(
        [](int v) { return std::string("ok ") + std::to_string(v); },
        [](const std::string& e) { return std::string("fail ") + e; });
    EXPECT_EQ(text, "fail x");
}

TEST(Result, ToOptional) {
    EXPECT_EQ(IntResult::Success(4).ToOptional(), std::optional<int>(4));
    EXPECT_FALSE(IntResult::Failure("x").ToOptional().has_value());
}
