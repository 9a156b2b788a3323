#include <gtest/gtest.h>
#include "core/projection_error.h"

using namespace prism::core;

class ProjectionErrorTest : public ::testing::Test {};

TEST_F(ProjectionErrorTest, CodesAndDefaultStatuses) {
    MissingField missing("profile.bio");
    EXPECT_EQ(missing.code(), "MISSING_FIELD");
    EXPECT_EQ(missing.path(), "profile.bio");
    EXPECT_EQ(missing.httpStatus(), 400);

    FieldNotAllowed not_allowed("secret");
    EXPECT_EQ(not_allowed.code(), "FIELD_NOT_ALLOWED");

    CycleDetected cycle("a.b");
    EXPECT_EQ(cycle.code(), "CYCLE_DETECTED");
    EXPECT_EQ(cycle.httpStatus(), 500);

    DepthExceeded depth("a.b.c", 2, 3);
    EXPECT_EQ(depth.code(), "MAX_DEPTH_EXCEEDED");
    EXPECT_NE(std::string(depth.what()).find("a.b.c"), std::string::npos);
}

TEST_F(ProjectionErrorTest, AllDeriveFromProjectionException) {
    EXPECT_THROW(throw MissingField("x"), ProjectionException);
    EXPECT_THROW(throw SyntaxError("x(", 2, "end"), ProjectionException);
    EXPECT_THROW(throw CycleDetected("x"), std::runtime_error);
}

TEST_F(ProjectionErrorTest, SyntaxErrorPayload) {
    SyntaxError err("a,,b", 2, "Invalid field name start character: ','");
    auto body = ErrorResponse::from(err, std::string("abcd1234")).toJson();

    ASSERT_TRUE(body.contains("error"));
    const auto& e = body["error"];
    EXPECT_EQ(e["code"], "INVALID_PROJECTION_SYNTAX");
    EXPECT_EQ(e["path"], "");
    EXPECT_EQ(e["position"], 2);
    EXPECT_EQ(e["traceId"], "abcd1234");
    EXPECT_NE(e["message"].get<std::string>().find("position 2"), std::string::npos);
}

TEST_F(ProjectionErrorTest, PayloadOmitsAbsentOptionals) {
    auto body = ErrorResponse::from(MissingField("profile.bio")).toJson();
    const auto& e = body["error"];
    EXPECT_EQ(e["code"], "MISSING_FIELD");
    EXPECT_EQ(e["path"], "profile.bio");
    EXPECT_FALSE(e.contains("position"));
    EXPECT_FALSE(e.contains("traceId"));
}

TEST_F(ProjectionErrorTest, BlankTraceIdOmitted) {
    auto resp = ErrorResponse::from(FieldNotAllowed("x"), std::string());
    EXPECT_FALSE(resp.trace_id.has_value());
}
