#include <gtest/gtest.h>
#include "projector/json_response_projector.h"
#include "core/projection_error.h"
#include "core/projection_parser.h"

using namespace prism::core;
using namespace prism::projector;
using json = nlohmann::ordered_json;

class JsonResponseProjectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        user_ = json::parse(R"({
            "id": 1,
            "name": "Ada",
            "secret": "y",
            "profile": {"avatar": "a.png", "bio": "math", "links": {"web": "ada.dev", "mail": "a@x"}},
            "tags": ["x", "y"],
            "manager": null,
            "empty_obj": {},
            "empty_arr": []
        })");
    }

    json project(const json& doc, const std::string& directive, int max_depth = 5) {
        FilterContext ctx(max_depth, true);
        return projector_.project(doc, ProjectionParser::parse(directive), ctx);
    }

    JsonResponseProjector projector_;
    json user_;
};

// ============================================================================
// Objects
// ============================================================================

TEST_F(JsonResponseProjectorTest, KeepsOnlyRequestedFields) {
    json doc = {{"id", 1}, {"name", "x"}, {"secret", "y"}};
    EXPECT_EQ(project(doc, "id,name"), (json{{"id", 1}, {"name", "x"}}));
}

TEST_F(JsonResponseProjectorTest, OutputFollowsRequestedOrder) {
    json doc = {{"id", 1}, {"name", "x"}};
    EXPECT_EQ(project(doc, "name,id").dump(), R"({"name":"x","id":1})");
    EXPECT_EQ(project(user_, "profile(links(mail,web),avatar),id").dump(),
              R"({"profile":{"links":{"mail":"a@x","web":"ada.dev"},"avatar":"a.png"},"id":1})");
}

TEST_F(JsonResponseProjectorTest, NestedProjection) {
    json out = project(user_, "id,profile(avatar,links(web))");
    json expected = {{"id", 1}, {"profile", {{"avatar", "a.png"}, {"links", {{"web", "ada.dev"}}}}}};
    EXPECT_EQ(out, expected);
}

TEST_F(JsonResponseProjectorTest, LeafCopiesWholeValue) {
    json out = project(user_, "profile,manager,empty_obj,empty_arr,tags");
    EXPECT_EQ(out["profile"], user_["profile"]);
    EXPECT_TRUE(out["manager"].is_null());
    EXPECT_EQ(out["empty_obj"], json::object());
    EXPECT_EQ(out["empty_arr"], json::array());
    EXPECT_EQ(out["tags"], user_["tags"]);
}

TEST_F(JsonResponseProjectorTest, MissingFieldFailsWithDottedPath) {
    try {
        project(user_, "id,profile(bogus)");
        FAIL() << "expected MissingField";
    } catch (const MissingField& e) {
        EXPECT_EQ(e.path(), "profile.bogus");
    }
    try {
        project(user_, "nope");
        FAIL() << "expected MissingField";
    } catch (const MissingField& e) {
        EXPECT_EQ(e.path(), "nope");
    }
}

TEST_F(JsonResponseProjectorTest, NestedDirectiveOnScalarReturnsScalar) {
    json out = project(user_, "name(first)");
    EXPECT_EQ(out["name"], "Ada");
}

TEST_F(JsonResponseProjectorTest, EmptyTreeAndNullPassThrough) {
    FilterContext ctx;
    EXPECT_EQ(projector_.project(user_, ProjectionTree::empty(), ctx), user_);
    EXPECT_TRUE(projector_.project(json(nullptr), ProjectionParser::parse("id"), ctx).is_null());
}

TEST_F(JsonResponseProjectorTest, ScalarRootReturnedUnchanged) {
    EXPECT_EQ(project(json(42), "id"), json(42));
}

TEST_F(JsonResponseProjectorTest, DepthLimit) {
    EXPECT_NO_THROW(project(user_, "profile(links(web))", 2));
    try {
        project(user_, "profile(links(web))", 1);
        FAIL() << "expected DepthExceeded";
    } catch (const DepthExceeded& e) {
        EXPECT_EQ(e.path(), "profile.links");
    }
}

TEST_F(JsonResponseProjectorTest, ContextBalancedAfterFailure) {
    FilterContext ctx(5, true);
    EXPECT_THROW(projector_.project(user_, ProjectionParser::parse("profile(links(nope))"), ctx), MissingField);
    EXPECT_EQ(ctx.getCurrentDepth(), 0);
}

// ============================================================================
// Arrays
// ============================================================================

TEST_F(JsonResponseProjectorTest, ProjectsEachArrayElement) {
    json doc = json::array({{{"id", 1}, {"x", 1}}, {{"id", 2}, {"x", 2}}});
    EXPECT_EQ(project(doc, "id"), json::array({{{"id", 1}}, {{"id", 2}}}));
}

TEST_F(JsonResponseProjectorTest, MixedArrayElements) {
    json doc = json::array({{{"id", 1}, {"x", 1}}, 7, "s"});
    EXPECT_EQ(project(doc, "id"), json::array({{{"id", 1}}, 7, "s"}));
}

TEST_F(JsonResponseProjectorTest, MissingFieldInArrayElement) {
    json doc = {{"items", json::array({{{"sku", "a"}}, {{"qty", 2}}})}};
    try {
        project(doc, "items(sku)");
        FAIL() << "expected MissingField";
    } catch (const MissingField& e) {
        EXPECT_EQ(e.path(), "items.sku");
    }
}

TEST_F(JsonResponseProjectorTest, CompiledPathMatchesUncompiled) {
    json doc = json::array();
    for (int i = 0; i < 100; ++i) {
        doc.push_back({{"id", i}, {"name", "n" + std::to_string(i)}, {"secret", i * 2},
                       {"profile", {{"avatar", "a"}, {"bio", "b"}}}});
    }
    auto tree = ProjectionParser::parse("id,profile(bio)");

    JsonResponseProjector always_compiled(1);
    JsonResponseProjector never_compiled(1000);
    FilterContext c1;
    FilterContext c2;
    json compiled = always_compiled.project(doc, tree, c1);
    json uncompiled = never_compiled.project(doc, tree, c2);

    EXPECT_EQ(compiled, uncompiled);
    ASSERT_EQ(compiled.size(), 100u);
    EXPECT_EQ(compiled[42], (json{{"id", 42}, {"profile", {{"bio", "b"}}}}));
}

TEST_F(JsonResponseProjectorTest, CompiledPathKeepsRequestedOrder) {
    json doc = json::array();
    for (int i = 0; i < 40; ++i) doc.push_back({{"id", i}, {"name", "n"}});
    json out = project(doc, "name,id");
    EXPECT_EQ(out[0].dump(), R"({"name":"n","id":0})");
}

TEST_F(JsonResponseProjectorTest, CompiledPathReportsMissingField) {
    json doc = json::array();
    for (int i = 0; i < 40; ++i) doc.push_back({{"id", i}});
    doc.push_back({{"other", 1}});
    try {
        project(doc, "id");
        FAIL() << "expected MissingField";
    } catch (const MissingField& e) {
        EXPECT_EQ(e.path(), "id");
    }
}

// ============================================================================
// Media types
// ============================================================================

TEST_F(JsonResponseProjectorTest, SupportsJsonMediaTypes) {
    EXPECT_TRUE(projector_.supports("application/json"));
    EXPECT_TRUE(projector_.supports("Application/JSON; charset=utf-8"));
    EXPECT_TRUE(projector_.supports("application/problem+json"));
    EXPECT_TRUE(projector_.supports("application/vnd.api+json"));
    EXPECT_FALSE(projector_.supports(""));
    EXPECT_FALSE(projector_.supports("text/html"));
    EXPECT_FALSE(projector_.supports("application/xml"));
}
