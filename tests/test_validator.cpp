/**
 * @file test_validator.cpp
 * @brief Tests for structural validation (GoogleTest)
 */

#include <gtest/gtest.h>
#include "strata/Errors.hpp"
#include "strata/Routes.hpp"
#include "strata/Validator.hpp"

#include <algorithm>

using namespace strata;

namespace {

bool has_violation_at(const std::vector<Violation>& violations, const std::string& location,
                      const std::string& fragment) {
    return std::any_of(violations.begin(), violations.end(), [&](const Violation& v) {
        return v.location == location && v.message.find(fragment) != std::string::npos;
    });
}

} // anonymous namespace

// ============================================================================
// Config
// ============================================================================

TEST(ValidateConfig, AnyShapeBelowTopLevelIsAccepted) {
    Value config = {
        {"a", {{"b", {{"c", {1, "two", nullptr, {{"d", 4.5}}}}}}}},
        {"flag", false},
    };
    EXPECT_TRUE(validate(ArtifactKind::Config, config).empty());
}

TEST(ValidateConfig, TopLevelMustBeObject) {
    auto violations = validate(ArtifactKind::Config, Value::array());
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_NE(violations[0].message.find("top-level"), std::string::npos);
}

TEST(ValidateConfig, BinaryValueRejected) {
    Value config = {{"blob", Value::binary({0x01, 0x02})}};
    auto violations = validate(ArtifactKind::Config, config);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].location, "blob");
}

TEST(ValidateConfig, InvalidUtf8Rejected) {
    Value config = {
        {"name", "\xff\xfe"},
        {"nested", {{"list", {"ok", "\xc0\xaf"}}}},
        {"surrogate", "\xed\xa0\x80"},
        {"truncated", "caf\xc3"},
        {"fine", "caf\xc3\xa9 \xf0\x9f\x8e\x89"},
    };
    auto violations = validate(ArtifactKind::Config, config);

    EXPECT_TRUE(has_violation_at(violations, "name", "UTF-8"));
    EXPECT_TRUE(has_violation_at(violations, "nested.list[1]", "UTF-8"));
    EXPECT_TRUE(has_violation_at(violations, "surrogate", "UTF-8"));
    EXPECT_TRUE(has_violation_at(violations, "truncated", "UTF-8"));
    EXPECT_EQ(violations.size(), 4u);
}

TEST(ValidateConfig, InvalidUtf8KeysRejected) {
    Value config = {
        {"\xff", 1},
        {"db", {{"\xfe", true}}},
    };
    auto violations = validate(ArtifactKind::Config, config);

    EXPECT_TRUE(has_violation_at(violations, "", "top-level key"));
    EXPECT_TRUE(has_violation_at(violations, "db", "key is not valid UTF-8"));
    EXPECT_EQ(violations.size(), 2u);
}

TEST(ValidateConfig, EnsureValidThrowsValidationError) {
    EXPECT_THROW(ensure_valid(ArtifactKind::Config, "scalar"), ValidationError);
    EXPECT_NO_THROW(ensure_valid(ArtifactKind::Config, Value::object()));
}

// ============================================================================
// Routes
// ============================================================================

TEST(ValidateRoutes, CompleteEntriesPass) {
    Value table = {
        {"/", {{"controller", "Home"}, {"action", "index"}, {"methods", {"GET"}}}},
        {kPatternRoutesKey, {
            {{"pattern", "/p/{id}"}, {"controller", "P"}, {"action", "show"}, {"methods", {"GET"}}},
        }},
    };
    EXPECT_TRUE(validate(ArtifactKind::Routes, table).empty());
}

TEST(ValidateRoutes, MissingFieldsReportedPerPath) {
    Value table = {
        {"/a", {{"controller", "A"}, {"action", "f"}}},
        {"/b", {{"action", "f"}, {"methods", {"GET"}}}},
        {"/c", {{"controller", "C"}, {"action", ""}, {"methods", Value::array()}}},
    };
    auto violations = validate(ArtifactKind::Routes, table);

    EXPECT_TRUE(has_violation_at(violations, "/a", "methods"));
    EXPECT_TRUE(has_violation_at(violations, "/b", "controller"));
    EXPECT_TRUE(has_violation_at(violations, "/c", "action"));
    EXPECT_TRUE(has_violation_at(violations, "/c", "methods"));
    EXPECT_EQ(violations.size(), 4u);
}

TEST(ValidateRoutes, PatternItemsReportedByIndex) {
    Value table = {
        {kPatternRoutesKey, {
            {{"pattern", "/ok/{x}"}, {"controller", "A"}, {"action", "f"}, {"methods", {"GET"}}},
            {{"controller", "B"}, {"action", "f"}, {"methods", {"GET"}}},
            {{"pattern", "/x"}, {"controller", "C"}, {"action", "f"}},
        }},
    };
    auto violations = validate(ArtifactKind::Routes, table);

    EXPECT_TRUE(has_violation_at(violations, "regex[1]", "pattern"));
    EXPECT_TRUE(has_violation_at(violations, "regex[2]", "methods"));
    EXPECT_EQ(violations.size(), 2u);
}

TEST(ValidateRoutes, NonStringMethodRejected) {
    Value table = {{"/a", {{"controller", "A"}, {"action", "f"}, {"methods", {"GET", 7}}}}};
    auto violations = validate(ArtifactKind::Routes, table);
    EXPECT_TRUE(has_violation_at(violations, "/a", "methods[1]"));
}

TEST(ValidateRoutes, ScalarEntryRejected) {
    Value table = {{"/a", "Home::index"}};
    auto violations = validate(ArtifactKind::Routes, table);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_TRUE(has_violation_at(violations, "/a", "must be an object"));
}

TEST(ValidateRoutes, ViolationCarriesLayerOrigin) {
    Value table = {{"/x", {{"controller", "A"}, {"action", "f"}}}};
    Provenance origins = {{"/x", 1}};
    std::vector<Layer> layers = {
        Layer{LayerKind::Baseline, 0, "vendor/http_routes.json", Value::object()},
        Layer{LayerKind::AppBase, 3, "app/http_routes.json", Value::object()},
    };

    auto violations = validate(ArtifactKind::Routes, table, &origins, &layers);
    ASSERT_EQ(violations.size(), 1u);
    ASSERT_TRUE(violations[0].layer_index.has_value());
    EXPECT_EQ(*violations[0].layer_index, 3u);
    EXPECT_EQ(violations[0].layer_identity, "app/http_routes.json");
    EXPECT_EQ(violations[0].to_string(),
              "routes: layer 3 (app/http_routes.json) at '/x': missing 'methods'");
}

TEST(ValidateRoutes, EnsureValidThrowsMissingRouteField) {
    Value table = {
        {"/a", {{"controller", "A"}, {"action", "f"}}},
        {"/b", {{"controller", "B"}, {"methods", {"GET"}}}},
    };
    try {
        ensure_valid(ArtifactKind::Routes, table);
        FAIL() << "expected MissingRouteFieldError";
    } catch (const MissingRouteFieldError& e) {
        EXPECT_EQ(e.kind(), ArtifactKind::Routes);
        EXPECT_EQ(e.violations().size(), 2u);
    }
}

// ============================================================================
// Services
// ============================================================================

TEST(ValidateServices, BareAndShapedDefinitionsPass) {
    Value registry = {
        {"router", "App\\Router"},
        {"mailer", {{"class", "Mailer"}, {"options", {{"hosts", {"a", "b"}}, {"tls", {{"verify", true}}}}}}},
        {"cache", {{"class", "Cache"}}},
    };
    EXPECT_TRUE(validate(ArtifactKind::Services, registry).empty());
}

TEST(ValidateServices, EveryBadDefinitionReported) {
    Value registry = {
        {"empty", ""},
        {"number", 5},
        {"noclass", {{"options", Value::object()}}},
        {"badclass", {{"class", ""}}},
        {"badopts", {{"class", "X"}, {"options", {1, 2}}}},
        {"extra", {{"class", "X"}, {"factory", "make"}}},
    };
    auto violations = validate(ArtifactKind::Services, registry);

    EXPECT_TRUE(has_violation_at(violations, "empty", "empty class"));
    EXPECT_TRUE(has_violation_at(violations, "number", "class name or an object"));
    EXPECT_TRUE(has_violation_at(violations, "noclass", "missing 'class'"));
    EXPECT_TRUE(has_violation_at(violations, "badclass", "non-empty string"));
    EXPECT_TRUE(has_violation_at(violations, "badopts.options", "must be an object"));
    EXPECT_TRUE(has_violation_at(violations, "extra", "unknown field 'factory'"));
    EXPECT_EQ(violations.size(), 6u);
}

TEST(ValidateServices, OpaqueOptionRejected) {
    Value registry = {
        {"svc", {{"class", "X"}, {"options", {{"nested", {{"blob", Value::binary({7})}}}}}}},
    };
    auto violations = validate(ArtifactKind::Services, registry);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].location, "svc.options.nested.blob");
}

TEST(ValidateServices, InvalidUtf8ClassRejected) {
    Value registry = {{"svc", "App\\\xff"}};
    auto violations = validate(ArtifactKind::Services, registry);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].location, "svc");
}

TEST(ValidateServices, EnsureValidThrowsUnresolvable) {
    Value registry = {{"svc", ""}};
    EXPECT_THROW(ensure_valid(ArtifactKind::Services, registry),
                 UnresolvableServiceDefinitionError);
}

// ============================================================================
// Layer shapes
// ============================================================================

TEST(CheckPayloadShapes, NonObjectLayerNamesIdentity) {
    std::vector<Layer> layers = {
        Layer{LayerKind::Baseline, 0, "baseline", Value::object()},
        Layer{LayerKind::Provider, 1, "provider:auth", Value::array()},
    };
    try {
        check_payload_shapes(ArtifactKind::Routes, layers);
        FAIL() << "expected MalformedPayloadError";
    } catch (const MalformedPayloadError& e) {
        EXPECT_EQ(e.identity(), "provider:auth");
        ASSERT_TRUE(e.layer_index().has_value());
        EXPECT_EQ(*e.layer_index(), 1u);
    }
}

TEST(CheckPayloadShapes, PatternKeyMustBeList) {
    std::vector<Layer> layers = {
        Layer{LayerKind::AppBase, 2, "app", {{kPatternRoutesKey, {{"a", 1}}}}},
    };
    EXPECT_THROW(check_payload_shapes(ArtifactKind::Routes, layers), MalformedPayloadError);
}
