/**
 * @file test_builder.cpp
 * @brief Tests for layer collection, build and warm (GoogleTest)
 */

#include <gtest/gtest.h>
#include "strata/Builder.hpp"
#include "strata/Errors.hpp"
#include "strata/Routes.hpp"
#include "TempDir.hpp"

#include <stdexcept>

using namespace strata;

namespace {

Value route(const std::string& controller, const std::string& action,
            const std::vector<std::string>& methods) {
    return {{"controller", controller}, {"action", action}, {"methods", methods}};
}

class RecordingInvalidator : public CacheInvalidator {
public:
    void invalidate(const std::vector<std::string>& identities) override {
        calls.push_back(identities);
    }
    std::vector<std::vector<std::string>> calls;
};

// Baseline, two providers and an app with an env overlay, for both modes.
class BuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (Mode mode : kAllModes) {
            source.baseline()
                .set(mode, ArtifactKind::Config, {{"app", {{"name", "base"}, {"debug", false}}}})
                .set(mode, ArtifactKind::Routes, {{"/", route("Home", "index", {"GET"})}})
                .set(mode, ArtifactKind::Services, {{"logger", "Base\\Logger"}, {"mailer", "Base\\Mailer"}});
        }

        LayerSlots auth;
        auth.set(Mode::Http, ArtifactKind::Routes, {{"/login", route("Auth", "form", {"GET"})}})
            .set(Mode::Http, ArtifactKind::Services, {{"mailer", "Auth\\Mailer"}});
        source.register_provider("auth", auth);

        LayerSlots mail;
        mail.set(Mode::Http, ArtifactKind::Services, {{"mailer", "Mail\\Mailer"}})
            .set(Mode::Http, ArtifactKind::Config, {{"mail", {{"host", "smtp"}}}});
        source.register_provider("mail", mail);

        source.set_provider_list({"auth", "mail"});

        source.app_base()
            .set(Mode::Http, ArtifactKind::Config, {{"app", {{"name", "shop"}}}})
            .set(Mode::Http, ArtifactKind::Routes, {{"/login", {{"action", "show"}}}});
        source.app_env()
            .set(Mode::Http, ArtifactKind::Config, {{"app", {{"debug", true}}}});
    }

    StaticLayerSource source;
    TempDir tmp;
};

} // anonymous namespace

// ============================================================================
// Layer collection
// ============================================================================

TEST_F(BuilderTest, LayersInPrecedenceOrder) {
    auto layers = source.collect_layers(Mode::Http, ArtifactKind::Config);
    ASSERT_EQ(layers.size(), 4u);
    EXPECT_EQ(layers[0].identity, "baseline");
    EXPECT_EQ(layers[1].identity, "provider:mail");
    EXPECT_EQ(layers[2].identity, "app");
    EXPECT_EQ(layers[3].identity, "app:env");

    // auth has no config slot: its position is still counted.
    EXPECT_EQ(layers[0].order, 0u);
    EXPECT_EQ(layers[1].order, 2u);
    EXPECT_EQ(layers[2].order, 3u);
    EXPECT_EQ(layers[3].order, 4u);
    EXPECT_NO_THROW(check_layer_order(ArtifactKind::Config, layers));
}

TEST_F(BuilderTest, ServicesHaveNoEnvOverlay) {
    source.app_env().set(Mode::Http, ArtifactKind::Services, {{"mailer", "Env\\Mailer"}});
    auto layers = source.collect_layers(Mode::Http, ArtifactKind::Services);
    for (const auto& layer : layers) {
        EXPECT_NE(layer.kind, LayerKind::AppEnv);
    }
}

TEST_F(BuilderTest, UnknownProviderReportsPosition) {
    source.set_provider_list({"auth", "billing"});
    try {
        source.collect_layers(Mode::Http, ArtifactKind::Routes);
        FAIL() << "expected LayerResolutionError";
    } catch (const LayerResolutionError& e) {
        EXPECT_EQ(e.position(), 2u);
        EXPECT_EQ(e.reference(), "billing");
        EXPECT_EQ(e.kind(), ArtifactKind::Routes);
    }
}

TEST_F(BuilderTest, DuplicateProviderRejected) {
    source.set_provider_list({"auth", "auth"});
    EXPECT_THROW(source.collect_layers(Mode::Http, ArtifactKind::Config), LayerResolutionError);
}

TEST(CheckLayerOrder, RejectsMisplacedLayers) {
    std::vector<Layer> provider_before_baseline = {
        Layer{LayerKind::Provider, 0, "provider:a", Value::object()},
        Layer{LayerKind::Baseline, 1, "baseline", Value::object()},
    };
    EXPECT_THROW(check_layer_order(ArtifactKind::Config, provider_before_baseline),
                 LayerResolutionError);

    std::vector<Layer> two_apps = {
        Layer{LayerKind::AppBase, 0, "app", Value::object()},
        Layer{LayerKind::AppBase, 1, "app2", Value::object()},
    };
    EXPECT_THROW(check_layer_order(ArtifactKind::Config, two_apps), LayerResolutionError);

    std::vector<Layer> repeated_position = {
        Layer{LayerKind::Baseline, 0, "baseline", Value::object()},
        Layer{LayerKind::Provider, 0, "provider:a", Value::object()},
    };
    EXPECT_THROW(check_layer_order(ArtifactKind::Config, repeated_position),
                 LayerResolutionError);
}

// ============================================================================
// build
// ============================================================================

TEST_F(BuilderTest, BuildConfigLastLayerWins) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    auto result = builder.build(Mode::Http, ArtifactKind::Config);
    EXPECT_EQ(result.kind(), ArtifactKind::Config);
    EXPECT_EQ(result.mode(), Mode::Http);
    EXPECT_EQ(result.data()["app"]["name"], "shop");
    EXPECT_EQ(result.data()["app"]["debug"], true);
    EXPECT_EQ(result.data()["mail"]["host"], "smtp");
}

TEST_F(BuilderTest, BuildRoutesMergesEntries) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    auto result = builder.build(Mode::Http, ArtifactKind::Routes);
    EXPECT_EQ(result.data()["/login"]["controller"], "Auth");
    EXPECT_EQ(result.data()["/login"]["action"], "show");
    EXPECT_EQ(result.data()["/"]["action"], "index");
}

TEST_F(BuilderTest, BuildServicesLaterProviderWins) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    auto result = builder.build(Mode::Http, ArtifactKind::Services);
    EXPECT_EQ(result.data()["mailer"], "Mail\\Mailer");
    EXPECT_EQ(result.data()["logger"], "Base\\Logger");
}

TEST_F(BuilderTest, ModesAreIndependent) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    auto cli = builder.build(Mode::Cli, ArtifactKind::Routes);
    EXPECT_FALSE(cli.data().contains("/login"));
    EXPECT_TRUE(cli.data().contains("/"));
}

TEST_F(BuilderTest, InvalidRoutesRaiseWithLayerOrigin) {
    source.app_base().set(Mode::Http, ArtifactKind::Routes,
                          {{"/broken", {{"controller", "X"}, {"action", "y"}}}});
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    try {
        builder.build(Mode::Http, ArtifactKind::Routes);
        FAIL() << "expected MissingRouteFieldError";
    } catch (const MissingRouteFieldError& e) {
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_EQ(e.violations()[0].location, "/broken");
        EXPECT_EQ(e.violations()[0].layer_identity, "app");
        EXPECT_EQ(e.violations()[0].layer_index, std::optional<std::size_t>(3));
    }
}

TEST_F(BuilderTest, MalformedLayerRejectedBeforeMerge) {
    source.app_base().set(Mode::Http, ArtifactKind::Routes,
                          {{kPatternRoutesKey, "not a list"}});
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);
    EXPECT_THROW(builder.build(Mode::Http, ArtifactKind::Routes), MalformedPayloadError);
}

TEST_F(BuilderTest, BuildAllProducesThreeKinds) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    CompositionSet set = builder.build_all(Mode::Http);
    EXPECT_EQ(set.config.kind(), ArtifactKind::Config);
    EXPECT_EQ(set.routes.kind(), ArtifactKind::Routes);
    EXPECT_EQ(set.services.kind(), ArtifactKind::Services);
}

// ============================================================================
// warm
// ============================================================================

TEST_F(BuilderTest, WarmWritesAndInvalidatesOnce) {
    auto invalidator = std::make_shared<RecordingInvalidator>();
    CacheWriter writer(tmp.path(), invalidator);
    Builder builder(source, writer);

    auto written = builder.warm(Mode::Http, true, true);
    ASSERT_EQ(written.size(), 3u);
    ASSERT_EQ(invalidator->calls.size(), 1u);
    EXPECT_EQ(invalidator->calls[0].size(), 3u);

    RuntimeLoader loader(tmp.path());
    CompositionSet loaded = loader.load_all(Mode::Http);
    EXPECT_EQ(loaded.services.data(), builder.build(Mode::Http, ArtifactKind::Services).data());
}

TEST_F(BuilderTest, WarmWithoutInvalidation) {
    auto invalidator = std::make_shared<RecordingInvalidator>();
    CacheWriter writer(tmp.path(), invalidator);
    Builder builder(source, writer);

    builder.warm(Mode::Cli, true, false);
    EXPECT_TRUE(invalidator->calls.empty());
    EXPECT_TRUE(writer.exists(ArtifactKind::Config, Mode::Cli));
}

TEST_F(BuilderTest, WarmKeepsExistingUnlessOverwrite) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);
    builder.warm(Mode::Http, true, false);
    const std::string path = artifact_path(tmp.path(), ArtifactKind::Config, Mode::Http);
    const std::string before = TempDir::read(path);

    source.app_base().set(Mode::Http, ArtifactKind::Config, {{"app", {{"name", "renamed"}}}});

    auto skipped = builder.warm(Mode::Http, false, false);
    EXPECT_TRUE(skipped.empty());
    EXPECT_EQ(TempDir::read(path), before);

    auto rewritten = builder.warm(Mode::Http, true, false);
    EXPECT_EQ(rewritten.size(), 3u);
    EXPECT_NE(TempDir::read(path).find("renamed"), std::string::npos);
}

TEST_F(BuilderTest, FailedBuildLeavesPreviousArtifacts) {
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);
    builder.warm(Mode::Http, true, false);
    const std::string path = artifact_path(tmp.path(), ArtifactKind::Routes, Mode::Http);
    const std::string before = TempDir::read(path);

    source.app_base().set(Mode::Http, ArtifactKind::Routes,
                          {{"/new", {{"controller", "N"}, {"action", "go"}}}});
    EXPECT_THROW(builder.warm(Mode::Http, true, true), MissingRouteFieldError);
    EXPECT_EQ(TempDir::read(path), before);
}

TEST_F(BuilderTest, WarmAllBuildsBothModesBeforeWriting) {
    source.baseline().set(Mode::Cli, ArtifactKind::Services, {{"bad", ""}});
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    EXPECT_THROW(builder.warm_all(true, false), UnresolvableServiceDefinitionError);
    EXPECT_FALSE(writer.exists(ArtifactKind::Config, Mode::Http));
}

TEST_F(BuilderTest, WriteFailureInvalidatesOnlySwappedArtifacts) {
    auto invalidator = std::make_shared<RecordingInvalidator>();
    CacheWriter writer(tmp.path(), invalidator);
    Builder builder(source, writer);

    const std::string routes_path = artifact_path(tmp.path(), ArtifactKind::Routes, Mode::Http);
    writer.set_fault_hook([&](WriteStage stage, const std::string& path) {
        if (stage == WriteStage::BeforeSwap && path == routes_path) {
            throw std::runtime_error("disk full");
        }
    });

    EXPECT_THROW(builder.warm(Mode::Http, true, true), CacheWriteError);
    ASSERT_EQ(invalidator->calls.size(), 1u);
    ASSERT_EQ(invalidator->calls[0].size(), 1u);
    EXPECT_EQ(invalidator->calls[0][0],
              artifact_path(tmp.path(), ArtifactKind::Config, Mode::Http));
    EXPECT_FALSE(writer.exists(ArtifactKind::Routes, Mode::Http));
}

TEST_F(BuilderTest, WriteFailureAfterSwapStillInvalidates) {
    auto invalidator = std::make_shared<RecordingInvalidator>();
    CacheWriter writer(tmp.path(), invalidator);
    Builder builder(source, writer);

    const std::string routes_path = artifact_path(tmp.path(), ArtifactKind::Routes, Mode::Http);
    writer.set_fault_hook([&](WriteStage stage, const std::string& path) {
        if (stage == WriteStage::AfterSwap && path == routes_path) {
            throw std::runtime_error("crash");
        }
    });

    EXPECT_THROW(builder.warm(Mode::Http, true, true), CacheWriteError);
    EXPECT_TRUE(writer.exists(ArtifactKind::Routes, Mode::Http));
    ASSERT_EQ(invalidator->calls.size(), 1u);
    EXPECT_EQ(invalidator->calls[0],
              (std::vector<std::string>{
                  artifact_path(tmp.path(), ArtifactKind::Config, Mode::Http),
                  routes_path,
              }));
}

TEST_F(BuilderTest, InvalidUtf8FailsBuild) {
    source.app_base().set(Mode::Http, ArtifactKind::Config, {{"name", "\xff\xfe"}});
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    try {
        builder.build(Mode::Http, ArtifactKind::Config);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_EQ(e.violations()[0].location, "name");
        EXPECT_EQ(e.violations()[0].layer_identity, "app");
    }
    EXPECT_THROW(builder.warm(Mode::Http, true, true), ValidationError);
    EXPECT_FALSE(writer.exists(ArtifactKind::Config, Mode::Http));
}

TEST_F(BuilderTest, ConfigViolationCarriesLayerOrigin) {
    source.app_env().set(Mode::Http, ArtifactKind::Config,
                         {{"blob", Value::binary({0x00, 0x01})}});
    CacheWriter writer(tmp.path());
    Builder builder(source, writer);

    try {
        builder.build(Mode::Http, ArtifactKind::Config);
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        ASSERT_EQ(e.violations().size(), 1u);
        EXPECT_EQ(e.violations()[0].layer_index, std::optional<std::size_t>(4));
        EXPECT_EQ(e.violations()[0].layer_identity, "app:env");
    }
}
