#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>

#include "strata/Builder.hpp"
#include "strata/CacheWriter.hpp"
#include "strata/DotPath.hpp"
#include "strata/Errors.hpp"
#include "strata/LayerSource.hpp"
#include "strata/Log.hpp"
#include "strata/RuntimeLoader.hpp"
#include "strata/Settings.hpp"
#include "strata/Util.hpp"
#include "strata/Validator.hpp"

using namespace strata;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitNotFound = 3;

std::vector<Mode> selected_modes(const std::string& token) {
    if (token == "all") {
        return {kAllModes.begin(), kAllModes.end()};
    }
    return {parse_mode(token)};
}

// A single mode is required for commands that print one artifact.
Mode single_mode(const std::string& token, const std::string& cmd) {
    if (token == "all") {
        throw std::invalid_argument("command '" + cmd + "' needs --mode http or --mode cli");
    }
    return parse_mode(token);
}

void print_violations(const std::vector<Violation>& violations) {
    for (const auto& v : violations) {
        std::cerr << "  " << v.to_string() << "\n";
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("strata", "Compose layered config, routes and services into cache artifacts");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("c,config", "Path to strata.json / strata.toml", cxxopts::value<std::string>())
            ("m,mode", "http, cli or all", cxxopts::value<std::string>()->default_value("all"))
            ("overrides", "Comma-separated dot.key:JSON_value pairs", cxxopts::value<std::string>()->default_value(""))
            ("force", "warm: overwrite existing artifacts")
            ("no-invalidate", "warm: do not signal external cache invalidation")
            ("v,verbose", "Log build steps (repeat for debug)")
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: layers KIND | build KIND | check | warm [--force] [--no-invalidate] | show KIND [DOT.PATH]\n";
            return kExitOk;
        }

        LoadOptions load;
        if (result.count("config")) load.file_path = result["config"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());

        Settings settings = Settings::load(load);
        set_log_level(settings.log_level());
        if (result.count("verbose") == 1) set_log_level("info");
        if (result.count("verbose") > 1) set_log_level("debug");

        DirectoryLayerSource source(settings.layout());
        auto invalidator = std::make_shared<GenerationFileInvalidator>(settings.cache_dir());
        CacheWriter writer(settings.cache_dir(), invalidator);
        Builder builder(source, writer);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const std::string mode_token = result["mode"].as<std::string>();

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                throw std::invalid_argument("insufficient arguments for command '" + cmd + "'");
            }
        };

        // LAYERS
        if (cmd == "layers") {
            expect_args(2);
            const ArtifactKind kind = parse_artifact_kind(cmdv[1]);
            for (Mode mode : selected_modes(mode_token)) {
                std::cout << to_string(mode) << " " << to_string(kind) << ":\n";
                for (const auto& layer : source.collect_layers(mode, kind)) {
                    std::cout << "  " << layer.order << "  " << to_string(layer.kind)
                              << "  " << layer.identity << "\n";
                }
            }
            return kExitOk;
        }

        // BUILD
        if (cmd == "build") {
            expect_args(2);
            const ArtifactKind kind = parse_artifact_kind(cmdv[1]);
            const Mode mode = single_mode(mode_token, cmd);
            std::cout << builder.build(mode, kind).data().dump(2) << "\n";
            return kExitOk;
        }

        // CHECK
        if (cmd == "check") {
            bool failed = false;
            for (Mode mode : selected_modes(mode_token)) {
                for (ArtifactKind kind : kAllKinds) {
                    try {
                        builder.build(mode, kind);
                        std::cout << to_string(mode) << " " << to_string(kind) << ": ok\n";
                    } catch (const ValidationError& e) {
                        failed = true;
                        std::cerr << to_string(mode) << " " << to_string(kind) << ": "
                                  << e.violations().size() << " violation(s)\n";
                        print_violations(e.violations());
                    } catch (const CompositionError& e) {
                        failed = true;
                        std::cerr << to_string(mode) << " " << to_string(kind) << ": "
                                  << e.what() << "\n";
                    }
                }
            }
            return failed ? kExitInvalid : kExitOk;
        }

        // WARM
        if (cmd == "warm") {
            const bool overwrite = result.count("force") > 0;
            const bool invalidate = result.count("no-invalidate") == 0;
            std::vector<CacheArtifact> written;
            if (mode_token == "all") {
                written = builder.warm_all(overwrite, invalidate);
            } else {
                written = builder.warm(parse_mode(mode_token), overwrite, invalidate);
            }
            for (const auto& a : written) {
                std::cout << "Wrote " << to_string(a.mode) << " " << to_string(a.kind)
                          << " -> " << a.identity << "\n";
            }
            if (written.empty()) {
                std::cout << "Nothing written (use --force to overwrite)\n";
            }
            return kExitOk;
        }

        // SHOW
        if (cmd == "show") {
            expect_args(2);
            const ArtifactKind kind = parse_artifact_kind(cmdv[1]);
            const Mode mode = single_mode(mode_token, cmd);
            RuntimeLoader loader(settings.cache_dir());
            CompositionResult loaded = loader.load(kind, mode);

            if (cmdv.size() < 3) {
                std::cout << loaded.data().dump(2) << "\n";
                return kExitOk;
            }
            // Route paths are literal keys and may contain dots.
            const std::string& key = cmdv[2];
            auto literal = loaded.data().find(key);
            if (literal != loaded.data().end()) {
                std::cout << literal->dump(2) << "\n";
            } else {
                std::cout << get_by_dot(loaded.data(), key)->dump(2) << "\n";
            }
            return kExitOk;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return kExitError;

    } catch (const ValidationError& e) {
        std::cerr << "Error: " << to_string(e.kind()) << " failed validation\n";
        print_violations(e.violations());
        return kExitInvalid;
    } catch (const ArtifactNotFoundError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitNotFound;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return kExitError;
    }
}
