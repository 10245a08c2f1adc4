#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "lookup/membership_engine.hpp"
#include "provider/builtin_providers.hpp"
#include "provider/provider_registry.hpp"

#include <cstdlib>
#include <format>
#include <iostream>
#include <string>
#include <vector>

using namespace cdnlocator;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_usage() {
    std::cerr <<
        "Usage: cdn-locator [--config FILE] [--log-level LEVEL] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  lookup <ip>...            print the CDN owning each address ('-' if none)\n"
        "  fetch [--refresh] <name>  print one provider's ranges (cache first)\n"
        "  warm                      fetch every provider's ranges into the cache\n"
        "  providers                 list registered providers\n"
        "\n"
        "The config file may also be given with CDN_LOCATOR_CONFIG.\n";
}

struct Options {
    std::string config_file;
    std::string log_level;
    std::string command;
    std::vector<std::string> args;
};

bool parse_args(int argc, char* argv[], Options& opts) {
    if (const char* env = std::getenv("CDN_LOCATOR_CONFIG"); env && *env) {
        opts.config_file = env;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (opts.command.empty() && (arg == "--config" || arg == "--log-level")) {
            if (i + 1 >= argc) return false;
            (arg == "--config" ? opts.config_file : opts.log_level) = argv[++i];
        } else if (opts.command.empty() && (arg == "-h" || arg == "--help")) {
            return false;
        } else if (opts.command.empty()) {
            opts.command = arg;
        } else {
            opts.args.push_back(arg);
        }
    }
    return !opts.command.empty();
}

int run_lookup(MembershipEngine& engine, const std::vector<std::string>& ips) {
    if (ips.empty()) {
        print_usage();
        return kExitUsage;
    }
    for (const auto& ip : ips) {
        const auto owner = engine.locate(ip);
        std::cout << ip << ' ' << owner.value_or("-") << '\n';
    }
    return kExitOk;
}

int run_fetch(MembershipEngine& engine, const std::vector<std::string>& args) {
    bool refresh = false;
    std::string name;
    for (const auto& arg : args) {
        if (arg == "--refresh") {
            refresh = true;
        } else if (name.empty()) {
            name = arg;
        } else {
            print_usage();
            return kExitUsage;
        }
    }
    if (name.empty()) {
        print_usage();
        return kExitUsage;
    }

    const auto ranges = refresh ? engine.refresh(name) : engine.fetch(name);
    if (ranges.is_error()) {
        utils::log::error(std::format("{} ({})", ranges.error_message(),
            error_category_to_string(ranges.error_category())));
        return kExitFailure;
    }
    for (const auto& range : ranges.value()) {
        std::cout << range << '\n';
    }
    return kExitOk;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return kExitUsage;
    }

    try {
        // Configuration
        LocatorConfig config;
        if (!opts.config_file.empty()) {
            auto config_result = ConfigLoader::load_from_file(opts.config_file);
            if (!config_result.success) {
                utils::log::error(config_result.error_message);
                return kExitUsage;
            }
            config = std::move(config_result.config);
        }

        const std::string level_name = opts.log_level.empty() ? config.logging.level : opts.log_level;
        const auto level = utils::log::parse_level(level_name);
        if (!level) {
            utils::log::error(std::format("Unknown log level '{}'", level_name));
            return kExitUsage;
        }
        utils::log::set_level(*level);

        if (!opts.config_file.empty()) {
            utils::log::debug(std::format("Configuration loaded from {}", opts.config_file));
        }

        // Providers
        ProviderRegistry registry;
        register_http_providers(registry, ConfigLoader::provider_configs(config),
                                ConfigLoader::cache_store_config(config));
        registry.seal();
        utils::log::debug(std::format("{} providers registered", registry.size()));

        MembershipEngine::Config engine_config;
        engine_config.query_timeout = std::chrono::milliseconds(config.lookup.query_timeout_ms);
        MembershipEngine engine(registry, engine_config);

        if (opts.command == "lookup") {
            return run_lookup(engine, opts.args);
        }
        if (opts.command == "fetch") {
            return run_fetch(engine, opts.args);
        }
        if (opts.command == "warm") {
            const size_t warmed = engine.warm_all();
            std::cout << std::format("warmed {}/{}\n", warmed, registry.size());
            return kExitOk;
        }
        if (opts.command == "providers") {
            for (const auto& name : registry.names()) {
                std::cout << name << '\n';
            }
            return kExitOk;
        }

        utils::log::error(std::format("Unknown command '{}'", opts.command));
        print_usage();
        return kExitUsage;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return kExitFailure;
    }
}
