/**
 * @file inspect_main.cpp
 * @brief lockhub-inspect: print the lock managers configured for a domain.
 *
 * ## Usage
 *
 *     lockhub-inspect                              # Layered config, list managers
 *     lockhub-inspect --config <path.json>         # Single explicit config file
 *     lockhub-inspect --config-dir <dir>           # lockhub.default.json + lockhub.user.json
 *     lockhub-inspect --domain <domain>            # Override the configured domain
 *     lockhub-inspect --resolve <name>             # Also build <name> and report the result
 *
 * Exit status: 0 on success, 1 on a configuration error, 2 if --resolve fails.
 */
#include "lkh_lockmgr.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>

using namespace lockhub::utils;
using namespace lockhub::lockmgr;

namespace
{

struct InspectArgs
{
    std::string config_path;
    std::string config_dir;
    std::string domain;
    std::string resolve_name;
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog
              << " [--config <path.json> | --config-dir <dir>] [--domain <d>] [--resolve <name>]\n\n"
              << "Options:\n"
              << "  --config <path>     Single JSON config file (overrides LOCKHUB_CONFIG_FILE)\n"
              << "  --config-dir <dir>  Directory with lockhub.default.json / lockhub.user.json\n"
              << "  --domain <d>        Domain to inspect (default: configured domain)\n"
              << "  --resolve <name>    Construct the named lock manager and report the result\n"
              << "  --help              Show this message\n";
}

InspectArgs parse_args(int argc, char *argv[])
{
    InspectArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--config-dir" && i + 1 < argc)
        {
            args.config_dir = argv[++i];
        }
        else if (arg == "--domain" && i + 1 < argc)
        {
            args.domain = argv[++i];
        }
        else if (arg == "--resolve" && i + 1 < argc)
        {
            args.resolve_name = argv[++i];
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

} // anonymous namespace

int main(int argc, char *argv[])
{
    const InspectArgs args = parse_args(argc, argv);

    LifecycleGuard lifecycle(MakeModDefList(Logger::GetLifecycleModule()));

    LockHubConfig config;
    try
    {
        config = LockHubConfig::load(args.config_dir, args.config_path);
        Logger::instance().set_level(Logger::level_from_string(config.log_level()));
        if (!config.log_file().empty() && !Logger::instance().set_logfile(config.log_file().string()))
        {
            std::cerr << "Warning: cannot open log file " << config.log_file() << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    ServiceDependencyProvider deps;
    LockManagerRegistryFactory registries(
        config.domain(), [&config](const std::string &) { return config.lock_managers(); }, deps);

    std::shared_ptr<LockManagerRegistry> registry;
    try
    {
        registry = registries.get(args.domain);
    }
    catch (const ConfigError &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Domain: " << registry->domain() << "\n";
    for (const auto &file : config.loaded_files())
    {
        std::cout << "Loaded: " << file.string() << "\n";
    }
    std::cout << "Lock managers (" << registry->names().size() << "):\n";
    for (const auto &name : registry->names())
    {
        std::cout << "  " << name << " " << registry->config(name).dump() << "\n";
    }

    if (!args.resolve_name.empty())
    {
        try
        {
            auto manager = registry->get(args.resolve_name);
            std::cout << "Resolved '" << args.resolve_name << "' -> " << manager->kind_name() << "\n";
        }
        catch (const std::exception &e)
        {
            std::cerr << "Resolve error: " << e.what() << "\n";
            return 2;
        }
    }
    return 0;
}
