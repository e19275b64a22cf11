#include "Cli.hpp"

#include <CLI/CLI.hpp>

std::optional<int> ParseCommandLine(int argc, const char *const *argv, CliOptions &opts)
{
    CLI::App app{"dnsmng - switch DNS profiles and keep resolv.conf pinned to the active one", "dnsmng"};
    app.add_option("--config", opts.config, "Path to the config file")->type_name("PATH")->capture_default_str();
    app.add_option("--set", opts.set, "DNS profile to set (e.g. google, cloudflare); empty restores the last one");
    app.add_option("--resolv-conf", opts.resolv_conf, "Resolver file to manage")->type_name("PATH")->capture_default_str();
    app.add_option("--state", opts.state, "File keeping the last selected profile")->type_name("PATH")->capture_default_str();
    app.add_flag("--no-watch", opts.no_watch, "Apply the profile and exit without watching");
    app.add_option("--log-dir", opts.log_dir, "Directory for rotating log files (console only if empty)")->type_name("DIR");
    app.add_option("--log-level", opts.log_level, "Log level ('trace', 'debug', 'info', 'warning', 'error')")
            ->type_name("LEVEL")
            ->capture_default_str();
    app.add_flag("-v,--verbose", opts.verbose, "Verbose logging (same as --log-level=debug)");

    try
    {
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e)
    {
        // app.exit печатает справку или ошибку; свои коды CLI11 (106, 109, ...) сводим к 1
        const int rc = app.exit(e);
        return rc == 0 ? 0 : 1;
    }
    return std::nullopt;
}
