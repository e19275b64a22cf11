#pragma once

// Cli.hpp: аргументы командной строки dnsmng (CLI11).

#include <optional>
#include <string>

struct CliOptions
{
    std::string config      = "/etc/dnsmng/config.json";
    std::string set;
    std::string resolv_conf = "/etc/resolv.conf";
    std::string state       = "/var/lib/dnsmng/last_dns";
    std::string log_dir;
    std::string log_level   = "info";
    bool        verbose     = false;
    bool        no_watch    = false;
};

/**
 * @brief Разобрать argv в opts.
 * @return std::nullopt: продолжать работу; иначе код выхода процесса
 *         (0 после --help, 1 при ошибке разбора).
 */
std::optional<int> ParseCommandLine(int argc, const char *const *argv, CliOptions &opts);
