// DnsMng.cpp: точка входа. Выбор/восстановление профиля DNS и охрана resolv.conf.
// Логирование через Boost.Log макросы LOG*, аргументы через CLI11.

#include "Core/Logger.hpp"
#include "Profiles.hpp"
#include "ResolvConf.hpp"
#include "LastSelection.hpp"
#include "Restore.hpp"
#include "FileWatcher.hpp"
#include "Cli.hpp"

#include <csignal>
#include <cstring>
#include <exception>
#include <optional>
#include <stdexcept>
#include <string>

#include <pthread.h>
#include <signal.h>
#include <unistd.h>

namespace
{
    bool IsElevated()
    {
        return (::geteuid() == 0);
    }

    // SIGINT/SIGTERM блокируем до старта потоков: вотчер наследует маску,
    // сигнал забирает только главный поток через sigwait.
    sigset_t BlockTerminationSignals()
    {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        const int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
        if (rc != 0)
            throw std::runtime_error(std::string("pthread_sigmask failed: ") + std::strerror(rc));
        return set;
    }

    int WaitForSignal(const sigset_t &set)
    {
        int sig = 0;
        const int rc = ::sigwait(&set, &sig);
        if (rc != 0)
            throw std::runtime_error(std::string("sigwait failed: ") + std::strerror(rc));
        return sig;
    }
}

static int DnsMngMain(const CliOptions &opts)
{
    LOGI("dnsmng") << "Starting dnsmng";
    LOGD("dnsmng") << "Args: config=" << opts.config
                   << " set=" << (opts.set.empty() ? "<last>" : opts.set)
                   << " resolv_conf=" << opts.resolv_conf
                   << " state=" << opts.state
                   << " watch=" << (opts.no_watch ? "off" : "on");

    if (!IsElevated())
    {
        LOGW("dnsmng") << "Not running as root, writes to " << opts.resolv_conf << " may fail";
    }

    try
    {
        const sigset_t signals = BlockTerminationSignals();

        const Profiles profiles = Profiles::Load(opts.config);
        LOGD("dnsmng") << "Profiles: " << profiles.Size();

        ResolvConf::Params rp;
        rp.path = opts.resolv_conf;
        const ResolvConf resolv(rp);

        LastSelection::Params lp;
        lp.path = opts.state;
        const LastSelection last(lp);

        Restore::Params sp;
        sp.requested = opts.set;
        const Restore::Result active = Restore(profiles, resolv, last).Run(sp);

        if (opts.no_watch)
        {
            LOGI("dnsmng") << "Watch disabled, exiting";
            return 0;
        }

        // Активный набор адресов вычислен один раз и используется вотчером как есть
        FileWatcher::Params wp;
        wp.path = resolv.Path();
        FileWatcher watcher(wp, [&resolv, &active]()
        {
            resolv.Apply(active.servers);
            LOGI("watch") << "Restored DNS profile '" << active.profile << "'";
        });

        const int sig = WaitForSignal(signals);
        LOGI("dnsmng") << "Signal " << sig << " (" << ::strsignal(sig) << "), shutting down";

        watcher.Stop();
    }
    catch (const std::exception &e)
    {
        LOGE("dnsmng") << "Fatal: " << e.what();
        return 1;
    }

    LOGI("dnsmng") << "Shutdown complete";
    return 0;
}

int main(int argc, char **argv)
{
    CliOptions opts;

    if (const std::optional<int> rc = ParseCommandLine(argc, argv, opts))
        return *rc;

    Logger::Options log_opts;
    log_opts.app_name      = "dnsmng";
    log_opts.directory     = opts.log_dir;
    log_opts.base_filename = "dnsmng";
    try
    {
        const Logger::Severity sev = opts.verbose ? boost::log::trivial::debug
                                                  : Logger::ParseSeverity(opts.log_level);
        log_opts.console_min_severity = sev;
        log_opts.file_min_severity    = sev;
    }
    catch (const std::exception &e)
    {
        LOGE("dnsmng") << e.what();
        return 1;
    }

    try
    {
        Logger::Guard lg(log_opts);
        return DnsMngMain(opts);
    }
    catch (const std::exception &e)
    {
        // сюда попадаем только при ошибке настройки логгера
        LOGE("dnsmng") << "Logger setup failed: " << e.what();
        return 1;
    }
}
