#include "Core/Logger.hpp"

#include <boost/core/null_deleter.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/make_shared.hpp>
#include <boost/shared_ptr.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace logging = boost::log;
namespace sinks   = boost::log::sinks;
namespace expr    = boost::log::expressions;
namespace kw      = boost::log::keywords;

BOOST_LOG_ATTRIBUTE_KEYWORD(channel_attr, "Channel", std::string)

namespace
{
    using ConsoleSink = sinks::synchronous_sink<sinks::text_ostream_backend>;
    using FileSink    = sinks::synchronous_sink<sinks::text_file_backend>;

    auto MakeFormatter()
    {
        return expr::stream
               << "[" << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f") << "]"
               << " [" << logging::trivial::severity << "]"
               << " [" << channel_attr << "] "
               << expr::smessage;
    }
}

namespace Logger
{
    void Init(const Options &opts)
    {
        auto core = logging::core::get();
        core->flush();
        core->remove_all_sinks();

        logging::add_common_attributes();

        // консоль
        auto console_backend = boost::make_shared<sinks::text_ostream_backend>();
        console_backend->add_stream(boost::shared_ptr<std::ostream>(&std::clog, boost::null_deleter()));
        console_backend->auto_flush(true);

        auto console = boost::make_shared<ConsoleSink>(console_backend);
        console->set_formatter(MakeFormatter());
        console->set_filter(logging::trivial::severity >= opts.console_min_severity);
        core->add_sink(console);

        // файл с ротацией по размеру
        if (!opts.directory.empty())
        {
            std::filesystem::create_directories(opts.directory);
            const auto pattern = std::filesystem::path(opts.directory) / (opts.base_filename + "_%Y%m%d_%N.log");

            auto file_backend = boost::make_shared<sinks::text_file_backend>(
                    kw::file_name     = pattern.string(),
                    kw::rotation_size = opts.rotation_size,
                    kw::open_mode     = std::ios_base::out | std::ios_base::app);
            file_backend->auto_flush(true);

            auto file = boost::make_shared<FileSink>(file_backend);
            file->set_formatter(MakeFormatter());
            file->set_filter(logging::trivial::severity >= opts.file_min_severity);
            core->add_sink(file);
        }

        LOGD("logger") << opts.app_name << ": logging initialized"
                       << (opts.directory.empty() ? std::string(" (console only)") : " dir=" + opts.directory);
    }

    void Shutdown()
    {
        auto core = logging::core::get();
        core->flush();
        core->remove_all_sinks();
    }

    Severity ParseSeverity(const std::string &name)
    {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        static const std::pair<const char*, Severity> kTable[] = {
                { "trace",   logging::trivial::trace   },
                { "debug",   logging::trivial::debug   },
                { "info",    logging::trivial::info    },
                { "warning", logging::trivial::warning },
                { "warn",    logging::trivial::warning },
                { "error",   logging::trivial::error   },
                { "fatal",   logging::trivial::fatal   },
        };
        for (const auto &[key, sev] : kTable)
        {
            if (s == key) return sev;
        }
        throw std::invalid_argument("unknown log level: '" + name + "'");
    }

    Guard::Guard(const Options &opts)
    {
        Init(opts);
    }

    Guard::~Guard()
    {
        Shutdown();
    }
}
