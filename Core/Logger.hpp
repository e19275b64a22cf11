#pragma once

// Logger.hpp: логирование через Boost.Log.
// Глобальный severity_channel_logger, макросы LOGT/LOGD/LOGI/LOGW/LOGE(channel) << ...
// Синки (консоль + ротируемый файл) ставит Logger::Guard.

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>

#include <cstddef>
#include <string>

namespace Logger
{
    using Severity      = boost::log::trivial::severity_level;
    using ChannelLogger = boost::log::sources::severity_channel_logger_mt<Severity, std::string>;

    BOOST_LOG_INLINE_GLOBAL_LOGGER_DEFAULT(Global, ChannelLogger)

    struct Options
    {
        std::string app_name      = "dnsmng";
        std::string directory;                  // пусто: только консоль
        std::string base_filename = "dnsmng";

        Severity file_min_severity    = boost::log::trivial::info;
        Severity console_min_severity = boost::log::trivial::info;

        std::size_t rotation_size = 10 * 1024 * 1024;
    };

    /**
     * @brief Установить синки согласно opts. Повторный вызов заменяет синки.
     * @throws std::exception при ошибке создания каталога логов.
     */
    void Init(const Options &opts);

    /**
     * @brief Сбросить буферы и снять все синки.
     */
    void Shutdown();

    /**
     * @brief "trace"/"debug"/"info"/"warning"/"error"/"fatal" -> Severity.
     * @throws std::invalid_argument для неизвестного имени.
     */
    Severity ParseSeverity(const std::string &name);

    // RAII: Init в конструкторе, Shutdown в деструкторе.
    class Guard
    {
    public:
        explicit Guard(const Options &opts);
        ~Guard();

        Guard(const Guard&)            = delete;
        Guard& operator=(const Guard&) = delete;
    };
}

#define DNSMNG_LOG(channel, sev) \
    BOOST_LOG_CHANNEL_SEV(::Logger::Global::get(), std::string(channel), ::boost::log::trivial::sev)

#define LOGT(channel) DNSMNG_LOG(channel, trace)
#define LOGD(channel) DNSMNG_LOG(channel, debug)
#define LOGI(channel) DNSMNG_LOG(channel, info)
#define LOGW(channel) DNSMNG_LOG(channel, warning)
#define LOGE(channel) DNSMNG_LOG(channel, error)
