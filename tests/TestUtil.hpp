#pragma once

// Общие помощники тестов: временный каталог, чтение/запись файлов, ожидание условия,
// подсчёт записей лога уровня error и выше.

#include "Core/Logger.hpp"

#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core/core.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/smart_ptr/make_shared_object.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <chrono>
#include <atomic>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

namespace TestUtil
{
    class TempDir
    {
    public:
        TempDir()
        {
            std::string tmpl = (std::filesystem::temp_directory_path() / "dnsmng_test_XXXXXX").string();
            if (::mkdtemp(tmpl.data()) == nullptr)
                throw std::runtime_error("mkdtemp failed");
            path_ = tmpl;
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir&)            = delete;
        TempDir& operator=(const TempDir&) = delete;

        std::string File(const std::string &name) const { return (path_ / name).string(); }
        const std::filesystem::path &Path() const { return path_; }

    private:
        std::filesystem::path path_;
    };

    inline std::string ReadAll(const std::string &path)
    {
        std::ifstream f(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    }

    inline void WriteAll(const std::string &path, const std::string &content)
    {
        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        f << content;
    }

    inline bool WaitFor(const std::function<bool()> &pred,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (pred()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return pred();
    }

    class ErrorCounterBackend
        : public boost::log::sinks::basic_sink_backend<boost::log::sinks::concurrent_feeding>
    {
    public:
        void consume(const boost::log::record_view &rec)
        {
            const auto sev = boost::log::extract<Logger::Severity>("Severity", rec);
            if (sev && *sev >= boost::log::trivial::error)
                ++errors_;
        }

        int Errors() const { return errors_.load(); }

    private:
        std::atomic<int> errors_{0};
    };

    // Пока жив объект, считает записи уровня error+ во всех каналах
    class ErrorLogCounter
    {
    public:
        using Sink = boost::log::sinks::synchronous_sink<ErrorCounterBackend>;

        ErrorLogCounter()
            : sink_(boost::make_shared<Sink>())
        {
            boost::log::core::get()->add_sink(sink_);
        }

        ~ErrorLogCounter()
        {
            boost::log::core::get()->remove_sink(sink_);
        }

        ErrorLogCounter(const ErrorLogCounter&)            = delete;
        ErrorLogCounter& operator=(const ErrorLogCounter&) = delete;

        int Errors() const { return sink_->locked_backend()->Errors(); }

    private:
        boost::shared_ptr<Sink> sink_;
    };
}
