#pragma once

// FileWatcher.hpp: Linux, следит за одним файлом через inotify (IN_MODIFY, удаление,
// подмена) и на внешнее изменение вызывает reapply() в фоновом потоке. Без debounce и
// без сравнения содержимого: события одного чтения inotify -> один reapply.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>
#include <string>
#include <thread>

class FileWatcher
{
public:
    using ReapplyFn = std::function<void()>;

    struct Params
    {
        std::string path;                                           // наблюдаемый файл
        std::chrono::milliseconds rearm_interval{std::chrono::milliseconds(1000)}; // повтор, если файл пропал
    };

public:
    // Ошибка inotify/eventfd или отсутствие файла: std::runtime_error, поток не стартует.
    FileWatcher(const Params &p, ReapplyFn reapply);

    ~FileWatcher();

    FileWatcher(const FileWatcher&)            = delete;
    FileWatcher& operator=(const FileWatcher&) = delete;
    FileWatcher(FileWatcher&&)                 = delete;
    FileWatcher& operator=(FileWatcher&&)      = delete;

    // Остановить поток и освободить дескрипторы; идемпотентно
    void Stop();

    bool IsRunning() const;

    // Сколько раз вызывался reapply (включая неудачные)
    std::uint64_t Reapplies() const;

private:
    void ThreadLoop_(std::stop_token st);
    void HandleEvents_();
    void Reapply_(const char *reason);
    bool Arm_();
    void Disarm_();
    void Close_();
    void SignalEventFd_(int fd);

private:
    Params    p_;
    ReapplyFn reapply_;

    int in_fd_   = -1;  // inotify
    int wd_      = -1;  // текущий watch на p_.path, -1: не подписаны
    int stop_fd_ = -1;  // eventfd для Stop()

    std::atomic<std::uint64_t> reapplies_{0};
    std::jthread thread_;
};
