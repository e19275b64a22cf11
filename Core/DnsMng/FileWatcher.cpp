#include "FileWatcher.hpp"
#include "Core/Logger.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>
#include <limits.h>
#include <errno.h>
#include <cstring>
#include <stdexcept>

namespace
{
    // IN_MODIFY: write(2), truncate(2), open(O_TRUNC); писатель может держать fd открытым.
    // *_SELF: файл удалён или подменён через rename.
    constexpr std::uint32_t kWatchMask = IN_MODIFY | IN_DELETE_SELF | IN_MOVE_SELF;

    constexpr std::size_t kEventBufSize = 16 * (sizeof(inotify_event) + NAME_MAX + 1);

    void DrainEventFd(int fd)
    {
        std::uint64_t val = 0;
        while (true)
        {
            ssize_t rc = ::read(fd, &val, sizeof(val));
            if (rc < 0)
            {
                if (errno == EINTR) continue;
                return;
            }
            if (rc == 0) return;
        }
    }
}

FileWatcher::FileWatcher(const Params &p, ReapplyFn reapply)
        : p_(p)
        , reapply_(std::move(reapply))
{
    if (p_.path.empty())
        throw std::invalid_argument("FileWatcher: path is empty");
    if (!reapply_)
        throw std::invalid_argument("FileWatcher: reapply callback is empty");
    if (p_.rearm_interval.count() <= 0)
        p_.rearm_interval = std::chrono::milliseconds(1000);

    in_fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (in_fd_ < 0)
    {
        const std::string err = std::strerror(errno);
        LOGD("watch") << "inotify_init1 failed: " << err;
        throw std::runtime_error("FileWatcher: inotify_init1 failed: " + err);
    }

    stop_fd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (stop_fd_ < 0)
    {
        const std::string err = std::strerror(errno);
        LOGD("watch") << "eventfd create failed: " << err;
        Close_();
        throw std::runtime_error("FileWatcher: eventfd failed: " + err);
    }

    wd_ = ::inotify_add_watch(in_fd_, p_.path.c_str(), kWatchMask);
    if (wd_ < 0)
    {
        const std::string err = std::strerror(errno);
        LOGD("watch") << "inotify_add_watch " << p_.path << " failed: " << err;
        Close_();
        throw std::runtime_error("FileWatcher: cannot watch " + p_.path + ": " + err);
    }

    thread_ = std::jthread([this](std::stop_token st) { ThreadLoop_(st); });

    LOGI("watch") << "Watching " << p_.path << " for changes";
}

FileWatcher::~FileWatcher()
{
    Stop();
}

bool FileWatcher::IsRunning() const
{
    return thread_.joinable();
}

std::uint64_t FileWatcher::Reapplies() const
{
    return reapplies_.load(std::memory_order_acquire);
}

void FileWatcher::SignalEventFd_(int fd)
{
    if (fd < 0) return;
    std::uint64_t one = 1;
    (void)::write(fd, &one, sizeof(one)); // eventfd-счётчик не переполнится от одного сигнала
}

void FileWatcher::Stop()
{
    if (thread_.joinable())
    {
        thread_.request_stop();
        SignalEventFd_(stop_fd_);
        thread_.join();
        LOGD("watch") << "Stopped";
    }
    Close_();
}

void FileWatcher::Close_()
{
    if (in_fd_ >= 0) { ::close(in_fd_); in_fd_ = -1; } // закрытие inotify снимает и все watch
    if (stop_fd_ >= 0) { ::close(stop_fd_); stop_fd_ = -1; }
    wd_ = -1;
}

bool FileWatcher::Arm_()
{
    const int wd = ::inotify_add_watch(in_fd_, p_.path.c_str(), kWatchMask);
    if (wd < 0)
    {
        LOGE("watch") << "inotify_add_watch " << p_.path << " failed: " << std::strerror(errno);
        wd_ = -1;
        return false;
    }
    wd_ = wd;
    return true;
}

void FileWatcher::Disarm_()
{
    if (wd_ < 0) return;
    // EINVAL: ядро уже сняло watch (файл удалён), это не ошибка
    if (::inotify_rm_watch(in_fd_, wd_) != 0 && errno != EINVAL)
    {
        LOGW("watch") << "inotify_rm_watch failed: " << std::strerror(errno);
    }
    wd_ = -1;
}

void FileWatcher::Reapply_(const char *reason)
{
    LOGI("watch") << "Detected change in " << p_.path << " (" << reason << "), restoring DNS settings";

    // Свою запись не наблюдаем: снимаем watch на время reapply и ставим заново по пути
    // (после подмены файла путь указывает на новый inode).
    Disarm_();
    reapplies_.fetch_add(1, std::memory_order_acq_rel);
    try
    {
        reapply_();
    }
    catch (const std::exception &e)
    {
        LOGE("watch") << "Error restoring DNS: " << e.what();
    }
    catch (...)
    {
        LOGE("watch") << "Error restoring DNS: unknown exception";
    }

    if (!Arm_())
    {
        LOGW("watch") << "Not watching " << p_.path << ", retry in " << p_.rearm_interval.count() << " ms";
    }
}

void FileWatcher::HandleEvents_()
{
    alignas(inotify_event) char buf[kEventBufSize];

    while (true)
    {
        const ssize_t len = ::read(in_fd_, buf, sizeof(buf));
        if (len < 0)
        {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return;
            LOGE("watch") << "read(inotify) failed: " << std::strerror(errno);
            return;
        }
        if (len == 0) return;

        // Пачка событий одного read() -> не больше одного reapply
        const char *reason = nullptr;
        for (const char *ptr = buf; ptr < buf + len; )
        {
            const auto *ev = reinterpret_cast<const inotify_event *>(ptr);
            ptr += sizeof(inotify_event) + ev->len;

            LOGT("watch") << "inotify wd=" << ev->wd << " mask=0x" << std::hex << ev->mask << std::dec;

            if (ev->mask & IN_Q_OVERFLOW)
            {
                LOGE("watch") << "inotify queue overflow, events lost";
                reason = "queue overflow";
                continue;
            }
            // события снятого watch: уже перекрыты нашим reapply
            if (wd_ < 0 || ev->wd != wd_)
                continue;

            if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF))
                reason = (ev->mask & IN_DELETE_SELF) ? "deleted" : "moved";
            else if (ev->mask & IN_IGNORED)
                reason = reason ? reason : "watch removed"; // ядро сняло watch (например, unmount)
            else if ((ev->mask & IN_MODIFY) && !reason)
                reason = "modified";
        }

        if (reason)
            Reapply_(reason);
    }
}

void FileWatcher::ThreadLoop_(std::stop_token st)
{
    LOGD("watch") << "Thread started";
    pollfd pfds[2]{};

    while (!st.stop_requested())
    {
        pfds[0] = { stop_fd_, POLLIN, 0 };
        pfds[1] = { in_fd_,   POLLIN, 0 };

        // без watch ждём с таймаутом, чтобы повторить восстановление
        const int timeout_ms = (wd_ < 0) ? static_cast<int>(p_.rearm_interval.count()) : -1;

        const int rc = ::poll(pfds, 2, timeout_ms);
        if (rc < 0)
        {
            if (errno == EINTR) continue;
            LOGD("watch") << "poll failed: " << std::strerror(errno) << ", subscription closed";
            break;
        }

        if (rc == 0)
        {
            Reapply_("rearm retry");
            continue;
        }

        if (pfds[0].revents & POLLIN)
        {
            DrainEventFd(stop_fd_);
            LOGD("watch") << "Stop signal";
            break;
        }

        if (pfds[1].revents & (POLLERR | POLLHUP | POLLNVAL))
        {
            LOGD("watch") << "inotify descriptor closed";
            break;
        }

        if (pfds[1].revents & POLLIN)
        {
            HandleEvents_();
        }
    }

    LOGD("watch") << "Thread exiting";
}
