#include "DirectoryWatcher.hpp"

#include <cerrno>
#include <cstdint>
#include <iostream>
#include <utility>

#include <limits.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace {
constexpr std::uint32_t kWatchMask = IN_CREATE | IN_MOVED_TO | IN_ONLYDIR;
constexpr std::size_t kBufferLength = 16 * (sizeof(struct inotify_event) + NAME_MAX + 1);

std::error_code lastError() {
    return {errno, std::system_category()};
}
} // namespace

DirectoryWatcher::~DirectoryWatcher() {
    stop();
}

std::error_code DirectoryWatcher::start(const std::filesystem::path& directory, CreatedHandler onCreated) {
    stop();

    m_inotifyFd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (m_inotifyFd == -1) {
        return lastError();
    }

    m_wakeFd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (m_wakeFd == -1) {
        const std::error_code ec = lastError();
        closeDescriptors();
        return ec;
    }

    // A single watch on the directory itself; subdirectories are deliberately not added.
    if (::inotify_add_watch(m_inotifyFd, directory.c_str(), kWatchMask) == -1) {
        const std::error_code ec = lastError();
        closeDescriptors();
        return ec;
    }

    m_directory = directory;
    m_onCreated = std::move(onCreated);
    m_thread = std::thread(&DirectoryWatcher::readLoop, this);
    return {};
}

void DirectoryWatcher::stop() {
    if (m_thread.joinable()) {
        const std::uint64_t one = 1;
        if (::write(m_wakeFd, &one, sizeof(one)) != static_cast<ssize_t>(sizeof(one))) {
            std::cerr << "Failed to wake watcher thread: " << lastError().message() << std::endl;
        }
        m_thread.join();
    }

    closeDescriptors();
    m_onCreated = nullptr;
}

void DirectoryWatcher::closeDescriptors() {
    // Closing the inotify descriptor also drops its watch.
    if (m_inotifyFd != -1) {
        ::close(m_inotifyFd);
        m_inotifyFd = -1;
    }
    if (m_wakeFd != -1) {
        ::close(m_wakeFd);
        m_wakeFd = -1;
    }
}

void DirectoryWatcher::readLoop() {
    alignas(struct inotify_event) char buffer[kBufferLength];

    pollfd fds[2] = {
        {m_inotifyFd, POLLIN, 0},
        {m_wakeFd, POLLIN, 0},
    };

    while (true) {
        const int ready = ::poll(fds, 2, -1);
        if (ready == -1) {
            if (errno == EINTR) {
                continue;
            }
            std::cerr << "poll on `" << m_directory.string() << "` failed: " << lastError().message() << std::endl;
            return;
        }

        if (fds[1].revents & POLLIN) {
            return;
        }

        if (!(fds[0].revents & POLLIN)) {
            continue;
        }

        const ssize_t length = ::read(m_inotifyFd, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            std::cerr << "Reading change notifications failed: " << lastError().message() << std::endl;
            return;
        }

        for (char* ptr = buffer; ptr < buffer + length;) {
            const auto* event = reinterpret_cast<const struct inotify_event*>(ptr);
            ptr += sizeof(struct inotify_event) + event->len;

            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "Change notification queue overflowed; some new files in `" << m_directory.string()
                          << "` were not seen. Run organize to pick them up." << std::endl;
                continue;
            }

            if (event->mask & IN_IGNORED) {
                std::cerr << "Watch on `" << m_directory.string() << "` was removed by the system." << std::endl;
                return;
            }

            if ((event->mask & IN_ISDIR) || event->len == 0) {
                continue;
            }

            if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
                m_onCreated(m_directory / event->name);
            }
        }
    }
}
