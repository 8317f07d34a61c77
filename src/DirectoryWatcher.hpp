#ifndef DIRECTORY_WATCHER_HPP
#define DIRECTORY_WATCHER_HPP

#include <filesystem>
#include <functional>
#include <system_error>
#include <thread>

// Non-recursive inotify subscription reporting files created in (or moved into) one directory.
// Category subfolders are never watched, so moving files into them cannot feed back into the watch.
class DirectoryWatcher {
public:
    using CreatedHandler = std::function<void(const std::filesystem::path&)>;

    DirectoryWatcher() = default;
    ~DirectoryWatcher();

    DirectoryWatcher(const DirectoryWatcher&) = delete;
    DirectoryWatcher& operator=(const DirectoryWatcher&) = delete;

    // Returns the OS error when the subscription cannot be established; nothing is left open then.
    std::error_code start(const std::filesystem::path& directory, CreatedHandler onCreated);
    // Blocks until the reader thread has exited; no handler call happens after it returns.
    void stop();

private:
    void readLoop();
    void closeDescriptors();

    std::filesystem::path m_directory;
    CreatedHandler m_onCreated;
    std::thread m_thread;
    int m_inotifyFd = -1;
    int m_wakeFd = -1;
};

#endif
