#ifndef FILE_MOVER_HPP
#define FILE_MOVER_HPP

#include "OrganizerError.hpp"

#include <cstddef>
#include <filesystem>
#include <system_error>

// Outcome of a single move. On success `destination` holds the resolved path.
struct MoveResult {
    std::filesystem::path destination;
    std::error_code error;
    std::error_code cause;

    bool succeeded() const { return !error; }
    FileFailure failure(const std::filesystem::path& source) const { return {source, error, cause}; }
};

// Moves a file into a directory without ever overwriting an existing entry.
// Collisions are resolved as `stem_1.ext`, `stem_2.ext`, ...
class FileMover {
public:
    // Create `destinationDir` if needed, pick a free name and move `source` there.
    MoveResult move(const std::filesystem::path& source, const std::filesystem::path& destinationDir) const;

    // First free candidate for `fileName` in `destinationDir`, starting the suffix scan at `counter`
    // (0 means the bare name). `counter` is updated to the value used. Empty when no name is free.
    static std::filesystem::path resolveDestination(const std::filesystem::path& destinationDir,
                                                    const std::filesystem::path& fileName,
                                                    std::size_t& counter,
                                                    std::error_code& ec);

private:
    // Copy+rename fallback used when source and destination live on different filesystems.
    std::error_code moveAcrossDevices(const std::filesystem::path& source,
                                      const std::filesystem::path& destinationDir,
                                      std::filesystem::path& destination,
                                      std::size_t& counter) const;
};

#endif
