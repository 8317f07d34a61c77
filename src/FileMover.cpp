#include "FileMover.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
constexpr std::size_t kMaxCollisionAttempts = 10000;

std::atomic<unsigned long> g_tempSequence{0};

// rename(2) that refuses to replace an existing target. Falls back to a plain rename on
// filesystems without RENAME_NOREPLACE support.
std::error_code renameNoReplace(const fs::path& from, const fs::path& to) {
    if (::renameat2(AT_FDCWD, from.c_str(), AT_FDCWD, to.c_str(), RENAME_NOREPLACE) == 0) {
        return {};
    }

    const int err = errno;
    if (err == EINVAL || err == ENOSYS) {
        std::error_code ec;
        fs::rename(from, to, ec);
        return ec;
    }

    return {err, std::system_category()};
}

bool occupied(const fs::path& candidate, std::error_code& ec) {
    // symlink_status so a dangling link still counts as taken.
    const fs::file_status status = fs::symlink_status(candidate, ec);
    if (ec == std::errc::no_such_file_or_directory) {
        ec.clear();
        return false;
    }
    return !ec && fs::exists(status);
}

fs::path candidateName(const fs::path& destinationDir, const fs::path& fileName, std::size_t counter) {
    if (counter == 0) {
        return destinationDir / fileName;
    }
    return destinationDir / (fileName.stem().string() + "_" + std::to_string(counter) + fileName.extension().string());
}
} // namespace

fs::path FileMover::resolveDestination(const fs::path& destinationDir,
                                       const fs::path& fileName,
                                       std::size_t& counter,
                                       std::error_code& ec) {
    ec.clear();
    for (; counter <= kMaxCollisionAttempts; ++counter) {
        fs::path candidate = candidateName(destinationDir, fileName, counter);
        const bool taken = occupied(candidate, ec);
        if (ec) {
            return {};
        }
        if (!taken) {
            return candidate;
        }
    }
    return {};
}

MoveResult FileMover::move(const fs::path& source, const fs::path& destinationDir) const {
    MoveResult result;

    std::error_code ec;
    fs::create_directories(destinationDir, ec);
    if (!ec && !fs::is_directory(destinationDir, ec) && !ec) {
        ec = std::make_error_code(std::errc::not_a_directory);
    }
    if (ec) {
        result.error = OrganizerErrc::DirectoryCreation;
        result.cause = ec;
        return result;
    }

    const fs::path fileName = source.filename();
    std::size_t counter = 0;
    while (true) {
        fs::path candidate = resolveDestination(destinationDir, fileName, counter, ec);
        if (ec || candidate.empty()) {
            result.error = OrganizerErrc::MoveExecution;
            result.cause = ec ? ec : std::make_error_code(std::errc::file_exists);
            return result;
        }

        std::error_code renameErr = renameNoReplace(source, candidate);
        if (!renameErr) {
            result.destination = std::move(candidate);
            return result;
        }

        if (renameErr == std::errc::file_exists) {
            // Another mover claimed the name between the scan and the rename.
            ++counter;
            continue;
        }

        if (renameErr == std::errc::cross_device_link) {
            renameErr = moveAcrossDevices(source, destinationDir, candidate, counter);
            if (!renameErr) {
                result.destination = std::move(candidate);
                return result;
            }
        }

        result.error = OrganizerErrc::MoveExecution;
        result.cause = renameErr;
        return result;
    }
}

std::error_code FileMover::moveAcrossDevices(const fs::path& source,
                                             const fs::path& destinationDir,
                                             fs::path& destination,
                                             std::size_t& counter) const {
    // Stage the copy under a hidden name so an interrupted copy never shows up as the destination.
    const fs::path staging = destinationDir / ("." + source.filename().string() + ".partial-" +
                                               std::to_string(::getpid()) + "-" +
                                               std::to_string(g_tempSequence.fetch_add(1)));

    std::error_code ec;
    fs::copy_file(source, staging, fs::copy_options::none, ec);
    if (ec) {
        std::error_code cleanupErr;
        fs::remove(staging, cleanupErr);
        return ec;
    }

    while (true) {
        ec = renameNoReplace(staging, destination);
        if (!ec) {
            break;
        }

        if (ec != std::errc::file_exists) {
            std::error_code cleanupErr;
            fs::remove(staging, cleanupErr);
            return ec;
        }

        ++counter;
        destination = resolveDestination(destinationDir, source.filename(), counter, ec);
        if (ec || destination.empty()) {
            std::error_code cleanupErr;
            fs::remove(staging, cleanupErr);
            return ec ? ec : std::make_error_code(std::errc::file_exists);
        }
    }

    fs::remove(source, ec);
    if (ec) {
        // Keep exactly one copy: undo the destination so the source stays authoritative.
        std::error_code rollbackErr;
        fs::remove(destination, rollbackErr);
        return ec;
    }

    return {};
}
