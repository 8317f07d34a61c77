#ifndef ORGANIZER_ERROR_HPP
#define ORGANIZER_ERROR_HPP

#include <filesystem>
#include <string>
#include <system_error>
#include <type_traits>

// Failure taxonomy shared by the mover, the batch organizer and the watch pipeline.
enum class OrganizerErrc {
    DirectoryNotFound = 1,
    DirectoryCreation,
    MoveExecution,
    WatchStart
};

const std::error_category& organizerCategory() noexcept;
std::error_code make_error_code(OrganizerErrc errc) noexcept;

namespace std {
template <>
struct is_error_code_enum<OrganizerErrc> : true_type {};
} // namespace std

// A single file that could not be relocated. `error` is the taxonomy code, `cause` the OS reason.
struct FileFailure {
    std::filesystem::path source;
    std::error_code error;
    std::error_code cause;

    std::string describe() const;
};

#endif
