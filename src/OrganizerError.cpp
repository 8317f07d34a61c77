#include "OrganizerError.hpp"

namespace {
class OrganizerCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "folder_sorter";
    }

    std::string message(int value) const override {
        switch (static_cast<OrganizerErrc>(value)) {
        case OrganizerErrc::DirectoryNotFound:
            return "target directory does not exist or is not a directory";
        case OrganizerErrc::DirectoryCreation:
            return "unable to create category directory";
        case OrganizerErrc::MoveExecution:
            return "unable to move file";
        case OrganizerErrc::WatchStart:
            return "unable to start watching directory";
        }
        return "unknown folder_sorter error";
    }
};
} // namespace

const std::error_category& organizerCategory() noexcept {
    static const OrganizerCategory category;
    return category;
}

std::error_code make_error_code(OrganizerErrc errc) noexcept {
    return {static_cast<int>(errc), organizerCategory()};
}

std::string FileFailure::describe() const {
    std::string text = error ? error.message() : std::string("unknown failure");
    if (cause) {
        text += ": " + cause.message();
    }
    return text;
}
