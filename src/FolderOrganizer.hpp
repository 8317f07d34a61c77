#ifndef FOLDER_ORGANIZER_HPP
#define FOLDER_ORGANIZER_HPP

#include "Classifier.hpp"
#include "FileMover.hpp"
#include "OrganizerError.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

// Category label -> number of files moved into it during one run.
using OrganizeSummary = std::map<std::string, std::size_t>;

struct OrganizeReport {
    OrganizeSummary moved;
    std::vector<FileFailure> failures;

    std::size_t totalMoved() const;
    // "images: 1, audio: 2", or empty when nothing moved.
    std::string summaryLine() const;
};

// Sorts the files sitting directly in a folder into per-category subfolders.
class FolderOrganizer {
public:
    explicit FolderOrganizer(const Classifier& classifier);

    // Organize the immediate entries of `targetDir`. Per-file failures land in `report.failures`;
    // the returned code is set only when the folder itself cannot be processed.
    std::error_code organize(const std::filesystem::path& targetDir, OrganizeReport& report) const;

private:
    const Classifier& m_classifier;
    FileMover m_mover;
};

// Shared precondition for organize and watch: the target must be an existing directory.
std::error_code validateTargetDirectory(const std::filesystem::path& targetDir);

#endif
