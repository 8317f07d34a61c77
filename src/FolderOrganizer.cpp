#include "FolderOrganizer.hpp"

#include <iostream>

namespace fs = std::filesystem;

std::size_t OrganizeReport::totalMoved() const {
    std::size_t total = 0;
    for (const auto& [category, count] : moved) {
        total += count;
    }
    return total;
}

std::string OrganizeReport::summaryLine() const {
    std::string line;
    for (const auto& [category, count] : moved) {
        if (count == 0) {
            continue;
        }
        if (!line.empty()) {
            line += ", ";
        }
        line += category + ": " + std::to_string(count);
    }
    return line;
}

std::error_code validateTargetDirectory(const fs::path& targetDir) {
    if (targetDir.empty()) {
        return OrganizerErrc::DirectoryNotFound;
    }

    std::error_code ec;
    if (!fs::is_directory(targetDir, ec) || ec) {
        return OrganizerErrc::DirectoryNotFound;
    }

    return {};
}

FolderOrganizer::FolderOrganizer(const Classifier& classifier) : m_classifier(classifier) {}

std::error_code FolderOrganizer::organize(const fs::path& targetDir, OrganizeReport& report) const {
    report = OrganizeReport{};

    if (auto invalid = validateTargetDirectory(targetDir)) {
        std::cerr << "Target folder `" << targetDir.string() << "` is not an accessible directory." << std::endl;
        return invalid;
    }

    // Snapshot the listing first so directories created while moving are never visited.
    std::vector<fs::path> files;
    std::error_code ec;
    for (fs::directory_iterator iter(targetDir, ec), end; !ec && iter != end; iter.increment(ec)) {
        std::error_code typeErr;
        if (iter->is_regular_file(typeErr) && !typeErr) {
            files.push_back(iter->path());
        }
    }
    if (ec) {
        std::cerr << "Unable to enumerate `" << targetDir.string() << "`: " << ec.message() << std::endl;
        return OrganizerErrc::DirectoryNotFound;
    }

    for (const auto& filePath : files) {
        const std::string category = m_classifier.categoryForPath(filePath);
        const MoveResult result = m_mover.move(filePath, targetDir / category);
        if (!result.succeeded()) {
            FileFailure failure = result.failure(filePath);
            std::cerr << "Failed to move `" << filePath.string() << "`: " << failure.describe() << std::endl;
            report.failures.push_back(std::move(failure));
            continue;
        }

        std::cout << "Moved `" << filePath.string() << "` -> `" << result.destination.string() << "`" << std::endl;
        ++report.moved[category];
    }

    return {};
}
