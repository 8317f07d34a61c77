#include "Classifier.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

Classifier::Classifier(CategoryTable table) : m_table(std::move(table)) {
    for (const auto& category : m_table) {
        for (const auto& ext : category.extensions) {
            std::string normalized = normalizeExtension(ext);
            if (normalized.empty()) {
                continue;
            }

            // emplace keeps the first mapping, so table order decides overlaps.
            m_extensionToCategory.emplace(std::move(normalized), category.label);
        }
    }
}

std::string Classifier::categoryFor(const std::string& extension) const {
    const std::string normalized = lookupKey(extension);
    if (normalized.empty()) {
        return kFallbackCategory;
    }

    auto it = m_extensionToCategory.find(normalized);
    if (it == m_extensionToCategory.end()) {
        return kFallbackCategory;
    }

    return it->second;
}

std::string Classifier::categoryForPath(const std::filesystem::path& file) const {
    return categoryFor(file.has_extension() ? file.extension().string() : std::string{});
}

const CategoryTable& Classifier::table() const {
    return m_table;
}

CategoryTable Classifier::defaultTable() {
    return {
        {"images", {".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".webp"}},
        {"videos", {".mp4", ".mkv", ".mov", ".avi", ".flv", ".wmv"}},
        {"documents", {".pdf", ".doc", ".docx", ".xls", ".xlsx", ".ppt", ".pptx", ".txt", ".rtf"}},
        {"audio", {".mp3", ".wav", ".flac", ".aac", ".ogg", ".m4a"}},
        {"archives", {".zip", ".rar", ".7z", ".tar", ".gz", ".bz2"}},
        {"code", {".py", ".js", ".java", ".c", ".cpp", ".html", ".css", ".php"}}
    };
}

std::string Classifier::lookupKey(std::string extension) {
    // A bare dot carries no extension.
    if (extension.empty() || extension == ".") {
        return {};
    }

    if (extension.front() != '.') {
        extension.insert(extension.begin(), '.');
    }

    std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return extension;
}

std::string Classifier::normalizeExtension(std::string extension) {
    extension.erase(std::remove_if(extension.begin(), extension.end(), [](unsigned char ch) {
        return std::isspace(ch);
    }), extension.end());

    return lookupKey(std::move(extension));
}
