#ifndef CLASSIFIER_HPP
#define CLASSIFIER_HPP

#include <filesystem>
#include <string>
#include <unordered_map>
#include <vector>

// Category ties a label (also the destination subfolder name) to the extensions it collects.
struct Category {
    std::string label;
    std::vector<std::string> extensions;
};

// Ordered category list; earlier entries win when extension sets overlap.
using CategoryTable = std::vector<Category>;

// Maps file extensions to category labels. Immutable once constructed.
class Classifier {
public:
    static constexpr const char* kFallbackCategory = "others";

    explicit Classifier(CategoryTable table);

    // Label for the given extension (leading dot optional, any case); "others" when nothing matches.
    std::string categoryFor(const std::string& extension) const;
    // Label for the extension of the given path.
    std::string categoryForPath(const std::filesystem::path& file) const;

    const CategoryTable& table() const;

    // The six built-in categories.
    static CategoryTable defaultTable();
    // Normalize configured extensions (trim whitespace, enforce dot prefix, lower-case).
    static std::string normalizeExtension(std::string extension);

private:
    // Key for a file's extension: dot prefix enforced, lower-cased, nothing else touched.
    static std::string lookupKey(std::string extension);

    CategoryTable m_table;
    std::unordered_map<std::string, std::string> m_extensionToCategory;
};

#endif
