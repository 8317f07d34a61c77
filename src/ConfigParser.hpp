#ifndef CONFIG_PARSER_HPP
#define CONFIG_PARSER_HPP

#include "Classifier.hpp"
#include "WatchPipeline.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

#include <nlohmann/json_fwd.hpp>

// Parses config/categories.json and exposes the category table, watch folder and watch options.
class ConfigParser {
public:
    // Location of the configuration file below a config root.
    static std::filesystem::path configPathFor(const std::filesystem::path& configRoot);

    // Load configuration from disk; returns false on I/O or validation errors.
    bool load(const std::filesystem::path& configRoot);
    // Reset to the built-in categories and default options.
    void useDefaults();

    // Returns the validated watch folder path, or empty string when unset or invalid.
    std::string getWatchFolder() const;
    const CategoryTable& getCategories() const;
    const WatchOptions& getWatchOptions() const;

private:
    // Collect placeholder tokens (built-in and user-defined) for later substitution.
    void loadPlaceholders(const nlohmann::json& data);
    // Replace placeholder tokens in strings, logging warnings for unresolved entries.
    std::string applyPlaceholders(const std::string& value) const;
    // Parse and validate the `categories` array, merging into m_categories.
    bool parseCategoryArray(const nlohmann::json& categoriesArray);
    bool parseWatchOptions(const nlohmann::json& data);

    std::string m_watch_folder;
    CategoryTable m_categories = Classifier::defaultTable();
    WatchOptions m_watchOptions;
    std::unordered_map<std::string, std::string> m_placeholders;
};

#endif
