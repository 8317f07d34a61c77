#include "ConfigParser.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {
// Category labels double as folder names below the target directory.
bool isValidLabel(const std::string& label) {
    return !label.empty() && label != "." && label != ".." && label.find('/') == std::string::npos &&
           label != Classifier::kFallbackCategory;
}
} // namespace

std::filesystem::path ConfigParser::configPathFor(const std::filesystem::path& configRoot) {
    return configRoot / "config" / "categories.json";
}

std::string ConfigParser::getWatchFolder() const {
    if (m_watch_folder.empty()) {
        return {};
    }

    // Confirm the folder exists before handing it back to callers.
    std::error_code ec;
    if (std::filesystem::is_directory(m_watch_folder, ec)) {
        return m_watch_folder;
    }

    if (ec) {
        std::cerr << "Unable to validate folder `" << m_watch_folder << "`: " << ec.message() << std::endl;
        return {};
    }

    std::cerr << "Configured watch folder `" << m_watch_folder << "` is not a directory." << std::endl;
    return {};
}

const CategoryTable& ConfigParser::getCategories() const {
    return m_categories;
}

const WatchOptions& ConfigParser::getWatchOptions() const {
    return m_watchOptions;
}

void ConfigParser::useDefaults() {
    m_watch_folder.clear();
    m_categories = Classifier::defaultTable();
    m_watchOptions = WatchOptions{};
    m_placeholders.clear();
}

bool ConfigParser::load(const std::filesystem::path& configRoot) {
    const std::filesystem::path configPath = configPathFor(configRoot);

    std::ifstream jsonFile(configPath);
    if (!jsonFile) {
        std::cerr << "Failed to open configuration file: " << configPath << std::endl;
        return false;
    }

    json data;
    try {
        jsonFile >> data;
    } catch (const json::parse_error& e) {
        std::cerr << "Failed to parse configuration file: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "Invalid configuration: top level must be an object." << std::endl;
        return false;
    }

    useDefaults();
    loadPlaceholders(data);

    if (auto it = data.find("watch_folder"); it != data.end()) {
        if (!it->is_string()) {
            std::cerr << "`watch_folder` must be a string." << std::endl;
            return false;
        }
        m_watch_folder = applyPlaceholders(it->get<std::string>());
    }

    bool useDefaultCategories = true;
    if (auto it = data.find("use_default_categories"); it != data.end()) {
        if (!it->is_boolean()) {
            std::cerr << "`use_default_categories` must be a boolean value." << std::endl;
            return false;
        }
        useDefaultCategories = it->get<bool>();
    }
    if (!useDefaultCategories) {
        m_categories.clear();
    }

    if (auto it = data.find("categories"); it != data.end()) {
        if (!parseCategoryArray(*it)) {
            return false;
        }
    } else if (!useDefaultCategories) {
        std::cerr << "No categories configured; every file will be filed under `" << Classifier::kFallbackCategory
                  << "`." << std::endl;
    }

    if (!parseWatchOptions(data)) {
        return false;
    }

    std::cout << "Loaded " << m_categories.size() << " categor" << (m_categories.size() == 1 ? "y" : "ies")
              << " from " << configPath << std::endl;
    return true;
}

bool ConfigParser::parseCategoryArray(const json& categoriesArray) {
    if (!categoriesArray.is_array()) {
        std::cerr << "Invalid configuration: `categories` must be an array." << std::endl;
        return false;
    }

    for (const auto& categoryJson : categoriesArray) {
        if (!categoryJson.is_object()) {
            std::cerr << "Invalid category entry: expected an object." << std::endl;
            return false;
        }

        auto nameIt = categoryJson.find("name");
        if (nameIt == categoryJson.end() || !nameIt->is_string()) {
            std::cerr << "Invalid category: missing or invalid `name`." << std::endl;
            return false;
        }

        Category category;
        category.label = nameIt->get<std::string>();
        if (!isValidLabel(category.label)) {
            std::cerr << "Invalid category name `" << category.label << "`." << std::endl;
            return false;
        }

        auto extensionsIt = categoryJson.find("extensions");
        if (extensionsIt == categoryJson.end() || !extensionsIt->is_array()) {
            std::cerr << "Invalid category `" << category.label << "`: `extensions` must be an array." << std::endl;
            return false;
        }

        for (const auto& ext : *extensionsIt) {
            if (!ext.is_string()) {
                std::cerr << "Invalid category `" << category.label << "`: each extension must be a string." << std::endl;
                return false;
            }

            std::string normalized = Classifier::normalizeExtension(ext.get<std::string>());
            if (normalized.empty()) {
                std::cerr << "Invalid category `" << category.label << "`: empty extension." << std::endl;
                return false;
            }
            category.extensions.push_back(std::move(normalized));
        }

        if (category.extensions.empty()) {
            std::cerr << "Invalid category `" << category.label << "`: at least one extension is required." << std::endl;
            return false;
        }

        auto existing = std::find_if(m_categories.begin(), m_categories.end(),
                                     [&](const Category& c) { return c.label == category.label; });
        if (existing != m_categories.end()) {
            existing->extensions.insert(existing->extensions.end(), category.extensions.begin(), category.extensions.end());
        } else {
            m_categories.push_back(std::move(category));
        }
    }

    return true;
}

bool ConfigParser::parseWatchOptions(const json& data) {
    if (auto it = data.find("settle_delay_ms"); it != data.end()) {
        if (!it->is_number_integer() || it->get<long long>() < 0) {
            std::cerr << "`settle_delay_ms` must be a non-negative integer." << std::endl;
            return false;
        }
        m_watchOptions.settleDelay = std::chrono::milliseconds(it->get<long long>());
    }

    if (auto it = data.find("worker_threads"); it != data.end()) {
        if (!it->is_number_integer() || it->get<long long>() < 1) {
            std::cerr << "`worker_threads` must be a positive integer." << std::endl;
            return false;
        }
        m_watchOptions.workerThreads = it->get<std::size_t>();
    }

    return true;
}

void ConfigParser::loadPlaceholders(const json& data) {
    m_placeholders.clear();

    // Environment-backed defaults; the `placeholders` map may override them.
    if (const char* home = std::getenv("HOME")) {
        m_placeholders["home"] = home;
    }
    if (const char* user = std::getenv("USER")) {
        m_placeholders["user"] = user;
    }

    auto placeholdersIt = data.find("placeholders");
    if (placeholdersIt == data.end()) {
        return;
    }

    if (!placeholdersIt->is_object()) {
        std::cerr << "`placeholders` must be an object of key/value strings." << std::endl;
        return;
    }

    for (auto it = placeholdersIt->begin(); it != placeholdersIt->end(); ++it) {
        if (!it.value().is_string()) {
            std::cerr << "Placeholder `" << it.key() << "` must be a string." << std::endl;
            continue;
        }
        m_placeholders[it.key()] = it.value().get<std::string>();
    }
}

std::string ConfigParser::applyPlaceholders(const std::string& value) const {
    std::string result = value;
    for (const auto& [key, replacement] : m_placeholders) {
        const std::string token = "{{" + key + "}}";
        std::size_t pos = 0;
        // Replace all occurrences instead of just the first to allow repeated tokens.
        while ((pos = result.find(token, pos)) != std::string::npos) {
            result.replace(pos, token.size(), replacement);
            pos += replacement.size();
        }
    }

    if (result.find("{{") != std::string::npos) {
        std::cerr << "Warning: unresolved placeholder detected in value `" << result << "`." << std::endl;
    }

    return result;
}
