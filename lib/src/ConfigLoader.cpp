#include "ConfigLoader.h"
#include "playlist/PlaylistUtils.h"
#include <fstream>
#include <sstream>
#include <unordered_map>

namespace tvsort {

namespace {

bool IsSupportedScheme(const std::string& line) {
    std::string lower = to_lower_ascii(line);
    return starts_with(lower, "http://") || starts_with(lower, "https://");
}

std::string FirstToken(const std::string& line) {
    size_t end = line.find_first_of(" \t");
    return end == std::string::npos ? line : line.substr(0, end);
}

} // namespace

ConfigLoader::ConfigLoader(LogCallback log_callback)
    : log_callback_(std::move(log_callback)) {
}

std::vector<std::string> ConfigLoader::LoadSourceUrls(const std::string& path, const std::string& default_url) {
    auto text = ReadTextFile(path);
    if (!text) {
        Log("Warning: source list " + path + " not found, using default source");
        return {default_url};
    }

    std::vector<std::string> urls = ParseSourceList(*text);
    if (urls.empty()) {
        Log("Warning: source list " + path + " has no URLs, using default source");
        return {default_url};
    }

    for (const auto& url : urls) {
        Log("Loaded source: " + url);
    }
    return urls;
}

CategoryTemplate ConfigLoader::LoadCategoryTemplate(const std::string& path) {
    auto text = ReadTextFile(path);
    if (!text) {
        Log("Error: template file " + path + " not found");
        return {};
    }

    CategoryTemplate category_template = ParseCategoryTemplate(*text);
    size_t name_count = 0;
    for (const auto& category : category_template) {
        name_count += category.expected_names.size();
    }
    Log("Loaded template: " + std::to_string(category_template.size()) + " categories, " +
        std::to_string(name_count) + " channel names");
    return category_template;
}

NameMapping ConfigLoader::LoadChannelMapping(const std::string& path) {
    auto text = ReadTextFile(path);
    if (!text) {
        Log("Mapping file " + path + " not found, channel names are used as-is");
        return {};
    }

    NameMapping mapping = ParseChannelMapping(*text);
    Log("Loaded " + std::to_string(mapping.size()) + " channel name mappings");
    return mapping;
}

std::vector<std::string> ConfigLoader::ParseSourceList(const std::string& text) {
    std::vector<std::string> urls;

    for (const auto& raw_line : split_lines(text)) {
        std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        if (!IsSupportedScheme(line)) {
            continue;
        }
        urls.push_back(FirstToken(line));
    }

    return urls;
}

CategoryTemplate ConfigLoader::ParseCategoryTemplate(const std::string& text) {
    CategoryTemplate category_template;
    std::unordered_map<std::string, size_t> index_by_name;
    size_t current = std::string::npos;

    for (const auto& raw_line : split_lines(text)) {
        std::string line = trim(raw_line);
        if (line.empty()) {
            continue;
        }

        if (line.find(std::string(",") + kGenreMarker) != std::string::npos) {
            std::string name = trim(line.substr(0, line.find(',')));

            auto it = index_by_name.find(name);
            if (it == index_by_name.end()) {
                TemplateCategory category;
                category.category = name;
                category_template.push_back(std::move(category));
                it = index_by_name.emplace(name, category_template.size() - 1).first;
            }
            current = it->second;
            continue;
        }

        if (current != std::string::npos) {
            category_template[current].expected_names.push_back(line);
        }
    }

    return category_template;
}

NameMapping ConfigLoader::ParseChannelMapping(const std::string& text) {
    NameMapping mapping;

    for (const auto& raw_line : split_lines(text)) {
        std::string line = trim(raw_line);
        size_t comma = line.find(',');
        if (line.empty() || comma == std::string::npos) {
            continue;
        }

        std::string old_name = trim(line.substr(0, comma));
        std::string new_name = trim(line.substr(comma + 1));
        mapping[old_name] = new_name;
    }

    return mapping;
}

std::optional<std::string> ConfigLoader::ReadTextFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return strip_utf8_bom(contents.str());
}

void ConfigLoader::Log(const std::string& message) {
    if (log_callback_) {
        log_callback_("[ConfigLoader] " + message);
    }
}

} // namespace tvsort
