#pragma once

#include "ChannelTypes.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace tvsort {

/**
 * ConfigLoader
 *
 * Loads the three configuration files the sorter reads:
 * - source list:  one playlist URL per line
 * - template:     "{category},#genre#" headers followed by channel names
 * - name mapping: "{oldName},{newName}" lines
 *
 * Each file has a pure Parse* function and a Load* wrapper that reads the
 * file and applies the missing-file policy. Missing files never throw:
 * the source list falls back to a default URL, the mapping and template
 * come back empty.
 */
class ConfigLoader {
public:
    using LogCallback = std::function<void(const std::string& message)>;

    explicit ConfigLoader(LogCallback log_callback = nullptr);

    /**
     * Load playlist source URLs
     * @param path Source list file
     * @param default_url Used when the file is missing, unreadable or has no URLs
     * @return At least one URL
     */
    std::vector<std::string> LoadSourceUrls(const std::string& path, const std::string& default_url);

    /**
     * Load the category template
     * @param path Template file
     * @return Template, empty when the file is missing or has no categories
     */
    CategoryTemplate LoadCategoryTemplate(const std::string& path);

    /**
     * Load the channel name mapping
     * @param path Mapping file
     * @return Mapping, empty when the file is missing
     */
    NameMapping LoadChannelMapping(const std::string& path);

    /**
     * Parse source list text. Blank lines and '#' comments are skipped,
     * as are lines that do not start with http:// or https://. Only the
     * first whitespace-delimited token of a line is kept.
     */
    static std::vector<std::string> ParseSourceList(const std::string& text);

    /**
     * Parse template text. Names before the first header are ignored.
     * A repeated header continues its existing category.
     */
    static CategoryTemplate ParseCategoryTemplate(const std::string& text);

    /**
     * Parse mapping text. Lines without a comma are skipped; the split is
     * on the first comma and both sides are trimmed. Later lines override
     * earlier ones for the same old name.
     */
    static NameMapping ParseChannelMapping(const std::string& text);

    /**
     * Read a whole UTF-8 text file, dropping a leading byte order mark.
     * @return File contents, or nullopt if the file cannot be opened
     */
    static std::optional<std::string> ReadTextFile(const std::string& path);

private:
    void Log(const std::string& message);

    LogCallback log_callback_;
};

} // namespace tvsort
