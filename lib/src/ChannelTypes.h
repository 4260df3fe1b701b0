#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <unordered_map>

namespace tvsort {

// Group assigned to entries that appear before any group-title is seen
constexpr const char* kUngroupedGroup = "未分组";

// Catch-all category for records no template entry claims
constexpr const char* kCatchAllCategory = "其它";

// Marker suffix on category header lines: "{category},#genre#"
constexpr const char* kGenreMarker = "#genre#";

/**
 * One channel entry extracted from a playlist source.
 * name is already normalized through the NameMapping.
 */
struct ChannelRecord {
    std::string group;
    std::string name;
    std::string url;

    // Canonical "name,url" line used for matching and output
    std::string ToLine() const { return name + "," + url; }
};

// Raw channel name -> canonical channel name
using NameMapping = std::unordered_map<std::string, std::string>;

struct TemplateCategory {
    std::string category;
    std::vector<std::string> expected_names;  // Template order is output order
};

using CategoryTemplate = std::vector<TemplateCategory>;

struct ClassifiedCategory {
    std::string category;
    std::vector<std::string> lines;  // "name,url"
};

/**
 * Result of template classification.
 *
 * categories mirrors the template one-to-one (empty categories included).
 * others holds every unclaimed line in aggregation order and is rendered
 * as the trailing catch-all category when non-empty.
 */
struct ClassifiedDocument {
    std::vector<ClassifiedCategory> categories;
    std::vector<std::string> others;
};

struct ClassificationStats {
    size_t matched = 0;
    size_t unmatched = 0;
};

} // namespace tvsort
