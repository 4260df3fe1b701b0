#include "GroupedTextParser.h"
#include "PlaylistUtils.h"

namespace tvsort {

std::vector<ChannelRecord> GroupedTextParser::Parse(
    const std::string& raw_text,
    const NameMapping& mapping) const {

    GroupAccumulator groups;
    std::string current_group = kUngroupedGroup;

    for (const auto& raw_line : split_lines(strip_utf8_bom(raw_text))) {
        const std::string line = trim(raw_line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t comma = line.find(',');
        if (comma == std::string::npos) {
            continue;
        }

        if (IsGroupHeader(line)) {
            std::string group = trim(line.substr(0, comma));
            current_group = group.empty() ? std::string(kUngroupedGroup) : group;
            continue;
        }

        std::string name = trim(line.substr(0, comma));
        std::string url = trim(line.substr(comma + 1));
        if (name.empty() || !IsUsableUrlLine(url)) {
            continue;
        }

        ChannelRecord record;
        record.group = current_group;
        record.name = apply_mapping(name, mapping);
        record.url = url;
        groups.Add(std::move(record));
    }

    return groups.Flatten();
}

bool GroupedTextParser::IsGroupHeader(const std::string& trimmed_line) {
    size_t comma = trimmed_line.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    return trim(trimmed_line.substr(comma + 1)) == kGenreMarker;
}

} // namespace tvsort
