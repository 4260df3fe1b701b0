#include "M3UPlaylistParser.h"
#include "PlaylistUtils.h"

namespace tvsort {

namespace {

constexpr const char* kExtinfTag = "#EXTINF:";

} // namespace

std::vector<ChannelRecord> M3UPlaylistParser::Parse(
    const std::string& raw_text,
    const NameMapping& mapping) const {

    const std::vector<std::string> lines = split_lines(strip_utf8_bom(raw_text));
    GroupAccumulator groups;
    ScanState state;

    for (size_t i = 0; i < lines.size(); ++i) {
        const std::string line = trim(lines[i]);
        if (!IsMetadataLine(line)) {
            continue;
        }

        // Metadata on the last line has no URL to pair with
        if (i + 1 >= lines.size()) {
            break;
        }

        const std::string url = trim(lines[i + 1]);
        if (!IsUsableUrlLine(url)) {
            continue;
        }

        ChannelRecord record;
        record.group = ResolveGroup(line, state);
        record.name = ResolveName(line, mapping);
        record.url = url;

        state = Advance(std::move(state), record);
        groups.Add(std::move(record));
    }

    return groups.Flatten();
}

bool M3UPlaylistParser::IsMetadataLine(const std::string& trimmed_line) {
    return starts_with(trimmed_line, kExtinfTag);
}

std::string M3UPlaylistParser::ResolveGroup(const std::string& metadata_line, const ScanState& state) {
    auto group = extract_quoted_attribute(metadata_line, "group-title");
    if (group && !trim(*group).empty()) {
        return trim(*group);
    }
    return state.current_group;
}

std::string M3UPlaylistParser::ResolveName(const std::string& metadata_line, const NameMapping& mapping) {
    std::string name;

    auto tvg_name = extract_quoted_attribute(metadata_line, "tvg-name");
    if (tvg_name && !trim(*tvg_name).empty()) {
        name = trim(*tvg_name);
    } else {
        name = extract_display_name(metadata_line);
    }

    return apply_mapping(name, mapping);
}

M3UPlaylistParser::ScanState M3UPlaylistParser::Advance(ScanState state, const ChannelRecord& record) {
    state.current_group = record.group;
    return state;
}

} // namespace tvsort
