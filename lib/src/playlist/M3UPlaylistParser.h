#pragma once

#include "PlaylistParserBase.h"
#include <string>

namespace tvsort {

/**
 * Parser for extended M3U channel lists.
 *
 * Each entry is an #EXTINF metadata line immediately followed by its URL:
 *
 *   #EXTINF:-1 tvg-name="CCTV1" group-title="央视",CCTV-1 综合
 *   http://example.com/cctv1.m3u8
 *
 * Field resolution order:
 * - group: group-title attribute -> current group (sticky) -> "未分组"
 * - name:  tvg-name attribute -> text after the last comma
 */
class M3UPlaylistParser : public PlaylistParserBase {
public:
    std::vector<ChannelRecord> Parse(
        const std::string& raw_text,
        const NameMapping& mapping) const override;

    /**
     * Scan state carried from one entry to the next.
     * current_group becomes the default for entries lacking group-title
     * and is updated each time an entry is emitted.
     */
    struct ScanState {
        std::string current_group = kUngroupedGroup;
    };

    static bool IsMetadataLine(const std::string& trimmed_line);

    static std::string ResolveGroup(const std::string& metadata_line, const ScanState& state);

    static std::string ResolveName(const std::string& metadata_line, const NameMapping& mapping);

    /**
     * State after emitting record.
     */
    static ScanState Advance(ScanState state, const ChannelRecord& record);
};

} // namespace tvsort
