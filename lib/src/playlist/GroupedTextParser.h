#pragma once

#include "PlaylistParserBase.h"
#include <string>

namespace tvsort {

/**
 * Parser for the grouped text format this tool writes:
 *
 *   央视,#genre#
 *   CCTV1,http://example.com/cctv1.m3u8
 *   CCTV2,http://example.com/cctv2.m3u8
 *
 * Entries before the first header fall into "未分组".
 */
class GroupedTextParser : public PlaylistParserBase {
public:
    std::vector<ChannelRecord> Parse(
        const std::string& raw_text,
        const NameMapping& mapping) const override;

    static bool IsGroupHeader(const std::string& trimmed_line);
};

} // namespace tvsort
