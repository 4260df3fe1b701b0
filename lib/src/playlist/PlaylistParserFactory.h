#pragma once

#include "PlaylistParserBase.h"
#include "M3UPlaylistParser.h"
#include "GroupedTextParser.h"
#include <memory>
#include <string>

namespace tvsort {

enum class PlaylistFormat {
    M3U,
    GroupedText
};

const char* PlaylistFormatName(PlaylistFormat format);

/**
 * Factory for creating format-specific playlist parsers.
 *
 * Routes to the parser for the detected document format:
 * - #EXTM3U / #EXTINF content → M3UPlaylistParser
 * - "{group},#genre#" content → GroupedTextParser
 */
class PlaylistParserFactory {
public:
    /**
     * Sniff the format of a fetched document.
     *
     * Unrecognised text is reported as M3U, which yields no records.
     */
    static PlaylistFormat DetectFormat(const std::string& raw_text);

    static std::unique_ptr<PlaylistParserBase> CreateParser(PlaylistFormat format);
};

} // namespace tvsort
