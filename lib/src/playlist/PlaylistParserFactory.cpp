#include "PlaylistParserFactory.h"

namespace tvsort {

const char* PlaylistFormatName(PlaylistFormat format) {
    switch (format) {
        case PlaylistFormat::M3U:
            return "m3u";
        case PlaylistFormat::GroupedText:
            return "txt";
    }
    return "unknown";
}

PlaylistFormat PlaylistParserFactory::DetectFormat(const std::string& raw_text) {
    if (raw_text.find("#EXTM3U") != std::string::npos ||
        raw_text.find("#EXTINF:") != std::string::npos) {
        return PlaylistFormat::M3U;
    }

    if (raw_text.find(kGenreMarker) != std::string::npos) {
        return PlaylistFormat::GroupedText;
    }

    return PlaylistFormat::M3U;
}

std::unique_ptr<PlaylistParserBase> PlaylistParserFactory::CreateParser(PlaylistFormat format) {
    switch (format) {
        case PlaylistFormat::GroupedText:
            return std::make_unique<GroupedTextParser>();

        case PlaylistFormat::M3U:
        default:
            return std::make_unique<M3UPlaylistParser>();
    }
}

} // namespace tvsort
