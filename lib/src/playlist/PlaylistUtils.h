#pragma once

#include "../ChannelTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace tvsort {

/**
 * Strip leading and trailing whitespace (space, tab, CR, LF, FF, VT).
 */
std::string trim(const std::string& str);

/**
 * Lowercase ASCII letters only. Bytes >= 0x80 pass through unchanged.
 */
std::string to_lower_ascii(const std::string& str);

/**
 * Case-fold UTF-8 text for comparison.
 *
 * Uppercase letters of ASCII, Latin-1, Latin Extended-A, Greek, Cyrillic
 * and the fullwidth Latin block are mapped to lowercase. CJK text and
 * malformed byte sequences pass through unchanged.
 */
std::string fold_case_utf8(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);

/**
 * Remove a leading UTF-8 byte order mark, if present.
 */
std::string strip_utf8_bom(const std::string& text);

/**
 * Split text into lines on '\n'. A trailing '\r' is removed from each
 * line so CRLF documents parse the same as LF documents.
 *
 * @param text Document text
 * @return Lines in document order (untrimmed apart from '\r')
 */
std::vector<std::string> split_lines(const std::string& text);

/**
 * Extract the value of a quoted attribute such as group-title="News".
 *
 * @param line Metadata line
 * @param attribute Attribute name without '=' (e.g. "tvg-name")
 * @return Attribute value, or nullopt if the attribute is absent or
 *         its closing quote is missing
 */
std::optional<std::string> extract_quoted_attribute(
    const std::string& line,
    const std::string& attribute
);

/**
 * Display text of an #EXTINF line: everything after the last comma,
 * trimmed. Returns the whole trimmed line if it has no comma.
 */
std::string extract_display_name(const std::string& line);

/**
 * Replace name with its canonical form when mapping has an entry for it.
 */
std::string apply_mapping(const std::string& name, const NameMapping& mapping);

} // namespace tvsort
