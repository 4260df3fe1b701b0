#include "PlaylistUtils.h"
#include <algorithm>
#include <cctype>

namespace tvsort {

namespace {

constexpr const char* kUtf8Bom = "\xEF\xBB\xBF";

// Lowercase counterpart of an uppercase code point, or cp itself
char32_t fold_code_point(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    if (cp < 0x80) return cp;

    // Latin-1 (U+00D7 is the multiplication sign)
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;

    // Latin Extended-A: upper/lower pairs alternate
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) return 0xFF;

    // Greek (U+03A2 is unassigned)
    if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;

    // Cyrillic
    if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
    if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;

    // Fullwidth Latin
    if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;

    return cp;
}

/**
 * Decode one UTF-8 sequence at pos.
 * @return Sequence length, or 0 if the bytes are not valid UTF-8
 */
size_t decode_utf8(const std::string& str, size_t pos, char32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(str[pos]);
    size_t length = 0;

    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
        cp = lead & 0x1F;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        cp = lead & 0x0F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        cp = lead & 0x07;
    } else {
        return 0;
    }

    if (pos + length > str.size()) {
        return 0;
    }

    for (size_t i = 1; i < length; ++i) {
        unsigned char byte = static_cast<unsigned char>(str[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            return 0;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    // Overlong forms and out-of-range code points
    if ((length == 3 && cp < 0x800) || (length == 4 && (cp < 0x10000 || cp > 0x10FFFF))) {
        return 0;
    }

    return length;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

} // namespace

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(first, last - first + 1);
}

std::string to_lower_ascii(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) {
                       return c < 0x80 ? static_cast<char>(std::tolower(c))
                                       : static_cast<char>(c);
                   });
    return lower;
}

std::string fold_case_utf8(const std::string& str) {
    std::string folded;
    folded.reserve(str.size());

    size_t pos = 0;
    while (pos < str.size()) {
        unsigned char byte = static_cast<unsigned char>(str[pos]);
        if (byte < 0x80) {
            folded += static_cast<char>(std::tolower(byte));
            ++pos;
            continue;
        }

        char32_t cp = 0;
        size_t length = decode_utf8(str, pos, cp);
        if (length == 0) {
            folded += str[pos];
            ++pos;
            continue;
        }

        char32_t lower = fold_code_point(cp);
        if (lower == cp) {
            folded.append(str, pos, length);
        } else {
            append_utf8(folded, lower);
        }
        pos += length;
    }

    return folded;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_utf8_bom(const std::string& text) {
    if (starts_with(text, kUtf8Bom)) {
        return text.substr(3);
    }
    return text;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;

    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }

        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));

        start = end + 1;
    }

    // "a\nb\n" yields a trailing empty element; drop it
    if (!lines.empty() && lines.back().empty() &&
        !text.empty() && text.back() == '\n') {
        lines.pop_back();
    }

    return lines;
}

std::optional<std::string> extract_quoted_attribute(
    const std::string& line,
    const std::string& attribute) {

    const std::string needle = attribute + "=\"";
    size_t pos = line.find(needle);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    size_t value_start = pos + needle.size();
    size_t value_end = line.find('"', value_start);
    if (value_end == std::string::npos) {
        return std::nullopt;
    }

    return line.substr(value_start, value_end - value_start);
}

std::string extract_display_name(const std::string& line) {
    size_t comma = line.rfind(',');
    if (comma == std::string::npos) {
        return trim(line);
    }
    return trim(line.substr(comma + 1));
}

std::string apply_mapping(const std::string& name, const NameMapping& mapping) {
    auto it = mapping.find(name);
    return it != mapping.end() ? it->second : name;
}

} // namespace tvsort
