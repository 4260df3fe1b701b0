#pragma once

#include "../ChannelTypes.h"
#include <string>
#include <vector>
#include <unordered_map>

namespace tvsort {

/**
 * Abstract base class for playlist parsers.
 *
 * Every source format produces the same output: ChannelRecords with names
 * normalized through the NameMapping, grouped by first-seen group, and in
 * first-seen order within each group. Unrecognised or incomplete entries
 * are skipped; a document with no valid entries yields an empty vector.
 */
class PlaylistParserBase {
public:
    virtual ~PlaylistParserBase() = default;

    /**
     * Parse one raw playlist document.
     *
     * @param raw_text Document text as fetched
     * @param mapping Raw name -> canonical name lookup
     * @return Records in group order
     */
    virtual std::vector<ChannelRecord> Parse(
        const std::string& raw_text,
        const NameMapping& mapping) const = 0;

protected:
    /**
     * Buckets records by group while remembering first-seen group order.
     */
    class GroupAccumulator {
    public:
        void Add(ChannelRecord record);

        // Flatten in group order, then insertion order within a group
        std::vector<ChannelRecord> Flatten() const;

    private:
        std::vector<std::string> group_order_;
        std::unordered_map<std::string, std::vector<ChannelRecord>> buckets_;
        size_t count_ = 0;
    };

    /**
     * The URL line must be present, non-empty and not another directive.
     */
    static bool IsUsableUrlLine(const std::string& trimmed_line);
};

} // namespace tvsort
