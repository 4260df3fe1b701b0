#pragma once

#include "ChannelTypes.h"
#include <vector>

namespace tvsort {

/**
 * ContentAggregator
 *
 * Merges per-source parse results into one flat record set. Order is
 * source-list order, then each source's emitted order; this order is the
 * tie-break for every later classification step. Identical records from
 * different sources are all kept.
 */
class ContentAggregator {
public:
    /**
     * Concatenate parsed sources
     * @param sources One record vector per source, in source-list order
     *                (a failed source is an empty vector)
     * @return Flat record set
     */
    static std::vector<ChannelRecord> Aggregate(
        const std::vector<std::vector<ChannelRecord>>& sources);
};

} // namespace tvsort
