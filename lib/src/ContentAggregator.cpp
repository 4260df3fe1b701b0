#include "ContentAggregator.h"

namespace tvsort {

std::vector<ChannelRecord> ContentAggregator::Aggregate(
    const std::vector<std::vector<ChannelRecord>>& sources) {

    size_t total = 0;
    for (const auto& source : sources) {
        total += source.size();
    }

    std::vector<ChannelRecord> records;
    records.reserve(total);
    for (const auto& source : sources) {
        records.insert(records.end(), source.begin(), source.end());
    }

    return records;
}

} // namespace tvsort
