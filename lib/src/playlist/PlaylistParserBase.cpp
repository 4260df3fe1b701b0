#include "PlaylistParserBase.h"

namespace tvsort {

void PlaylistParserBase::GroupAccumulator::Add(ChannelRecord record) {
    auto it = buckets_.find(record.group);
    if (it == buckets_.end()) {
        group_order_.push_back(record.group);
        it = buckets_.emplace(record.group, std::vector<ChannelRecord>{}).first;
    }
    it->second.push_back(std::move(record));
    count_++;
}

std::vector<ChannelRecord> PlaylistParserBase::GroupAccumulator::Flatten() const {
    std::vector<ChannelRecord> records;
    records.reserve(count_);

    for (const auto& group : group_order_) {
        const auto& bucket = buckets_.at(group);
        records.insert(records.end(), bucket.begin(), bucket.end());
    }

    return records;
}

bool PlaylistParserBase::IsUsableUrlLine(const std::string& trimmed_line) {
    return !trimmed_line.empty() && trimmed_line[0] != '#';
}

} // namespace tvsort
