#include "TemplateClassifier.h"
#include "playlist/PlaylistUtils.h"
#include <unordered_set>

namespace tvsort {

ClassifiedDocument TemplateClassifier::Classify(
    const CategoryTemplate& category_template,
    const std::vector<ChannelRecord>& records) {

    // Serialize once; keys are compared, lines are emitted
    std::vector<std::string> lines;
    std::vector<std::string> keys;
    lines.reserve(records.size());
    keys.reserve(records.size());
    for (const auto& record : records) {
        lines.push_back(record.ToLine());
        keys.push_back(RecordKey(record.name));
    }

    ClassifiedDocument document;
    std::vector<bool> matched(records.size(), false);
    std::unordered_set<std::string> seen_expected;

    for (const auto& category : category_template) {
        ClassifiedCategory output;
        output.category = category.category;

        for (const auto& expected : category.expected_names) {
            std::string expected_key = MatchKey(expected);
            if (expected_key.empty() || !seen_expected.insert(expected_key).second) {
                continue;
            }

            // Full scan: every source contributing this name lands here
            for (size_t i = 0; i < lines.size(); ++i) {
                if (keys[i] == expected_key) {
                    output.lines.push_back(lines[i]);
                    matched[i] = true;
                }
            }
        }

        document.categories.push_back(std::move(output));
    }

    for (size_t i = 0; i < lines.size(); ++i) {
        if (!matched[i]) {
            document.others.push_back(lines[i]);
        }
    }

    return document;
}

std::string TemplateClassifier::Render(const ClassifiedDocument& document) {
    std::vector<std::string> output;

    for (const auto& category : document.categories) {
        output.push_back(category.category + "," + kGenreMarker);
        output.insert(output.end(), category.lines.begin(), category.lines.end());
        output.push_back("");
    }

    if (!document.others.empty()) {
        output.push_back(std::string(kCatchAllCategory) + "," + kGenreMarker);
        output.insert(output.end(), document.others.begin(), document.others.end());
        output.push_back("");
    }

    std::string text;
    for (size_t i = 0; i < output.size(); ++i) {
        if (i > 0) text += '\n';
        text += output[i];
    }

    while (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }

    return text;
}

ClassificationStats TemplateClassifier::ComputeStats(const ClassifiedDocument& document) {
    ClassificationStats stats;
    for (const auto& category : document.categories) {
        stats.matched += category.lines.size();
    }
    stats.unmatched = document.others.size();
    return stats;
}

bool TemplateClassifier::NameMatches(const std::string& record_name, const std::string& expected_name) {
    std::string expected_key = MatchKey(expected_name);
    return !expected_key.empty() && RecordKey(record_name) == expected_key;
}

std::string TemplateClassifier::MatchKey(const std::string& name) {
    return fold_case_utf8(trim(name));
}

std::string TemplateClassifier::RecordKey(const std::string& record_name) {
    // The serialized line is "name,url"; only text before its first comma counts
    return MatchKey(record_name.substr(0, record_name.find(',')));
}

} // namespace tvsort
