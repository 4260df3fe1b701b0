#pragma once

#include "ChannelTypes.h"
#include <string>
#include <vector>

namespace tvsort {

/**
 * TemplateClassifier
 *
 * Orders the aggregated record set by an external category template.
 *
 * For each category (template order) and each expected name (template
 * order), every record whose name equals the expected name is claimed, in
 * aggregation order. Comparison is case-insensitive and anchored on the
 * text before the first comma of the "name,url" line, so "CCTV1" never
 * claims "CCTV10" but does claim "CCTV1,HD". Records nothing claims go to
 * the catch-all category "其它".
 *
 * An expected name that already appeared earlier in the template claims
 * nothing, which keeps every record in exactly one category.
 */
class TemplateClassifier {
public:
    /**
     * Classify records against the template
     * @param category_template Ordered categories and expected names
     * @param records Flat record set in aggregation order
     * @return One output category per template category, plus others
     */
    static ClassifiedDocument Classify(
        const CategoryTemplate& category_template,
        const std::vector<ChannelRecord>& records);

    /**
     * Render the document as text:
     *
     *   {category},#genre#
     *   name,url
     *   ...
     *   (blank line)
     *
     * followed by "其它,#genre#" when others is non-empty. Lines are joined
     * with '\n' and trailing blank separators are trimmed.
     */
    static std::string Render(const ClassifiedDocument& document);

    static ClassificationStats ComputeStats(const ClassifiedDocument& document);

    /**
     * Anchored, case-insensitive comparison of a record name (up to its
     * first comma) against a template name. Surrounding whitespace is
     * ignored.
     */
    static bool NameMatches(const std::string& record_name, const std::string& expected_name);

private:
    static std::string MatchKey(const std::string& name);
    static std::string RecordKey(const std::string& record_name);
};

} // namespace tvsort
