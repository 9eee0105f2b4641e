#ifndef EVINDEX_DATA_QUALITY_VALIDATOR_HPP
#define EVINDEX_DATA_QUALITY_VALIDATOR_HPP

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include "catalog/station_catalog.hpp"

namespace evindex {
namespace analytics {

// Data-quality issue categories, in rule priority order
enum class IssueKind {
    MISSING_PRICE,
    MISSING_OPERATIONAL_STATUS,
    MISSING_CAPACITY,
    VERIFICATION_BEFORE_CREATION,
    OTHER_ISSUE
};

std::string issueKindName(IssueKind kind);

struct DataQualityIssue {
    StationId id;
    std::optional<std::string> city;
    std::optional<std::string> operator_name;
    IssueKind kind;
};

// Classification rule, evaluated in list order
struct ValidationRule {
    IssueKind kind;
    std::function<bool(const catalog::Station&)> matches;
};

/**
 * Scans stations for missing or contradictory attributes.
 * Each selected station is classified by the first matching rule.
 * Stations are never modified.
 */
class DataQualityValidator {
public:
    /**
     * Validator with the default rules; selection is any rule matching
     * @param strict Throw on a selected station that matches no rule instead
     *        of reporting it as OTHER_ISSUE
     */
    explicit DataQualityValidator(bool strict = true);

    /**
     * @param rules Ordered classification rules
     * @param selection Stations to report; an empty function selects any station a rule matches
     * @param strict See above
     */
    DataQualityValidator(std::vector<ValidationRule> rules, catalog::StationPredicate selection, bool strict);

    /**
     * Report every selected station
     * @param stations Station snapshot
     * @return Issues in ascending id order
     * @throws EvIndexError(INTERNAL_INCONSISTENCY) in strict mode when a selected
     *         station matches no rule
     */
    std::vector<DataQualityIssue> scan(const catalog::StationSnapshot& stations) const;

    /**
     * Get the first rule a station matches
     */
    std::optional<IssueKind> classify(const catalog::Station& station) const;

    static std::vector<ValidationRule> defaultRules();

    bool isStrict() const { return strict_; }

private:
    std::vector<ValidationRule> rules_;
    catalog::StationPredicate selection_;
    bool strict_;
};

} // namespace analytics
} // namespace evindex

#endif // EVINDEX_DATA_QUALITY_VALIDATOR_HPP
