#include "analytics/data_quality_validator.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <iostream>

namespace evindex {
namespace analytics {

using catalog::Station;
using catalog::StationPtr;

std::string issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::MISSING_PRICE:
            return "Missing price";
        case IssueKind::MISSING_OPERATIONAL_STATUS:
            return "Missing operational status";
        case IssueKind::MISSING_CAPACITY:
            return "Missing charging points count";
        case IssueKind::VERIFICATION_BEFORE_CREATION:
            return "Verification before creation";
        case IssueKind::OTHER_ISSUE:
            return "Other issue";
    }
    return "Other issue";
}

std::vector<ValidationRule> DataQualityValidator::defaultRules() {
    return {
        {IssueKind::MISSING_PRICE, [](const Station& s) {
            return !s.pricing().is_free && !s.pricing().ac_price_per_kwh;
        }},
        {IssueKind::MISSING_OPERATIONAL_STATUS, [](const Station& s) {
            return s.status() == catalog::OperationalStatus::UNKNOWN;
        }},
        {IssueKind::MISSING_CAPACITY, [](const Station& s) {
            return !s.capacity();
        }},
        {IssueKind::VERIFICATION_BEFORE_CREATION, [](const Station& s) {
            return s.lastVerifiedDate() && s.creationDate() && *s.lastVerifiedDate() < *s.creationDate();
        }},
    };
}

DataQualityValidator::DataQualityValidator(bool strict)
    : DataQualityValidator(defaultRules(), catalog::StationPredicate(), strict) {
}

DataQualityValidator::DataQualityValidator(std::vector<ValidationRule> rules, catalog::StationPredicate selection,
                                           bool strict)
    : rules_(std::move(rules)), selection_(std::move(selection)), strict_(strict) {
}

std::optional<IssueKind> DataQualityValidator::classify(const Station& station) const {
    for (const auto& rule : rules_) {
        if (rule.matches(station)) {
            return rule.kind;
        }
    }
    return std::nullopt;
}

std::vector<DataQualityIssue> DataQualityValidator::scan(const catalog::StationSnapshot& stations) const {
    std::vector<DataQualityIssue> issues;

    for (const StationPtr& station : stations) {
        std::optional<IssueKind> kind = classify(*station);

        bool selected = selection_ ? selection_(*station) : kind.has_value();
        if (!selected) {
            continue;
        }

        if (!kind) {
            if (strict_) {
                throw EvIndexError(ErrorKind::INTERNAL_INCONSISTENCY,
                                   "Station " + std::to_string(station->id()) +
                                   " was selected for review but matches no data-quality rule");
            }
            std::cerr << "Warning: Station " << station->id()
                      << " was selected for review but matches no data-quality rule" << std::endl;
            kind = IssueKind::OTHER_ISSUE;
        }

        issues.push_back(DataQualityIssue{station->id(), station->city(), station->operatorName(), *kind});
    }

    std::sort(issues.begin(), issues.end(), [](const DataQualityIssue& a, const DataQualityIssue& b) {
        return a.id < b.id;
    });
    return issues;
}

} // namespace analytics
} // namespace evindex
