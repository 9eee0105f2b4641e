#include "gtest/gtest.h"

#include <vector>

#include "analytics/data_quality_validator.hpp"
#include "catalog/station_catalog.hpp"
#include "core/errors.hpp"
#include "test_util.hpp"

using namespace evindex;
using namespace evindex::analytics;
using evindex::catalog::OperationalStatus;
using evindex::catalog::StationRecord;
using evindex::test::makePricedRecord;
using evindex::test::makeRecord;

namespace {

catalog::StationSnapshot snapshotOf(const std::vector<StationRecord>& records) {
    catalog::StationCatalog station_catalog;
    station_catalog.load(records);
    return station_catalog.snapshot();
}

// Complete record that no default rule flags
StationRecord cleanRecord(StationId id) {
    return makePricedRecord(id, 47.0 + static_cast<double>(id) * 0.01, 19.0, "Budapest", "MOL Plugee", 150.0);
}

} // namespace

TEST(data_quality_validator, missing_price_is_not_other_issue) {
    StationRecord record = cleanRecord(1);
    record.pricing.is_free = false;
    record.pricing.ac_price_per_kwh.reset();

    DataQualityValidator validator;
    auto issues = validator.scan(snapshotOf({record}));
    ASSERT_EQ(1U, issues.size());
    EXPECT_EQ(1, issues[0].id);
    EXPECT_EQ(IssueKind::MISSING_PRICE, issues[0].kind);
    EXPECT_EQ("Missing price", issueKindName(issues[0].kind));
    EXPECT_EQ("Budapest", *issues[0].city);
}

TEST(data_quality_validator, first_matching_rule_wins) {
    StationRecord everything_missing = makeRecord(1, 47.0, 19.0);
    everything_missing.status = OperationalStatus::UNKNOWN;

    StationRecord unknown_status = cleanRecord(2);
    unknown_status.status = OperationalStatus::UNKNOWN;
    unknown_status.capacity.reset();

    StationRecord no_capacity = cleanRecord(3);
    no_capacity.capacity.reset();

    DataQualityValidator validator;
    auto issues = validator.scan(snapshotOf({everything_missing, unknown_status, no_capacity}));
    ASSERT_EQ(3U, issues.size());
    EXPECT_EQ(IssueKind::MISSING_PRICE, issues[0].kind);
    EXPECT_EQ(IssueKind::MISSING_OPERATIONAL_STATUS, issues[1].kind);
    EXPECT_EQ(IssueKind::MISSING_CAPACITY, issues[2].kind);
}

TEST(data_quality_validator, free_station_has_no_missing_price) {
    StationRecord free_station = cleanRecord(1);
    free_station.pricing.ac_price_per_kwh.reset();
    free_station.pricing.is_free = true;

    DataQualityValidator validator;
    EXPECT_TRUE(validator.scan(snapshotOf({free_station, cleanRecord(2)})).empty());
}

TEST(data_quality_validator, verification_before_creation) {
    StationRecord record = cleanRecord(1);
    record.creation_date = catalog::Date(2023, 5, 10);
    record.last_verified_date = catalog::Date(2023, 5, 9);

    StationRecord same_day = cleanRecord(2);
    same_day.creation_date = catalog::Date(2023, 5, 10);
    same_day.last_verified_date = catalog::Date(2023, 5, 10);

    StationRecord only_verified = cleanRecord(3);
    only_verified.last_verified_date = catalog::Date(2020, 1, 1);

    DataQualityValidator validator;
    auto issues = validator.scan(snapshotOf({record, same_day, only_verified}));
    ASSERT_EQ(1U, issues.size());
    EXPECT_EQ(1, issues[0].id);
    EXPECT_EQ(IssueKind::VERIFICATION_BEFORE_CREATION, issues[0].kind);
}

TEST(data_quality_validator, issues_sorted_by_id) {
    std::vector<StationRecord> records;
    for (StationId id : {9, 3, 7, 1}) {
        StationRecord record = cleanRecord(id);
        record.capacity.reset();
        records.push_back(record);
    }
    records.push_back(cleanRecord(5));

    DataQualityValidator validator;
    auto issues = validator.scan(snapshotOf(records));
    ASSERT_EQ(4U, issues.size());
    EXPECT_EQ(1, issues[0].id);
    EXPECT_EQ(3, issues[1].id);
    EXPECT_EQ(7, issues[2].id);
    EXPECT_EQ(9, issues[3].id);
}

TEST(data_quality_validator, unmatched_selection_in_strict_mode_throws) {
    auto select_all = [](const catalog::Station&) { return true; };
    DataQualityValidator validator(DataQualityValidator::defaultRules(), select_all, true);
    EXPECT_TRUE(validator.isStrict());

    try {
        validator.scan(snapshotOf({cleanRecord(1)}));
        FAIL() << "expected InternalInconsistency";
    } catch (const EvIndexError& e) {
        EXPECT_EQ(ErrorKind::INTERNAL_INCONSISTENCY, e.kind());
    }
}

TEST(data_quality_validator, unmatched_selection_in_lenient_mode_is_other_issue) {
    auto select_all = [](const catalog::Station&) { return true; };
    DataQualityValidator validator(DataQualityValidator::defaultRules(), select_all, false);

    StationRecord missing_capacity = cleanRecord(2);
    missing_capacity.capacity.reset();

    auto issues = validator.scan(snapshotOf({cleanRecord(1), missing_capacity}));
    ASSERT_EQ(2U, issues.size());
    EXPECT_EQ(IssueKind::OTHER_ISSUE, issues[0].kind);
    EXPECT_EQ("Other issue", issueKindName(issues[0].kind));
    EXPECT_EQ(IssueKind::MISSING_CAPACITY, issues[1].kind);
}

TEST(data_quality_validator, classify_without_selection) {
    DataQualityValidator validator;
    catalog::StationCatalog station_catalog;
    station_catalog.upsert(cleanRecord(1));

    EXPECT_FALSE(validator.classify(*station_catalog.find(1)).has_value());
}
