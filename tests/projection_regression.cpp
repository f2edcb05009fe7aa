#include "delimited_table.hpp"
#include "errors.hpp"
#include "projection_normalizer.hpp"
#include "regression_support.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace
{

constexpr const char* kSuite = "projection-regression";

int expect_true(bool cond, const std::string& message)
{
    return regression::expect_true(kSuite, cond, message);
}

int expect_close(double actual, double expected, const std::string& label)
{
    return regression::expect_close(kSuite, actual, expected, label);
}

const char* kMultiRegionTable =
    "region,metric_id,landclass,1990,2005,2010,2100\n"
    "China,216,Forest,1,2,3,4\n"
    "China,35,Crops,1,1,1,1\n"
    "USA,35,forest,0.5,0.5,0.5,0.5\n"
    "USA,120,Urban,0.1,0.2,0.3,0.4\n"
    "Brazil,216,Forest,1,1,1,1\n";

std::unordered_map<std::string, std::string> region_reference()
{
    return {{"Brazil", "7"}, {"China", "11"}, {"USA", "12"}, {"Taiwan", "30"}};
}

lcn::ProjectionSettings settings(int aggregation_level)
{
    lcn::ProjectionSettings s;
    s.start_year = 2005;
    s.end_year = 2010;
    s.scenario = "SSP2";
    s.aggregation_level = aggregation_level;
    return s;
}

int test_metric_index_map_numeric_order()
{
    int failures = 0;
    const lcn::MetricIndexMap map = lcn::MetricIndexMap::build({"216", "35", "120", "35", "35.0"});
    failures += expect_true(map.numeric(), "all identifiers numeric");
    failures += expect_true(map.size() == 3, "three distinct identifiers");
    failures += expect_true(map.index_of("35") == 1, "35 -> 1");
    failures += expect_true(map.index_of("35.0") == 1, "35.0 is the same identifier as 35");
    failures += expect_true(map.index_of("120") == 2, "120 -> 2");
    failures += expect_true(map.index_of("216") == 3, "216 -> 3");

    bool threw = false;
    try
    {
        (void)map.index_of("999");
    }
    catch (const lcn::KeyLookupError&)
    {
        threw = true;
    }
    failures += expect_true(threw, "unknown identifier raises KeyLookupError");
    return failures;
}

int test_metric_index_map_text_order()
{
    int failures = 0;
    const lcn::MetricIndexMap map = lcn::MetricIndexMap::build({"AEZ10", "AEZ02", "AEZ07", "AEZ02"});
    failures += expect_true(!map.numeric(), "identifiers are text");
    failures += expect_true(map.identifiers() == std::vector<std::string>({"AEZ02", "AEZ07", "AEZ10"}),
                            "identifiers ascend");
    failures += expect_true(map.index_of("AEZ10") == 3, "AEZ10 -> 3");
    return failures;
}

int test_single_region_bypasses_reference()
{
    int failures = 0;
    const std::unordered_map<std::string, std::string> misleading = {{"1", "42"}};
    const std::vector<int> numbers = lcn::derive_region_numbers({"1", "1", " 1"}, misleading);
    failures += expect_true(numbers == std::vector<int>({1, 1, 1}), "single region 1 ignores the reference");

    const std::vector<int> empty_reference = lcn::derive_region_numbers({"1"}, {});
    failures += expect_true(empty_reference == std::vector<int>({1}), "reference not consulted at all");

    bool threw = false;
    try
    {
        (void)lcn::derive_region_numbers({"1", "2"}, misleading);
    }
    catch (const lcn::KeyLookupError& e)
    {
        threw = e.key() == "2";
    }
    failures += expect_true(threw, "two distinct regions fall back to the reference");
    return failures;
}

int test_multi_region_normalization()
{
    int failures = 0;
    regression::ScratchDir dir("projection");
    const std::string path = dir.write("gcam.csv", kMultiRegionTable);

    regression::RecordingLogger log;
    const lcn::ProjectionData data = lcn::normalize_projection_file(
        log, path, {"forest", "crops", "urban"}, settings(1), region_reference());

    failures += expect_true(data.scenario == "SSP2", "scenario attached");
    failures += expect_true(data.constraints.consistent(), "land classes agree");
    failures += expect_true(log.warnings.empty(), "no constraint warnings");
    failures += expect_true(log.infos.size() == 2, "region and metric counts logged");

    failures += expect_true(data.time_steps == std::vector<int>({2005, 2010}), "selected time steps");
    failures += expect_true(data.area.rows() == 5 && data.area.cols() == 2, "area array is rows x steps");
    failures += expect_close(data.area(0, 0), 2000.0, "China forest 2005 in km^2");
    failures += expect_close(data.area(0, 1), 3000.0, "China forest 2010 in km^2");
    failures += expect_close(data.area(3, 1), 300.0, "USA urban 2010 in km^2");

    failures += expect_true(data.metric_index == std::vector<int>({3, 1, 1, 2, 3}), "sequential metric indices");
    failures += expect_true(data.metric_id == std::vector<std::string>({"216", "35", "35", "120", "216"}),
                            "raw metric identifiers kept per row");
    failures += expect_true(data.land_class[2] == "forest" && data.land_class[3] == "urban", "lowercased land classes");
    failures += expect_true(data.region_number == std::vector<int>({11, 11, 12, 12, 7}), "region numbers per row");

    failures += expect_true(data.all_regions == std::vector<std::string>({"Brazil", "China", "USA"}),
                            "sorted unique region names");
    failures += expect_true(data.all_region_numbers == std::vector<int>({7, 11, 12}), "sorted unique region numbers");
    failures += expect_true(data.all_metrics == std::vector<int>({1, 2, 3}), "sorted unique metric indices");

    const std::vector<std::vector<int>> expected = {{3}, {1, 3}, {1, 2}};
    failures += expect_true(data.region_metrics == expected, "metric indices per region");
    return failures;
}

int test_administrative_merge_placeholder()
{
    int failures = 0;
    regression::ScratchDir dir("projection_merge");
    const std::string path = dir.write("gcam.csv", kMultiRegionTable);

    regression::RecordingLogger log;
    const lcn::ProjectionData data = lcn::normalize_projection_file(
        log, path, {"forest", "crops", "urban"}, settings(2), region_reference());

    failures += expect_true(data.all_regions == std::vector<std::string>({"Brazil", "China", "Taiwan", "USA"}),
                            "merged territory listed among regions");
    failures += expect_true(data.all_region_numbers == std::vector<int>({7, 11, 12, 30}),
                            "merged territory number listed");

    const std::vector<std::vector<int>> expected = {{3}, {}, {1, 3}, {1, 2}};
    failures += expect_true(data.region_metrics == expected,
                            "placeholder one slot before the merged name in sorted region names");
    return failures;
}

int test_placeholder_follows_region_name_order()
{
    int failures = 0;
    regression::ScratchDir dir("projection_name_order");
    // Name order (Brazil, China, Taiwan, USA) differs from number order (USA 3, Brazil 7, China 11).
    const std::string path = dir.write("gcam.csv",
                                       "region,metric_id,landclass,2005\n"
                                       "Brazil,216,Forest,1\n"
                                       "China,35,Crops,1\n"
                                       "USA,120,Urban,1\n");
    const std::unordered_map<std::string, std::string> reference = {
        {"Brazil", "7"}, {"China", "11"}, {"USA", "3"}, {"Taiwan", "30"}};

    regression::RecordingLogger log;
    const lcn::ProjectionData data =
        lcn::normalize_projection_file(log, path, {"forest", "crops", "urban"}, settings(2), reference);

    failures += expect_true(data.all_region_numbers == std::vector<int>({3, 7, 11, 30}), "numbers ascend");
    // One slot before Taiwan's index (2) in the sorted names, so ahead of Brazil rather than China.
    const std::vector<std::vector<int>> expected = {{2}, {}, {3}, {1}};
    failures += expect_true(data.region_metrics == expected, "placeholder position comes from sorted region names");
    return failures;
}

int test_unknown_region_raises()
{
    int failures = 0;
    regression::ScratchDir dir("projection_unknown");
    const std::string path = dir.write("gcam.csv",
                                       "region,metric_id,landclass,2005\n"
                                       "Atlantis,1,forest,1\n"
                                       "China,1,forest,1\n");
    regression::RecordingLogger log;
    bool threw = false;
    try
    {
        (void)lcn::normalize_projection_file(log, path, {"forest"}, settings(1), region_reference());
    }
    catch (const lcn::KeyLookupError& e)
    {
        threw = e.key() == "Atlantis";
    }
    failures += expect_true(threw, "region missing from reference raises KeyLookupError");
    return failures;
}

int test_single_region_table_and_area_factor()
{
    int failures = 0;
    regression::ScratchDir dir("projection_global");
    const std::string path = dir.write("global.csv",
                                       "region,metric_id,landclass,2000,2005,notes\n"
                                       "1,5,Forest,1.5,2,a\n"
                                       "1,3,Snow,0.5,1,b\n");
    regression::RecordingLogger log;
    lcn::ProjectionSettings s = settings(1);
    s.start_year = 2000;
    s.area_factor = 1.0;
    const lcn::ProjectionData data =
        lcn::normalize_projection_file(log, path, {"forest"}, s, {{"1", "99"}});

    failures += expect_true(data.region_number == std::vector<int>({1, 1}), "single global region");
    failures += expect_true(data.all_regions == std::vector<std::string>({"1"}), "raw region value listed");
    failures += expect_true(data.region_metrics == std::vector<std::vector<int>>({{1, 2}}), "one region list");
    failures += expect_close(data.area(0, 0), 1.5, "area factor 1 keeps units");
    failures += expect_true(data.constraints.projection_only == std::vector<std::string>({"snow"}),
                            "snow missing from allocation");
    failures += expect_true(log.warnings.size() == 1, "one constraint warning");
    return failures;
}

int test_missing_columns_and_bad_values()
{
    int failures = 0;
    regression::ScratchDir dir("projection_bad");
    regression::RecordingLogger log;

    const std::string no_metric = dir.write("nometric.csv", "region,landclass,2005\n1,forest,1\n");
    bool missing = false;
    try
    {
        (void)lcn::normalize_projection_file(log, no_metric, {"forest"}, settings(1), {});
    }
    catch (const lcn::MissingFieldError& e)
    {
        missing = e.missing_fields() == std::vector<std::string>({"metric_id"});
    }
    failures += expect_true(missing, "missing metric_id raises MissingFieldError");

    const std::string bad_area = dir.write("badarea.csv", "region,metric_id,landclass,2005\n1,1,forest,lots\n");
    bool parse = false;
    try
    {
        (void)lcn::normalize_projection_file(log, bad_area, {"forest"}, settings(1), {});
    }
    catch (const lcn::ParseError&)
    {
        parse = true;
    }
    failures += expect_true(parse, "non-numeric area raises ParseError");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_metric_index_map_numeric_order();
    failures += test_metric_index_map_text_order();
    failures += test_single_region_bypasses_reference();
    failures += test_multi_region_normalization();
    failures += test_administrative_merge_placeholder();
    failures += test_placeholder_follows_region_name_order();
    failures += test_unknown_region_raises();
    failures += test_single_region_table_and_area_factor();
    failures += test_missing_columns_and_bad_values();

    if (failures != 0)
    {
        std::cerr << "[" << kSuite << "] " << failures << " failure(s)" << std::endl;
        return 1;
    }
    std::cout << "[" << kSuite << "] PASS" << std::endl;
    return 0;
}
