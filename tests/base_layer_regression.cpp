#include "base_layer_normalizer.hpp"
#include "delimited_table.hpp"
#include "errors.hpp"
#include "geodesy_constants.hpp"
#include "regression_support.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

namespace
{

constexpr const char* kSuite = "base-layer-regression";

int expect_true(bool cond, const std::string& message)
{
    return regression::expect_true(kSuite, cond, message);
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-9)
{
    return regression::expect_close(kSuite, actual, expected, label, tol);
}

const char* kRegionBasinLayer =
    "FID,LatCoord,LonCoord,region_id,basin_id,Forest,Crops,Water,regaez\n"
    "1,30,10,30,5,0.1,0.3,0.05,3005\n"
    "2,0,20,11,6,0.2,0.05,0,1106\n";

lcn::BaseLayerConfig region_basin_config()
{
    lcn::BaseLayerConfig config;
    config.resolution_degrees = 0.5;
    config.aggregation_level = 2;
    config.metric_name = "Basin";
    config.primary_key_column = "fid";
    config.model_name = "GCAM";
    return config;
}

double expected_cell_area(double latitude_deg, double resolution)
{
    return std::cos(latitude_deg * geodesy_constants::pi / 180.0) * (111.32 * 110.57) * resolution * resolution;
}

int test_cell_area_fraction_and_correction()
{
    int failures = 0;
    regression::ScratchDir dir("base");
    const std::string path = dir.write("base.csv", kRegionBasinLayer);

    regression::RecordingLogger log;
    const lcn::BaseLayerData data =
        lcn::normalize_base_layer_file(log, path, {"forest", "CROPS"}, region_basin_config());

    failures += expect_true(data.ngrids == 2, "two grid cells");
    failures += expect_true(data.land_classes == std::vector<std::string>({"forest", "crops"}), "land classes lowercased");
    failures += expect_true(log.warnings.empty(), "water present, no warning");

    const double area0 = expected_cell_area(30.0, 0.5);
    failures += expect_close(data.cell_area[0], area0, "cell area at 30N");
    failures += expect_close(data.cell_area[0], 2664.9, "cell area near 2664.9 km^2", 0.1);
    failures += expect_close(data.cell_area[1], 111.32 * 110.57 * 0.25, "cell area at the equator");

    failures += expect_close(data.cell_fraction[0], 1.8, "cell fraction (0.4 + 0.05) / 0.25");
    failures += expect_close(data.cell_fraction[1], 1.0, "clean cell fraction");

    const double scale0 = area0 / 0.25;
    failures += expect_close(data.land_cover(0, 0), 0.1 * scale0, "forest scaled by cell area / res^2", 1.0e-6);
    failures += expect_close(data.land_cover(0, 1), 0.3 * scale0, "crops scaled by cell area / res^2", 1.0e-6);

    failures += expect_close(data.coords(0, 0), 30.0, "latitude column");
    failures += expect_close(data.coords(1, 1), 20.0, "longitude column");
    failures += expect_true(data.coordinate_convention == lcn::CoordinateConvention::LatCoordLonCoord,
                            "primary coordinate convention");
    failures += expect_true(data.grid_id == std::vector<long long>({1, 2}), "grid ids");
    failures += expect_true(data.metric == std::vector<int>({5, 6}), "basin ids");
    failures += expect_true(data.region_metric.has_value() &&
                                *data.region_metric == std::vector<long long>({3005, 1106}),
                            "legacy combined field kept when present");
    return failures;
}

int test_merged_territory_folds_into_parent()
{
    int failures = 0;
    regression::ScratchDir dir("base_merge");
    const std::string path = dir.write("base.csv", kRegionBasinLayer);

    regression::RecordingLogger log;
    const lcn::BaseLayerData gcam = lcn::normalize_base_layer_file(log, path, {"forest"}, region_basin_config());
    failures += expect_true(gcam.region == std::vector<int>({11, 11}), "region 30 remapped to 11 for gcam");

    lcn::BaseLayerConfig other = region_basin_config();
    other.model_name = "other";
    const lcn::BaseLayerData kept = lcn::normalize_base_layer_file(log, path, {"forest"}, other);
    failures += expect_true(kept.region == std::vector<int>({30, 11}), "no remap for other models");

    const lcn::AdministrativeMergePolicy& policy = lcn::gcam_taiwan_merge();
    failures += expect_true(policy.region_number == 30 && policy.parent_region_number == 11,
                            "shared policy numbers");
    return failures;
}

int test_sub_region_level_uses_single_region()
{
    int failures = 0;
    regression::ScratchDir dir("base_basin");
    const std::string path = dir.write("base.csv",
                                       "fid,latitude,longitude,basin_id,forest,water\n"
                                       "10,45,1,3,0.25,0\n"
                                       "11,-45,2,4,0.1,0.1\n"
                                       "12,60,3,3,0,0\n");
    lcn::BaseLayerConfig config = region_basin_config();
    config.aggregation_level = 1;

    regression::RecordingLogger log;
    const lcn::BaseLayerData data = lcn::normalize_base_layer_file(log, path, {"forest"}, config);
    failures += expect_true(data.region == std::vector<int>({1, 1, 1}), "constant region 1 at level 1");
    failures += expect_true(data.metric == std::vector<int>({3, 4, 3}), "basin ids at level 1");
    failures += expect_true(data.coordinate_convention == lcn::CoordinateConvention::LatitudeLongitude,
                            "fallback coordinate convention");
    failures += expect_true(!data.region_metric.has_value(), "legacy combined field absent");
    failures += expect_true(log.warnings.empty(), "absent legacy field is not a warning");
    failures += expect_close(data.cell_area[1], expected_cell_area(-45.0, 0.5), "southern hemisphere cell area");
    failures += expect_close(data.cell_fraction[1], 0.8, "partial cell fraction");
    failures += expect_close(data.cell_fraction[2], 0.0, "no-data cell fraction");
    return failures;
}

int test_missing_water_falls_back_to_zero()
{
    int failures = 0;
    regression::ScratchDir dir("base_water");
    const std::string path = dir.write("base.csv",
                                       "fid,latcoord,loncoord,region_id,basin_id,forest,regaez\n"
                                       "1,10,1,1,1,0.25,101\n"
                                       "2,20,2,1,2,0.2,102\n");
    regression::RecordingLogger log;
    const lcn::BaseLayerData data =
        lcn::normalize_base_layer_file(log, path, {"forest"}, region_basin_config());

    failures += expect_true(data.water == std::vector<double>({0.0, 0.0}), "water zero-filled to ngrids");
    failures += expect_true(log.warnings.size() == 1, "exactly one warning for missing water");
    failures += expect_close(data.cell_fraction[0], 1.0, "fraction from land cover alone");
    return failures;
}

int test_missing_required_fields_are_reported_together()
{
    int failures = 0;
    regression::ScratchDir dir("base_missing");
    const std::string path = dir.write("base.csv",
                                       "fid,lat,lon,region_id,basin_id,forest\n"
                                       "1,10,1,1,1,0.25\n");
    regression::RecordingLogger log;
    bool threw = false;
    try
    {
        (void)lcn::normalize_base_layer_file(log, path, {"forest", "urban"}, region_basin_config());
    }
    catch (const lcn::MissingFieldError& e)
    {
        const std::vector<std::string>& missing = e.missing_fields();
        threw = missing.size() == 2 && missing[0] == "urban" &&
                missing[1].find("latitude") != std::string::npos;
    }
    failures += expect_true(threw, "missing land class and coordinates raise one MissingFieldError");
    failures += expect_true(!log.errors.empty(), "missing fields are logged before aborting");

    const std::string no_region = dir.write("noregion.csv",
                                            "fid,latcoord,loncoord,basin_id,forest\n"
                                            "1,10,1,1,0.25\n");
    bool region_missing = false;
    try
    {
        (void)lcn::normalize_base_layer_file(log, no_region, {"forest"}, region_basin_config());
    }
    catch (const lcn::MissingFieldError& e)
    {
        region_missing = e.missing_fields() == std::vector<std::string>({"region_id"});
    }
    failures += expect_true(region_missing, "region_id required at level 2");
    return failures;
}

int test_out_of_range_identifiers_are_rejected()
{
    int failures = 0;
    regression::ScratchDir dir("base_range");
    regression::RecordingLogger log;

    // 4294967326 wraps to 30 in a 32-bit int and would be folded into region 11.
    const std::string wrapped_region = dir.write("region.csv",
                                                 "fid,latcoord,loncoord,region_id,basin_id,forest,water\n"
                                                 "1,10,1,4294967326,1,0.25,0\n");
    bool region_rejected = false;
    try
    {
        (void)lcn::normalize_base_layer_file(log, wrapped_region, {"forest"}, region_basin_config());
    }
    catch (const lcn::ParseError& e)
    {
        region_rejected = std::string(e.what()).find("region_id") != std::string::npos;
    }
    failures += expect_true(region_rejected, "oversized region id raises ParseError");

    const std::string huge_fid = dir.write("fid.csv",
                                           "fid,latcoord,loncoord,region_id,basin_id,forest,water\n"
                                           "1,10,1,11,1,0.25,0\n"
                                           "1e20,20,2,11,1,0.25,0\n");
    bool fid_rejected = false;
    try
    {
        (void)lcn::normalize_base_layer_file(log, huge_fid, {"forest"}, region_basin_config());
    }
    catch (const lcn::ParseError& e)
    {
        fid_rejected = std::string(e.what()).find("line 3") != std::string::npos;
    }
    failures += expect_true(fid_rejected, "grid id beyond 64 bits raises ParseError");
    return failures;
}

int test_invalid_configuration()
{
    int failures = 0;
    regression::ScratchDir dir("base_config");
    const std::string path = dir.write("base.csv", kRegionBasinLayer);
    regression::RecordingLogger log;

    lcn::BaseLayerConfig bad_level = region_basin_config();
    bad_level.aggregation_level = 3;
    bool level_threw = false;
    try
    {
        (void)lcn::normalize_base_layer_file(log, path, {"forest"}, bad_level);
    }
    catch (const lcn::ConfigError&)
    {
        level_threw = true;
    }
    failures += expect_true(level_threw, "aggregation level 3 is unsupported");

    lcn::BaseLayerConfig bad_resolution = region_basin_config();
    bad_resolution.resolution_degrees = 0.0;
    bool resolution_threw = false;
    try
    {
        bad_resolution.validate();
    }
    catch (const lcn::ConfigError&)
    {
        resolution_threw = true;
    }
    failures += expect_true(resolution_threw, "zero resolution is rejected");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_cell_area_fraction_and_correction();
    failures += test_merged_territory_folds_into_parent();
    failures += test_sub_region_level_uses_single_region();
    failures += test_missing_water_falls_back_to_zero();
    failures += test_missing_required_fields_are_reported_together();
    failures += test_out_of_range_identifiers_are_rejected();
    failures += test_invalid_configuration();

    if (failures != 0)
    {
        std::cerr << "[" << kSuite << "] " << failures << " failure(s)" << std::endl;
        return 1;
    }
    std::cout << "[" << kSuite << "] PASS" << std::endl;
    return 0;
}
