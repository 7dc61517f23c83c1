#include <cstdio>
#include <easepath/converter.hpp>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

#include "io/track_loader.hpp"

using namespace easepath;
using IT = InterpolationType;

TEST(TrackLoader, ParsesFullTable)
{
    const std::string csv =
        "time,value,in_type,out_type,in_speed,in_influence,out_speed,out_influence\n"
        "0.0,0,linear,bezier,0,16.666667,10,33.33\n"
        "0.8,-100,bezier,linear,-10,33.33,0,16.666667\n";

    auto r = parse_track_csv(csv, "Y", 30.0);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.track.name(), "Y");
    EXPECT_DOUBLE_EQ(r.track.frame_rate(), 30.0);
    ASSERT_EQ(r.track.num_keys(), 2);

    EXPECT_DOUBLE_EQ(r.track.key_time(2), 0.8);
    EXPECT_DOUBLE_EQ(r.track.key_value(2)[0], -100.0);
    EXPECT_EQ(r.track.key_out_interpolation(1), IT::Bezier);
    EXPECT_EQ(r.track.key_in_interpolation(2), IT::Bezier);
    EXPECT_DOUBLE_EQ(r.track.key_out_temporal_ease(1)[0].speed, 10.0);
    EXPECT_DOUBLE_EQ(r.track.key_out_temporal_ease(1)[0].influence, 33.33);
    EXPECT_DOUBLE_EQ(r.track.key_in_temporal_ease(2)[0].speed, -10.0);
}

TEST(TrackLoader, ColumnsInAnyOrderAndCase)
{
    const std::string csv =
        "Out_Type,VALUE,Time,In_Type\n"
        "BEZIER,5,0,Linear\n"
        "linear,6,1,hold\n";

    auto r = parse_track_csv(csv, "X", 24.0);
    ASSERT_TRUE(r.ok()) << r.error;
    ASSERT_EQ(r.track.num_keys(), 2);
    EXPECT_EQ(r.track.key_out_interpolation(1), IT::Bezier);
    EXPECT_EQ(r.track.key_in_interpolation(2), IT::Hold);
    EXPECT_DOUBLE_EQ(r.track.key_value(1)[0], 5.0);
}

TEST(TrackLoader, MissingOptionalColumnsUseDefaults)
{
    auto r = parse_track_csv("time,value\n0,1\n1,2\n", "X", 30.0);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.track.key_in_interpolation(1), IT::Linear);
    EXPECT_EQ(r.track.key_out_interpolation(1), IT::Linear);
    EXPECT_DOUBLE_EQ(r.track.key_out_temporal_ease(1)[0].speed, 0.0);
    EXPECT_NEAR(r.track.key_out_temporal_ease(1)[0].influence, 16.666667, 1e-9);
}

TEST(TrackLoader, VectorComponents)
{
    auto r = parse_track_csv("time,value3,value,value2\n0,3,1,2\n", "Pos", 30.0);
    ASSERT_TRUE(r.ok()) << r.error;
    auto v = r.track.key_value(1);
    ASSERT_EQ(v.size(), 3u);
    EXPECT_DOUBLE_EQ(v[0], 1.0);
    EXPECT_DOUBLE_EQ(v[1], 2.0);
    EXPECT_DOUBLE_EQ(v[2], 3.0);
}

TEST(TrackLoader, ValueComponentNumberOutOfRange)
{
    auto huge = parse_track_csv("time,value99999999999\n0,1\n", "X", 30.0);
    EXPECT_FALSE(huge.ok());
    EXPECT_NE(huge.error.find("value99999999999"), std::string::npos);

    EXPECT_FALSE(parse_track_csv("time,value0\n0,1\n", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,value5\n0,1\n", "X", 30.0).ok());

    auto w = parse_track_csv("time,value4\n0,1\n", "X", 30.0);
    ASSERT_TRUE(w.ok()) << w.error;
    EXPECT_DOUBLE_EQ(w.track.key_value(1)[0], 1.0);
}

TEST(TrackLoader, SemicolonAndTabDelimiters)
{
    auto semi = parse_track_csv("time;value\n0;1,5\n", "X", 30.0);
    EXPECT_FALSE(semi.ok());   // 1,5 is not a number

    auto semi_ok = parse_track_csv("time;value\n0;1.5\n2;3\n", "X", 30.0);
    ASSERT_TRUE(semi_ok.ok()) << semi_ok.error;
    EXPECT_EQ(semi_ok.track.num_keys(), 2);

    auto tab = parse_track_csv("time\tvalue\n0\t1.5\n", "X", 30.0);
    ASSERT_TRUE(tab.ok()) << tab.error;
    EXPECT_DOUBLE_EQ(tab.track.key_value(1)[0], 1.5);
}

TEST(TrackLoader, SkipsCommentsBlankLinesAndCarriageReturns)
{
    auto r = parse_track_csv("# exported\r\ntime,value\r\n\r\n0,1\r\n# mid\n1,2\r\n", "X", 30.0);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.track.num_keys(), 2);
}

TEST(TrackLoader, Errors)
{
    EXPECT_FALSE(parse_track_csv("", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,speed\n0,1\n", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,value\nabc,1\n", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,value,in_type\n0,1,smooth\n", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,value,out_speed\n0,1,fast\n", "X", 30.0).ok());
    EXPECT_FALSE(parse_track_csv("time,value\n0,1\n", "X", 0.0).ok());

    auto backwards = parse_track_csv("time,value\n1,0\n0.5,1\n", "X", 30.0);
    EXPECT_FALSE(backwards.ok());
    EXPECT_NE(backwards.error.find("Line 3"), std::string::npos);
}

TEST(TrackLoader, InterpolationNames)
{
    EXPECT_TRUE(parse_interpolation_type("linear") == IT::Linear);
    EXPECT_TRUE(parse_interpolation_type(" Bezier ") == IT::Bezier);
    EXPECT_TRUE(parse_interpolation_type("HOLD") == IT::Hold);
    EXPECT_FALSE(parse_interpolation_type("auto").has_value());
}

TEST(TrackLoader, LoadsSampleFileNamedAfterStem)
{
    auto r = load_track_csv(std::string(EASEPATH_TEST_DATA_DIR) + "/fade_out.csv", 30.0);
    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.track.name(), "fade_out");
    EXPECT_EQ(r.track.num_keys(), 2);

    auto converted = EasePathConverter().convert(r.track);
    ASSERT_TRUE(converted.has_value());
    EXPECT_EQ(converted->text.rfind("M0.0000,100.0000C", 0), 0u);
}

TEST(TrackLoader, MissingFile)
{
    auto r = load_track_csv("/nonexistent/easepath/track.csv", 30.0);
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.error.find("Cannot open"), std::string::npos);
}

TEST(TrackLoader, RoundTripThroughTempFile)
{
    auto path = std::filesystem::temp_directory_path() / "easepath_loader_test.csv";
    {
        std::ofstream out(path);
        out << "time,value\n0,10\n1,0\n";
    }

    auto r = load_track_csv(path.string(), 25.0);
    std::filesystem::remove(path);

    ASSERT_TRUE(r.ok()) << r.error;
    EXPECT_EQ(r.track.name(), "easepath_loader_test");
    EXPECT_DOUBLE_EQ(r.track.frame_rate(), 25.0);
}
