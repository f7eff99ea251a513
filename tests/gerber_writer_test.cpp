#include <algorithm>
#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "tests/test_common.h"

using namespace cam_lib;
using namespace cam_test;

namespace
{
    //////////////////////////////////////////////////////////////////////

    std::vector<std::string> header_lines()
    {
        return { "G04 cam_lib*", "%FSLAX26Y26*%", "%MOMM*%", "%SRX1Y1I0J0*%", "%LPD*%" };
    }

    //////////////////////////////////////////////////////////////////////

    std::string write_gerber(gerber_writer &writer, cam_entities const &entities)
    {
        std::ostringstream out;
        EXPECT_EQ(writer.write(out, entities), ok);
        return out.str();
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<dxf_entity const *> pointers(std::vector<dxf_entity> const &entities)
    {
        std::vector<dxf_entity const *> result;
        for(auto const &e : entities) {
            result.push_back(&e);
        }
        return result;
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

TEST(GerberWriter, TracksByWidth)
{
    std::vector<dxf_entity> tracks{
        make_polyline("Top", { { 0, 0 }, { 1, 0 } }, 0.5),      //
        make_polyline("Top", { { 0, 1 }, { 2, 1 } }, 0.25),     //
        make_polyline("Top", { { 3, 3 }, { 4, 3 } }, 0.5),
    };
    cam_entities entities;
    entities.tracks = pointers(tracks);

    gerber_writer writer(cam_settings{}, { 0.25, 0.5 });
    auto lines = split_lines(write_gerber(writer, entities));

    auto expected = header_lines();
    expected.insert(expected.end(), {
                                        "%ADD10C,0.250000*%",    //
                                        "%ADD11C,0.500000*%",    //
                                        "D10*",                  //
                                        "X0Y1000000D02*",        //
                                        "X2000000D01*",          //
                                        "D11*",                  //
                                        "X0Y0D02*",              //
                                        "X1000000D01*",          //
                                        "X3000000Y3000000D02*",  //
                                        "X4000000D01*",          //
                                        "M02*",
                                    });
    EXPECT_EQ(lines, expected);

    EXPECT_EQ(writer.stats.d2, 3);
    EXPECT_EQ(writer.stats.d1, 3);
    EXPECT_EQ(writer.stats.aperture_selects, 2);
    EXPECT_EQ(writer.stats.apertures_defined, 2);
}

TEST(GerberWriter, FlashesSortedWithoutDuplicatesOrOrigin)
{
    std::vector<dxf_entity> circles{
        make_circle("Top", 1, 1, 0.5),    //
        make_circle("Top", 0, 0, 0.5),    //
        make_circle("Top", 2, 1, 0.5),    //
        make_circle("Top", 1, 1, 0.5),
    };
    cam_entities entities;
    entities.circles = pointers(circles);

    gerber_writer writer(cam_settings{}, { 0.5 });
    auto lines = split_lines(write_gerber(writer, entities));

    auto expected = header_lines();
    expected.insert(expected.end(), {
                                        "%ADD10C,0.500000*%",         //
                                        "D10*",                       //
                                        "X1000000Y1000000D03*",       //
                                        "X2000000D03*",               //
                                        "M02*",
                                    });
    EXPECT_EQ(lines, expected);

    EXPECT_EQ(writer.stats.d3, 2);
    EXPECT_EQ(writer.stats.origin_flashes, 1);
    EXPECT_EQ(writer.stats.duplicates_removed, 1);
}

TEST(GerberWriter, RegionsShareOneFillBlock)
{
    std::vector<dxf_entity> regions{
        make_polyline("Top", { { 0, 0 }, { 5, 0 }, { 5, 5 }, { 0, 5 } }, std::nullopt, 1),    //
        make_polyline("Top", { { 10, 0 }, { 11, 0 }, { 11, 1 } }, std::nullopt, 1),
    };
    cam_entities entities;
    entities.regions = pointers(regions);

    gerber_writer writer(cam_settings{}, { 0.0 });
    std::string text = write_gerber(writer, entities);
    auto lines = split_lines(text);

    auto expected = header_lines();
    expected.insert(expected.end(), {
                                        "%ADD10C,0.010000*%",    //
                                        "G36*",                  //
                                        "X0Y0D02*",              //
                                        "X5000000D01*",          //
                                        "Y5000000D01*",          //
                                        "X0D01*",                //
                                        "Y0D01*",                //
                                        "X10000000D02*",         //
                                        "X11000000D01*",         //
                                        "Y1000000D01*",          //
                                        "X10000000Y0D01*",       //
                                        "G37*",                  //
                                        "M02*",
                                    });
    EXPECT_EQ(lines, expected);
    EXPECT_EQ(writer.stats.g36, 1);
    EXPECT_EQ(writer.stats.g37, 1);
}

TEST(GerberWriter, TrackAfterRegionClosesTheFill)
{
    // tracks are always written before regions
    std::vector<dxf_entity> polylines{
        make_polyline("Top", { { 0, 0 }, { 1, 0 }, { 1, 1 } }, std::nullopt, 1),    //
        make_polyline("Top", { { 5, 5 }, { 6, 5 } }, 0.25),
    };
    cam_entities entities;
    entities.regions = { &polylines[0] };
    entities.tracks = { &polylines[1] };

    gerber_writer writer(cam_settings{}, { 0.0, 0.25 });
    std::string text = write_gerber(writer, entities);

    auto lines = split_lines(text);
    auto track = std::find(lines.begin(), lines.end(), "X6000000D01*");
    auto fill = std::find(lines.begin(), lines.end(), "G36*");
    ASSERT_NE(track, lines.end());
    ASSERT_NE(fill, lines.end());
    EXPECT_LT(track, fill);
    EXPECT_EQ(count_lines(text, "G37*"), 1);
}

TEST(GerberWriter, ZeroWidthTrackUsesDefaultAperture)
{
    log_capture capture;

    std::vector<dxf_entity> tracks{ make_polyline("Top Copper", { { 0, 0 }, { 1, 0 } }) };
    cam_entities entities;
    entities.tracks = pointers(tracks);

    gerber_writer writer(cam_settings{}, { 0.0 });
    std::string text = write_gerber(writer, entities);

    EXPECT_EQ(count_lines(text, "%ADD10C,0.010000*%"), 1);
    EXPECT_EQ(count_lines(text, "D10*"), 1);
    EXPECT_EQ(writer.stats.zero_width_tracks, 1);
    EXPECT_TRUE(capture.contains("Zero width track"));
}

TEST(GerberWriter, ScaleAppliesToCoordinatesAndSizes)
{
    std::vector<dxf_entity> circles{ make_circle("Top", 1.5, -2, 0.25) };
    cam_entities entities;
    entities.circles = pointers(circles);

    cam_settings settings;
    settings.scale = 2.0;
    settings.title = "scaled";
    gerber_writer writer(settings, { 0.25 });
    std::string text = write_gerber(writer, entities);

    EXPECT_EQ(count_lines(text, "G04 scaled*"), 1);
    EXPECT_EQ(count_lines(text, "%ADD10C,0.500000*%"), 1);
    EXPECT_EQ(count_lines(text, "X3000000Y-4000000D03*"), 1);
}

TEST(GerberWriter, CoordinateFormatFollowsSettings)
{
    std::vector<dxf_entity> circles{ make_circle("Top", 1.25, 1, 0.5) };
    cam_entities entities;
    entities.circles = pointers(circles);

    cam_settings settings;
    settings.integer_digits = 3;
    settings.decimal_digits = 4;
    gerber_writer writer(settings, { 0.5 });
    std::string text = write_gerber(writer, entities);

    EXPECT_EQ(count_lines(text, "%FSLAX34Y34*%"), 1);
    EXPECT_EQ(count_lines(text, "X12500Y10000D03*"), 1);
}

TEST(GerberWriter, ApertureTableIncludesEveryDrawingDiameter)
{
    cam_entities entities;
    std::vector<dxf_entity> circles{ make_circle("Top", 1, 1, 1) };
    entities.circles = pointers(circles);

    gerber_writer writer(cam_settings{}, { 0.0, 0.25, 1.0 });
    std::string text = write_gerber(writer, entities);

    EXPECT_EQ(count_lines(text, "%ADD10C,0.010000*%"), 1);
    EXPECT_EQ(count_lines(text, "%ADD11C,0.250000*%"), 1);
    EXPECT_EQ(count_lines(text, "%ADD12C,1.000000*%"), 1);
    EXPECT_EQ(count_lines(text, "D12*"), 1);
}

TEST(GerberWriter, WritingTwiceGivesTheSameOutput)
{
    std::vector<dxf_entity> polylines{
        make_polyline("Top", { { 0, 0 }, { 1, 0 } }, 0.25),                         //
        make_polyline("Top", { { 0, 0 }, { 1, 0 }, { 1, 1 } }, std::nullopt, 1),
    };
    std::vector<dxf_entity> circles{ make_circle("Top", 3, 3, 0.5) };
    cam_entities entities;
    entities.tracks = { &polylines[0] };
    entities.regions = { &polylines[1] };
    entities.circles = pointers(circles);

    gerber_writer writer(cam_settings{}, { 0.0, 0.25, 0.5 });
    std::string first = write_gerber(writer, entities);
    std::string second = write_gerber(writer, entities);

    EXPECT_EQ(first, second);
    EXPECT_EQ(writer.stats.d3, 1);
}

TEST(GerberWriter, UnknownDiameterIsAnError)
{
    std::vector<dxf_entity> circles{ make_circle("Top", 1, 1, 0.75) };
    cam_entities entities;
    entities.circles = pointers(circles);

    gerber_writer writer(cam_settings{}, { 0.5 });
    std::ostringstream out;
    EXPECT_EQ(writer.write(out, entities), error_undefined_aperture);
}

TEST(GerberWriter, HasOutput)
{
    gerber_writer writer(cam_settings{}, {});
    cam_entities entities;
    EXPECT_FALSE(writer.has_output(entities));

    std::vector<dxf_entity> circles{ make_circle("Top", 0, 0, 0.5) };
    entities.circles = pointers(circles);
    EXPECT_TRUE(writer.has_output(entities));
}
