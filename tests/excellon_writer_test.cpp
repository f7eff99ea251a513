#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "tests/test_common.h"

using namespace cam_lib;
using namespace cam_test;

namespace
{
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

TEST(ExcellonWriter, SingleHole)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 10, 10, 0.5) };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.0, 0.5 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    std::vector<std::string> expected{ "%", "M48", "METRIC,TZ", "M71", "T01C0.500", "%", "G05", "T01", "X10.00Y10.00", "M30" };
    EXPECT_EQ(split_lines(out.str()), expected);
    EXPECT_EQ(writer.stats.drill_hits, 1);
    EXPECT_EQ(writer.stats.tools_defined, 1);
}

TEST(ExcellonWriter, ToolSizesRoundUp)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 1, 1, 0.25) };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.25 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    EXPECT_EQ(count_lines(out.str(), "T01C0.300"), 1);
}

TEST(ExcellonWriter, CoordinatesDropLeadingZeros)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 0.5, 123.25, 1) };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 1.0 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    EXPECT_EQ(count_lines(out.str(), "X.50Y123.25"), 1);
}

TEST(ExcellonWriter, HolesByDiameterThenPosition)
{
    std::vector<dxf_entity> circles{
        make_circle("Drill", 5, 1, 1),      //
        make_circle("Drill", 2, 2, 0.5),    //
        make_circle("Drill", 1, 3, 1),      //
        make_circle("Drill", 2, 1, 0.5),    //
        make_circle("Drill", 0, 0, 1),
    };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.0, 0.5, 1.0 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    std::vector<std::string> expected{ "%",  "M48",         "METRIC,TZ",  "M71", "T01C0.500",   "T02C1.000",  "%",  "G05",
                                       "T01", "X2.00Y1.00", "X2.00Y2.00", "T02", "X1.00Y3.00", "X5.00Y1.00", "M30" };
    EXPECT_EQ(split_lines(out.str()), expected);
    EXPECT_EQ(writer.stats.origin_flashes, 1);
    EXPECT_EQ(writer.stats.tool_selects, 2);
}

TEST(ExcellonWriter, ZeroDiameterIsNotATool)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 1, 1, 0), make_circle("Drill", 2, 2, 0.5) };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.0, 0.5 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    std::string text = out.str();
    EXPECT_EQ(count_lines(text, "X1.00Y1.00"), 0);
    EXPECT_EQ(count_lines(text, "X2.00Y2.00"), 1);
    EXPECT_EQ(writer.stats.tools_defined, 1);
}

TEST(ExcellonWriter, ScaleAppliesToToolsAndHoles)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 1.5, 2, 0.5) };
    cam_entities entities;
    entities.circles = pointers(circles);

    cam_settings settings;
    settings.scale = 2.0;
    excellon_writer writer(settings, { 0.5 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    EXPECT_EQ(count_lines(out.str(), "T01C1.000"), 1);
    EXPECT_EQ(count_lines(out.str(), "X3.00Y4.00"), 1);
}

TEST(ExcellonWriter, UnknownDiameterIsAnError)
{
    std::vector<dxf_entity> circles{ make_circle("Drill", 1, 1, 0.75) };
    cam_entities entities;
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.5 });
    std::ostringstream out;
    EXPECT_EQ(writer.write(out, entities), error_undefined_tool);
}

TEST(ExcellonWriter, HasOutput)
{
    excellon_writer writer(cam_settings{}, {});

    std::vector<dxf_entity> origin{ make_circle("Drill", 0, 0, 0.5), make_circle("Drill", 1, 1, 0) };
    cam_entities entities;
    entities.circles = pointers(origin);
    EXPECT_FALSE(writer.has_output(entities));

    std::vector<dxf_entity> hole{ make_circle("Drill", 1, 1, 0.5) };
    entities.circles = pointers(hole);
    EXPECT_TRUE(writer.has_output(entities));
}

TEST(ExcellonWriter, RoutingIsReported)
{
    log_capture capture;

    std::vector<dxf_entity> slots{ make_polyline("Drill", { { 0, 0 }, { 1, 0 } }, 0.5) };
    std::vector<dxf_entity> circles{ make_circle("Drill", 1, 1, 0.5) };
    cam_entities entities;
    entities.tracks = pointers(slots);
    entities.circles = pointers(circles);

    excellon_writer writer(cam_settings{}, { 0.5 });
    std::ostringstream out;
    ASSERT_EQ(writer.write(out, entities), ok);

    EXPECT_TRUE(capture.contains("routing is not implemented"));
    EXPECT_EQ(count_lines(out.str(), "X1.00Y1.00"), 1);
}
