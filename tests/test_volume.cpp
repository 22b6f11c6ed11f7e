#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "paste_volume.h"

using namespace paste_lib;

namespace
{
    std::vector<paste_pad> make_pads()
    {
        std::vector<paste_pad> pads(3);
        EXPECT_EQ(make_circle_pad(1, { 0, 0 }, 0.254, default_thickness_mm, &pads[0]), ok);
        EXPECT_EQ(make_rectangle_pad(2, { 1, 0 }, 0.5, 0.3, default_thickness_mm, &pads[1]), ok);
        EXPECT_EQ(make_rectangle_pad(3, { 2, 0 }, 0.4, 0.4, default_thickness_mm, &pads[2]), ok);
        return pads;
    }
}    // namespace

TEST(VolumeTest, DefaultThickness)
{
    std::vector<paste_pad> pads = make_pads();
    thickness_manager m;

    double v;
    ASSERT_EQ(pad_volume(pads[0], m, &v), ok);
    EXPECT_NEAR(v, M_PI * 0.127 * 0.127 * 0.15, 1e-12);

    ASSERT_EQ(pad_volume(pads[1], m, &v), ok);
    EXPECT_NEAR(v, 0.5 * 0.3 * 0.15, 1e-12);
}

TEST(VolumeTest, OverrideIsUsed)
{
    std::vector<paste_pad> pads = make_pads();
    thickness_manager m;
    ASSERT_EQ(m.set_thickness({ 2 }, 0.1), ok);

    pad_summary s;
    ASSERT_EQ(get_pad_summary(pads[1], m, &s), ok);
    EXPECT_EQ(s.id, 2);
    EXPECT_EQ(s.shape, shape_rectangle);
    EXPECT_TRUE(s.is_stepped);
    EXPECT_DOUBLE_EQ(s.thickness, 0.1);
    EXPECT_NEAR(s.volume, 0.5 * 0.3 * 0.1, 1e-12);

    ASSERT_EQ(get_pad_summary(pads[2], m, &s), ok);
    EXPECT_FALSE(s.is_stepped);
    EXPECT_DOUBLE_EQ(s.thickness, 0.15);
}

TEST(VolumeTest, TotalIsSumOfPads)
{
    std::vector<paste_pad> pads = make_pads();
    thickness_manager m;
    ASSERT_EQ(m.set_thickness({ 1, 3 }, 0.2), ok);

    double expected = 0;
    for(auto const &pad : pads) {
        double v;
        ASSERT_EQ(pad_volume(pad, m, &v), ok);
        expected += v;
    }

    double total;
    ASSERT_EQ(total_volume(pads, m, &total), ok);
    EXPECT_NEAR(total, expected, 1e-15);

    volume_report report;
    ASSERT_EQ(get_volume_report(pads, m, &report), ok);
    EXPECT_EQ(report.pad_count, 3u);
    EXPECT_EQ(report.stepped_count, 2u);
    EXPECT_NEAR(report.total_area, pads[0].area + pads[1].area + pads[2].area, 1e-15);
    EXPECT_NEAR(report.total_volume, expected, 1e-15);

    m.undo();
    ASSERT_EQ(total_volume(pads, m, &total), ok);
    EXPECT_NEAR(total, report.total_area * 0.15, 1e-12);
}

TEST(VolumeTest, EmptyPadListHasZeroVolume)
{
    thickness_manager m;
    double total = -1;
    ASSERT_EQ(total_volume({}, m, &total), ok);
    EXPECT_EQ(total, 0);
}

TEST(VolumeTest, ZeroAreaIsZeroVolume)
{
    paste_pad pad;
    pad.id = 1;
    pad.area = 0;
    thickness_manager m;
    double v = -1;
    ASSERT_EQ(pad_volume(pad, m, &v), ok);
    EXPECT_EQ(v, 0);
}

TEST(VolumeTest, NegativeInputsAreErrors)
{
    thickness_manager m;
    double v;

    paste_pad negative_area;
    negative_area.id = 1;
    negative_area.area = -1;
    EXPECT_EQ(pad_volume(negative_area, m, &v), error_negative_area);

    paste_pad negative_thickness;
    negative_thickness.id = 2;
    negative_thickness.area = 1;
    negative_thickness.default_thickness = -0.1;
    EXPECT_EQ(pad_volume(negative_thickness, m, &v), error_negative_thickness);

    double total;
    EXPECT_EQ(total_volume({ negative_area }, m, &total), error_negative_area);
    EXPECT_EQ(pad_volume(negative_area, m, nullptr), error_internal_bad_pointer);
}
