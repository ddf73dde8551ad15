#include <gtest/gtest.h>
#include "squircle/squircle.h"
#include <cmath>

using namespace SquircleLib;

static SquircleParams MakeParams(double width, double height, double radius,
	double smoothing, bool preserve = false)
{
	SquircleParams params;
	params.width = width;
	params.height = height;
	params.corner_radius = radius;
	params.corner_smoothing = smoothing;
	params.preserve_smoothing = preserve;
	return params;
}

TEST(SquircleTests, FlattenRectangle)
{
	PathD path = GetSquirclePathD(MakeParams(100, 60, 0, 0.6));
	ASSERT_EQ(path.size(), 4u);
	EXPECT_EQ(path[0], PointD(100, 0));
	EXPECT_EQ(path[1], PointD(100, 60));
	EXPECT_EQ(path[2], PointD(0, 60));
	EXPECT_EQ(path[3], PointD(0, 0));
	EXPECT_DOUBLE_EQ(Area(path), 6000.0);
}

TEST(SquircleTests, FlattenBounds)
{
	for (double smoothing : { 0.0, 0.6, 1.0 })
		for (bool preserve : { false, true })
		{
			PathD path = GetSquirclePathD(MakeParams(200, 120, 70, smoothing, preserve));
			ASSERT_GT(path.size(), 8u);
			RectD bounds = GetBounds(path);
			EXPECT_NEAR(bounds.left, 0.0, 1e-9);
			EXPECT_NEAR(bounds.top, 0.0, 1e-9);
			EXPECT_NEAR(bounds.right, 200.0, 1e-9);
			EXPECT_NEAR(bounds.bottom, 120.0, 1e-9);
			EXPECT_GT(Area(path), 0.0);
		}
	EXPECT_TRUE(GetBounds(PathD()).IsEmpty());
}

TEST(SquircleTests, FlattenCircularCorners)
{
	// with no smoothing each corner is a quarter circle
	PathD path = GetSquirclePathD(MakeParams(100, 100, 20, 0), 0.001);
	const PointD centers[] = { {80, 20}, {80, 80}, {20, 80}, {20, 20} };
	for (const PointD& pt : path)
		for (const PointD& c : centers)
		{
			bool in_corner = std::fabs(pt.x - c.x) < 20 && std::fabs(pt.y - c.y) < 20 &&
				(pt.x < 20 || pt.x > 80) && (pt.y < 20 || pt.y > 80);
			if (!in_corner) continue;
			EXPECT_NEAR(std::hypot(pt.x - c.x, pt.y - c.y), 20.0, 1e-6) << pt;
		}
	// the polygon lies just inside the true shape (16 segments per quarter)
	double expected_area = 100 * 100 - (4 - PI) * 20 * 20;
	EXPECT_NEAR(Area(path), expected_area, 3.0);
	EXPECT_LT(Area(path), expected_area);
}

TEST(SquircleTests, FlattenArcTolerance)
{
	SquircleParams params = MakeParams(300, 300, 100, 0.6);
	PathD coarse = GetSquirclePathD(params, 1.0);
	PathD fine = GetSquirclePathD(params, 0.01);
	EXPECT_LT(coarse.size(), fine.size());

	// the default tolerance is finer than 1.0
	PathD automatic = GetSquirclePathD(params);
	EXPECT_LT(coarse.size(), automatic.size());
	EXPECT_NEAR(Area(automatic), Area(fine), 0.01 * Area(fine));
}

TEST(SquircleTests, FlattenMakeAbsolute)
{
	PathCmds cmds;
	cmds.push_back(PathCmd::MoveTo(10, 0));
	cmds.push_back(PathCmd::CubicTo(PointD(1, 0), PointD(2, 0), PointD(3, 1), true));
	cmds.push_back(PathCmd::ArcTo(5, 5, 0, false, true, PointD(2, 2), true));
	cmds.push_back(PathCmd::LineTo(0, 7, true));
	cmds.push_back(PathCmd::LineTo(0, 20));
	cmds.push_back(PathCmd::Close());

	PathCmds abs_cmds = MakeAbsolute(cmds);
	ASSERT_EQ(abs_cmds.size(), cmds.size());
	for (const PathCmd& cmd : abs_cmds) EXPECT_FALSE(cmd.relative);
	EXPECT_EQ(abs_cmds[1].ctrl1, PointD(11, 0));
	EXPECT_EQ(abs_cmds[1].ctrl2, PointD(12, 0));
	EXPECT_EQ(abs_cmds[1].pt, PointD(13, 1));
	EXPECT_EQ(abs_cmds[2].pt, PointD(15, 3));
	EXPECT_EQ(abs_cmds[2].rx, 5.0);
	EXPECT_EQ(abs_cmds[3].pt, PointD(15, 10));
	EXPECT_EQ(abs_cmds[4].pt, PointD(0, 20));
	EXPECT_EQ(abs_cmds[5].type, PathCmdType::Close);

	EXPECT_EQ(GetEndPoint(cmds), PointD(0, 20));
}
