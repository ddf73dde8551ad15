#include <gtest/gtest.h>
#include "squircle/squircle.distribute.h"
#include <algorithm>

using namespace SquircleLib;

static RoundedRect MakeRect(double width, double height,
	double tl, double tr, double bl, double br)
{
	return RoundedRect(width, height, CornerMap<double>(tl, tr, bl, br));
}

TEST(SquircleTests, DistributeAdjacents)
{
	std::pair<Adjacent, Adjacent> adj = GetAdjacents(Corner::TopLeft);
	EXPECT_EQ(adj.first.corner, Corner::TopRight);
	EXPECT_EQ(adj.first.side, Side::Top);
	EXPECT_EQ(adj.second.corner, Corner::BottomLeft);
	EXPECT_EQ(adj.second.side, Side::Left);

	adj = GetAdjacents(Corner::BottomRight);
	EXPECT_EQ(adj.first.corner, Corner::BottomLeft);
	EXPECT_EQ(adj.first.side, Side::Bottom);
	EXPECT_EQ(adj.second.corner, Corner::TopRight);
	EXPECT_EQ(adj.second.side, Side::Right);

	// every adjacency is mutual and shares the same side
	for (Corner corner : all_corners)
	{
		adj = GetAdjacents(corner);
		for (const Adjacent& a : { adj.first, adj.second })
		{
			std::pair<Adjacent, Adjacent> back = GetAdjacents(a.corner);
			bool found =
				(back.first.corner == corner && back.first.side == a.side) ||
				(back.second.corner == corner && back.second.side == a.side);
			EXPECT_TRUE(found) << corner << " -> " << a.corner;
		}
	}
}

TEST(SquircleTests, DistributeCompetingCorners)
{
	// both top corners want the whole of the 40 unit top edge
	NormalizedCorners nc = DistributeAndNormalize(MakeRect(40, 100, 40, 40, 0, 0));
	EXPECT_DOUBLE_EQ(nc.top_left.radius, 20.0);
	EXPECT_DOUBLE_EQ(nc.top_right.radius, 20.0);
	EXPECT_DOUBLE_EQ(nc.top_left.rounding_and_smoothing_budget, 20.0);
	EXPECT_DOUBLE_EQ(nc.top_right.rounding_and_smoothing_budget, 20.0);
	EXPECT_EQ(nc.bottom_left.radius, 0.0);
	EXPECT_EQ(nc.bottom_right.radius, 0.0);
	EXPECT_EQ(nc.bottom_left.rounding_and_smoothing_budget, 0.0);
	EXPECT_EQ(nc.bottom_right.rounding_and_smoothing_budget, 0.0);
}

TEST(SquircleTests, DistributeBudgetConservation)
{
	// processing order: TL(30), BL(25), BR(20), TR(10)
	NormalizedCorners nc = DistributeAndNormalize(MakeRect(100, 60, 30, 10, 25, 20));

	EXPECT_NEAR(nc.top_left.rounding_and_smoothing_budget, 30.0 / 55.0 * 60.0, 1e-9);
	EXPECT_DOUBLE_EQ(nc.top_left.radius, 30.0);
	EXPECT_NEAR(nc.bottom_right.rounding_and_smoothing_budget, 40.0, 1e-9);
	EXPECT_NEAR(nc.top_right.rounding_and_smoothing_budget, 20.0, 1e-9);
	EXPECT_DOUBLE_EQ(nc.top_right.radius, 10.0);

	// left and right sides are claimed in full by their two corners
	EXPECT_NEAR(nc.top_left.rounding_and_smoothing_budget +
		nc.bottom_left.rounding_and_smoothing_budget, 60.0, 1e-9);
	EXPECT_NEAR(nc.top_right.rounding_and_smoothing_budget +
		nc.bottom_right.rounding_and_smoothing_budget, 60.0, 1e-9);
	// while the top and bottom sides are constrained by the left and right
	EXPECT_LT(nc.top_left.rounding_and_smoothing_budget +
		nc.top_right.rounding_and_smoothing_budget, 100.0);
	EXPECT_LT(nc.bottom_left.rounding_and_smoothing_budget +
		nc.bottom_right.rounding_and_smoothing_budget, 100.0);
}

TEST(SquircleTests, DistributeMonotonicClamping)
{
	const double sizes[][2] = { {100, 100}, {40, 300}, {250, 30}, {1, 1}, {0, 50} };
	const double radii[][4] = {
		{0, 0, 0, 0}, {10, 10, 10, 10}, {500, 0, 0, 0}, {5, 80, 15, 2},
		{60, 60, 0, 60}, {0.5, 1000, 3, 3}, {25, 0, 0, 25} };

	for (const auto& size : sizes)
	{
		for (const auto& r : radii)
		{
			RoundedRect rect = MakeRect(size[0], size[1], r[0], r[1], r[2], r[3]);
			NormalizedCorners nc = DistributeAndNormalize(rect);
			for (Corner corner : all_corners)
			{
				const NormalizedCorner& n = nc[corner];
				EXPECT_LE(n.radius, rect.radii[corner]) << corner;
				EXPECT_LE(n.radius, n.rounding_and_smoothing_budget) << corner;
				EXPECT_GE(n.rounding_and_smoothing_budget, 0.0) << corner;
				EXPECT_LE(n.rounding_and_smoothing_budget,
					std::min(size[0], size[1]) + 1e-9) << corner;
			}
			// adjacent corners never claim more than their shared side
			for (Corner corner : all_corners)
			{
				std::pair<Adjacent, Adjacent> adj = GetAdjacents(corner);
				for (const Adjacent& a : { adj.first, adj.second })
					EXPECT_LE(nc[corner].rounding_and_smoothing_budget +
						nc[a.corner].rounding_and_smoothing_budget,
						rect.SideLength(a.side) + 1e-9) << corner << " & " << a.corner;
			}
		}
	}
}

TEST(SquircleTests, DistributeEqualRadii)
{
	NormalizedCorners nc = DistributeAndNormalize(MakeRect(80, 200, 30, 30, 30, 30));
	for (Corner corner : all_corners)
	{
		EXPECT_DOUBLE_EQ(nc[corner].rounding_and_smoothing_budget, 40.0) << corner;
		EXPECT_DOUBLE_EQ(nc[corner].radius, 30.0) << corner;
	}

	nc = DistributeAndNormalize(MakeRect(80, 200, 90, 90, 90, 90));
	for (Corner corner : all_corners)
	{
		EXPECT_DOUBLE_EQ(nc[corner].rounding_and_smoothing_budget, 40.0) << corner;
		EXPECT_DOUBLE_EQ(nc[corner].radius, 40.0) << corner;
	}
}

TEST(SquircleTests, DistributeZeroRadii)
{
	NormalizedCorners nc = DistributeAndNormalize(MakeRect(100, 100, 0, 0, 0, 0));
	for (Corner corner : all_corners)
	{
		EXPECT_EQ(nc[corner].radius, 0.0);
		EXPECT_EQ(nc[corner].rounding_and_smoothing_budget, 0.0);
	}
}

TEST(SquircleTests, DistributeOversizedSingleCorner)
{
	NormalizedCorners nc = DistributeAndNormalize(MakeRect(100, 100, 500, 0, 0, 0));
	EXPECT_DOUBLE_EQ(nc.top_left.rounding_and_smoothing_budget, 100.0);
	EXPECT_DOUBLE_EQ(nc.top_left.radius, 100.0);
	EXPECT_DOUBLE_EQ(nc.top_right.rounding_and_smoothing_budget, 0.0);
	EXPECT_DOUBLE_EQ(nc.bottom_left.rounding_and_smoothing_budget, 0.0);
	EXPECT_DOUBLE_EQ(nc.bottom_right.rounding_and_smoothing_budget, 0.0);
}
