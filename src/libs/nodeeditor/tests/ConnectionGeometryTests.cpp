// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "nodeeditor/ConnectionGeometry.hpp"

namespace Geometry = NodeEditor::Geometry;

TEST(ConnectionGeometryTests, ControlOffsetFollowsHorizontalGap)
{
    const auto wide = Geometry::connectionCurve(QPointF(0.0, 0.0), QPointF(400.0, 100.0), 0.5, 50.0);
    EXPECT_DOUBLE_EQ(wide.p1.x(), 200.0);
    EXPECT_DOUBLE_EQ(wide.p1.y(), 0.0);
    EXPECT_DOUBLE_EQ(wide.p2.x(), 200.0);
    EXPECT_DOUBLE_EQ(wide.p2.y(), 100.0);

    const auto narrow = Geometry::connectionCurve(QPointF(0.0, 0.0), QPointF(20.0, 0.0), 0.5, 50.0);
    EXPECT_DOUBLE_EQ(narrow.p1.x(), 50.0);
    EXPECT_DOUBLE_EQ(narrow.p2.x(), -30.0);

    // Backwards wires still bulge outwards.
    const auto back = Geometry::connectionCurve(QPointF(200.0, 0.0), QPointF(0.0, 0.0), 0.5, 50.0);
    EXPECT_DOUBLE_EQ(back.p1.x(), 300.0);
    EXPECT_DOUBLE_EQ(back.p2.x(), -100.0);
}

TEST(ConnectionGeometryTests, CurveEndpointsAndDistance)
{
    const auto curve = Geometry::connectionCurve(QPointF(0.0, 0.0), QPointF(200.0, 0.0), 0.5, 50.0);
    EXPECT_EQ(curve.pointAt(0.0), QPointF(0.0, 0.0));
    EXPECT_EQ(curve.pointAt(1.0), QPointF(200.0, 0.0));

    EXPECT_NEAR(Geometry::distanceToCurve(QPointF(100.0, 0.0), curve, 32), 0.0, 1e-9);
    EXPECT_NEAR(Geometry::distanceToCurve(QPointF(100.0, 10.0), curve, 32), 10.0, 1e-9);
}

TEST(ConnectionGeometryTests, DistanceToSegment)
{
    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(5.0, 3.0), QPointF(0.0, 0.0), QPointF(10.0, 0.0)), 3.0);
    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(13.0, 4.0), QPointF(0.0, 0.0), QPointF(10.0, 0.0)), 5.0);
    EXPECT_DOUBLE_EQ(Geometry::distanceToSegment(QPointF(3.0, 4.0), QPointF(0.0, 0.0), QPointF(0.0, 0.0)), 5.0);
}

TEST(ConnectionGeometryTests, SnapToGrid)
{
    EXPECT_EQ(Geometry::snap(QPointF(13.0, 28.0), 20.0), QPointF(20.0, 20.0));
    EXPECT_EQ(Geometry::snap(QPointF(-9.0, 31.0), 20.0), QPointF(0.0, 40.0));
    EXPECT_EQ(Geometry::snap(QPointF(13.0, 28.0), 0.0), QPointF(13.0, 28.0));
}
