// qmotionCurveGridTest.cpp
//
/****************************************************************************
   Copyright (C) 2005-2025, rncbc aka Rui Nuno Capela. All rights reserved.

   This program is free software; you can redistribute it and/or
   modify it under the terms of the GNU General Public License
   as published by the Free Software Foundation; either version 2
   of the License, or (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License along
   with this program; if not, write to the Free Software Foundation, Inc.,
   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*****************************************************************************/

#include "qmotionCurveGrid.h"
#include "qmotionSpline.h"

#include <gtest/gtest.h>


TEST(qmotionCurveGridTest, SnapsWithinTolerance)
{
	qmotionCurveGrid grid(0.001);
	grid.addValue(0.5);
	grid.addValue(0.2);

	EXPECT_EQ(grid.snap(0.5005), 0.5);
	EXPECT_EQ(grid.snap(0.4995), 0.5);
	EXPECT_EQ(grid.snap(0.2003), 0.2);
	EXPECT_EQ(grid.snap(0.6), 0.6);
	EXPECT_EQ(grid.snap(0.35), 0.35);
}


TEST(qmotionCurveGridTest, EmptyGridNeverSnaps)
{
	qmotionCurveGrid grid;

	EXPECT_TRUE(grid.isEmpty());
	EXPECT_EQ(grid.snap(0.5), 0.5);
}


TEST(qmotionCurveGridTest, ValuesStaySortedWithDuplicates)
{
	qmotionCurveGrid grid;
	grid.addValue(0.5);
	grid.addValue(0.2);
	grid.addValue(0.5);

	EXPECT_EQ(grid.values(), QList<double>() << 0.2 << 0.5 << 0.5);

	grid.removeValue(0.5);
	EXPECT_EQ(grid.values(), QList<double>() << 0.2 << 0.5);

	grid.removeValue(0.3);
	EXPECT_EQ(grid.values().count(), 2);

	grid.clear();
	EXPECT_TRUE(grid.isEmpty());
}


TEST(qmotionCurveGridTest, FilledFromSplineKnots)
{
	QList<double> knots;
	knots << 0.0 << 1.0 << 2.0;
	qmotionSpline::Matrix coeffs;
	coeffs << (qmotionSpline::Row() << 0.2 << 0.5);
	coeffs << (qmotionSpline::Row() << 0.5 << 0.9);

	qmotionCurveGrid grid;
	grid.addValue(7.0);
	grid.setSpline(qmotionSpline(knots, coeffs));

	EXPECT_EQ(grid.values(), QList<double>() << 0.2 << 0.5 << 0.9);
}


// end of qmotionCurveGridTest.cpp
