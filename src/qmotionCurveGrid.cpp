// qmotionCurveGrid.cpp
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

#include <cmath>


//-------------------------------------------------------------------------
// qmotionCurveGrid -- Knot value snapping grid.

// Constructor.
qmotionCurveGrid::qmotionCurveGrid ( double dTolerance )
	: m_dTolerance(dTolerance)
{
}


// Sorted insertion (duplicates kept, one per knot).
void qmotionCurveGrid::addValue ( double dValue )
{
	const int iIndex = qmotionSpline::searchSortedLeft(m_values, dValue);
	m_values.insert(iIndex, dValue);
}


// Remove one occurrence.
void qmotionCurveGrid::removeValue ( double dValue )
{
	const int iIndex = qmotionSpline::searchSortedLeft(m_values, dValue);
	if (iIndex < m_values.count() && m_values.at(iIndex) == dValue)
		m_values.removeAt(iIndex);
}


// Collect all knot values of a spline.
void qmotionCurveGrid::setSpline ( const qmotionSpline& spline )
{
	clear();

	const int iSegments = spline.segments();
	for (int iKnot = 0; iKnot <= iSegments; ++iKnot)
		addValue(spline.knotValue(iKnot));
}


void qmotionCurveGrid::clear (void)
{
	m_values.clear();
}


// Snap to the nearest value within tolerance.
double qmotionCurveGrid::snap ( double dValue ) const
{
	const int iIndex = qmotionSpline::searchSortedLeft(m_values, dValue);

	double dSnap = dValue;
	double dDist = m_dTolerance;

	// Check both neighbours of the insertion point...
	for (int i = iIndex - 1; i <= iIndex; ++i) {
		if (i < 0 || i >= m_values.count())
			continue;
		const double d = std::fabs(m_values.at(i) - dValue);
		if (d < dDist) {
			dSnap = m_values.at(i);
			dDist = d;
		}
	}

	return dSnap;
}


// end of qmotionCurveGrid.cpp
