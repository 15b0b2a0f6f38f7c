// qmotionCurveGrid.h
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

#ifndef __qmotionCurveGrid_h
#define __qmotionCurveGrid_h

#include <QList>

// Forward declarations.
class qmotionSpline;


//-------------------------------------------------------------------------
// qmotionCurveGrid -- Knot value snapping grid (one gesture lifetime).

class qmotionCurveGrid
{
public:

	// Constructor.
	qmotionCurveGrid(double dTolerance = 0.001);

	// Snap tolerance (absolute).
	void setTolerance(double dTolerance)
		{ m_dTolerance = dTolerance; }
	double tolerance() const
		{ return m_dTolerance; }

	// Grid values management.
	void addValue(double dValue);
	void removeValue(double dValue);
	void setSpline(const qmotionSpline& spline);
	void clear();

	const QList<double>& values() const
		{ return m_values; }
	bool isEmpty() const
		{ return m_values.isEmpty(); }

	// Snap to the nearest value within tolerance.
	double snap(double dValue) const;

private:

	// Instance variables.
	double m_dTolerance;

	// Sorted knot values.
	QList<double> m_values;
};


#endif  // __qmotionCurveGrid_h


// end of qmotionCurveGrid.h
