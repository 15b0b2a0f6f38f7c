// qmotionCurveSelect.h
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

#ifndef __qmotionCurveSelect_h
#define __qmotionCurveSelect_h

#include <QSet>
#include <QList>


//-------------------------------------------------------------------------
// qmotionCurveSelect -- Knot selection capsule.

class qmotionCurveSelect
{
public:

	// Constructor.
	qmotionCurveSelect();

	// Knot selection methods.
	void selectKnot(int iKnot);
	void deselectKnot(int iKnot);
	void deselectAll();

	bool isSelected(int iKnot) const
		{ return m_knots.contains(iKnot); }
	bool isEmpty() const
		{ return m_knots.isEmpty(); }
	int count() const
		{ return m_knots.count(); }

	// Ascending knot indexes.
	QList<int> sorted() const;

	// Click selection: replaces the current selection unless
	// additive or any of the clicked knots is already selected.
	void clickSelect(const QList<int>& knots, bool bAdditive = false);

	// Rectangle selection over sorted knot times [left, right).
	void rectSelect(const QList<double>& xs, double dLeft, double dRight);

private:

	// The knot selection set.
	QSet<int> m_knots;
};


#endif  // __qmotionCurveSelect_h


// end of qmotionCurveSelect.h
