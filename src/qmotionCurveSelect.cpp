// qmotionCurveSelect.cpp
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

#include "qmotionCurveSelect.h"
#include "qmotionSpline.h"

#include <algorithm>


//-------------------------------------------------------------------------
// qmotionCurveSelect -- Knot selection capsule.

// Constructor.
qmotionCurveSelect::qmotionCurveSelect (void)
{
}


// Knot selection methods.
void qmotionCurveSelect::selectKnot ( int iKnot )
{
	m_knots.insert(iKnot);
}

void qmotionCurveSelect::deselectKnot ( int iKnot )
{
	m_knots.remove(iKnot);
}

void qmotionCurveSelect::deselectAll (void)
{
	m_knots.clear();
}


// Ascending knot indexes.
QList<int> qmotionCurveSelect::sorted (void) const
{
	QList<int> knots;

	QSetIterator<int> iter(m_knots);
	while (iter.hasNext())
		knots.append(iter.next());

	std::sort(knots.begin(), knots.end());

	return knots;
}


// Click selection.
void qmotionCurveSelect::clickSelect (
	const QList<int>& knots, bool bAdditive )
{
	bool bAlreadySelected = false;
	QListIterator<int> iter(knots);
	while (iter.hasNext() && !bAlreadySelected)
		bAlreadySelected = isSelected(iter.next());

	if (!isEmpty() && !bAlreadySelected && !bAdditive)
		deselectAll();

	iter.toFront();
	while (iter.hasNext())
		selectKnot(iter.next());
}


// Rectangle selection over sorted knot times.
void qmotionCurveSelect::rectSelect (
	const QList<double>& xs, double dLeft, double dRight )
{
	if (dLeft > dRight)
		std::swap(dLeft, dRight);

	const int iLo = qmotionSpline::searchSortedLeft(xs, dLeft);
	const int iHi = qmotionSpline::searchSortedLeft(xs, dRight);

	const int iCount = xs.count();
	for (int i = 0; i < iCount; ++i) {
		if (iLo <= i && i < iHi)
			selectKnot(i);
		else
			deselectKnot(i);
	}
}


// end of qmotionCurveSelect.cpp
