// qmotionBBox.h
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

#ifndef __qmotionBBox_h
#define __qmotionBBox_h

#include <QPointF>

#include <limits>


//-------------------------------------------------------------------------
// qmotionBBox -- Axis aligned (time, value) bounding box.

class qmotionBBox
{
public:

	// Constructors (default is the empty/inverted box).
	qmotionBBox()
		: m_ll(+infinity(), +infinity()), m_ur(-infinity(), -infinity()) {}
	qmotionBBox(const QPointF& ll, const QPointF& ur)
		: m_ll(ll), m_ur(ur) {}

	// Corner accessors.
	const QPointF& ll() const { return m_ll; }
	const QPointF& ur() const { return m_ur; }

	double left()   const { return m_ll.x(); }
	double right()  const { return m_ur.x(); }
	double bottom() const { return m_ll.y(); }
	double top()    const { return m_ur.y(); }

	double width()  const { return m_ur.x() - m_ll.x(); }
	double height() const { return m_ur.y() - m_ll.y(); }

	// Nothing has been expanded into yet.
	bool isEmpty() const
		{ return (m_ll.x() > m_ur.x() || m_ll.y() > m_ur.y()); }

	// Reset to the empty box.
	void reset()
	{
		m_ll = QPointF(+infinity(), +infinity());
		m_ur = QPointF(-infinity(), -infinity());
	}

	// Grow by a point or by another box.
	void expand(const QPointF& pos)
	{
		if (m_ll.x() > pos.x()) m_ll.setX(pos.x());
		if (m_ll.y() > pos.y()) m_ll.setY(pos.y());
		if (m_ur.x() < pos.x()) m_ur.setX(pos.x());
		if (m_ur.y() < pos.y()) m_ur.setY(pos.y());
	}

	void expand(const qmotionBBox& bbox)
	{
		if (bbox.isEmpty())
			return;
		expand(bbox.ll());
		expand(bbox.ur());
	}

	// Clamp a point inside (limits).
	QPointF clip(const QPointF& pos) const
	{
		return QPointF(
			clipX(pos.x()),
			clipY(pos.y()));
	}

	double clipX(double x) const
	{
		if (x < m_ll.x()) x = m_ll.x();
		if (x > m_ur.x()) x = m_ur.x();
		return x;
	}

	double clipY(double y) const
	{
		if (y < m_ll.y()) y = m_ll.y();
		if (y > m_ur.y()) y = m_ur.y();
		return y;
	}

	bool contains(const QPointF& pos) const
	{
		return (pos.x() >= m_ll.x() && pos.x() <= m_ur.x()
			&& pos.y() >= m_ll.y() && pos.y() <= m_ur.y());
	}

	bool operator== (const qmotionBBox& bbox) const
	{
		return (m_ll.x() == bbox.m_ll.x() && m_ll.y() == bbox.m_ll.y()
			&& m_ur.x() == bbox.m_ur.x() && m_ur.y() == bbox.m_ur.y());
	}
	bool operator!= (const qmotionBBox& bbox) const
		{ return !(*this == bbox); }

	static double infinity()
		{ return std::numeric_limits<double>::infinity(); }

private:

	// Lower-left and upper-right corners.
	QPointF m_ll;
	QPointF m_ur;
};


#endif  // __qmotionBBox_h

// end of qmotionBBox.h
