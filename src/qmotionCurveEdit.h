// qmotionCurveEdit.h
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

#ifndef __qmotionCurveEdit_h
#define __qmotionCurveEdit_h

#include "qmotionCurve.h"
#include "qmotionCurveSelect.h"
#include "qmotionCurveGrid.h"

#include <QObject>
#include <QPointF>


//----------------------------------------------------------------------------
// qmotionCurveEdit -- Curve editing gestures on a working copy.

class qmotionCurveEdit : public QObject
{
	Q_OBJECT

public:

	// Drag gesture modes.
	enum DragMode { DragNone = 0, DragKnot, DragSegment,
		DragControlPoint, DragSelect };

	// Constructor.
	qmotionCurveEdit(QObject *pParent = nullptr);

	// Foreground curve (working copy).
	void setCurve(const qmotionCurve& curve, bool bClearSelect = true);
	const qmotionCurve& curve() const
		{ return m_curve; }

	// Active channel.
	void setChannel(int iChannel);
	int channel() const
		{ return m_iChannel; }

	// Active channel working spline.
	const qmotionSpline& spline() const;

	// Knot selection.
	const qmotionCurveSelect& select() const
		{ return m_select; }
	void clickSelect(const QList<int>& knots,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);
	void deselectAll();

	// Snap grid (alive during a gesture only).
	const qmotionCurveGrid& grid() const
		{ return m_grid; }
	void setSnapTolerance(double dTolerance)
		{ m_grid.setTolerance(dTolerance); }

	// Edit mode flags.
	void setC1(bool bC1)
		{ m_bC1 = bC1; }
	bool isC1() const
		{ return m_bC1; }

	void setSnapToGrid(bool bSnapToGrid)
		{ m_bSnapToGrid = bSnapToGrid; }
	bool isSnapToGrid() const
		{ return m_bSnapToGrid; }

	// Motion limits.
	void setLimits(const qmotionBBox& limits)
		{ m_limits = limits; }
	const qmotionBBox& limits() const
		{ return m_limits; }

	// Drag gestures.
	void beginKnotDrag(int iKnot, const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);
	void beginSegmentDrag(int iSegment, const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);
	void beginControlPointDrag(int iSegment, int iPower, const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);
	void beginSelectDrag(const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);

	void dragMove(const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);
	bool dragEnd(const QPointF& pos,
		Qt::KeyboardModifiers modifiers = Qt::NoModifier);

	DragMode dragMode() const
		{ return m_dragMode; }
	bool isDragging() const
		{ return (m_dragMode != DragNone); }

	// Discrete edits.
	bool insertKnot(const QPointF& pos);
	bool removeKnot(int iKnot);
	bool removeSelectedKnots();
	bool nudgeSelectedKnots(const QPointF& offset);

signals:

	// Working copy is changing (pointer position when bPointer).
	void curveChanging(const QPointF& pos, bool bPointer);

	// Working copy edit completed.
	void curveChanged(const qmotionCurve& curve, const QString& sName);

	// Active channel changed.
	void channelChanged(int iChannel);

	// Knot selection changed.
	void selectionChanged();

protected:

	// Gesture helpers.
	void beginDrag(DragMode dragMode, const QPointF& pos,
		Qt::KeyboardModifiers modifiers);
	void resetDrag();

	QPointF snapPoint(const QPointF& pos,
		Qt::KeyboardModifiers modifiers) const;

	void applyDrag(const QPointF& pos, Qt::KeyboardModifiers modifiers);

	// Move selected knots by an offset from the original.
	void moveSelectedKnots(const QPointF& offset, bool bSnap);

	// Replace the active channel spline.
	void setSpline(const qmotionSpline& spline);

	// Descriptive gesture name.
	static QString dragName(DragMode dragMode);

private:

	// Instance variables.
	qmotionCurve m_curve;
	int m_iChannel;

	qmotionCurveSelect m_select;
	qmotionCurveGrid   m_grid;

	bool m_bC1;
	bool m_bSnapToGrid;

	qmotionBBox m_limits;

	// Current gesture state.
	DragMode      m_dragMode;
	QPointF       m_posStart;
	qmotionCurve  m_orig;
	int           m_iDragSegment;
	int           m_iDragPower;
};


#endif  // __qmotionCurveEdit_h

// end of qmotionCurveEdit.h
