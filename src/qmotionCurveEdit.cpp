// qmotionCurveEdit.cpp
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

#include "qmotionCurveEdit.h"

#include <stdexcept>


//----------------------------------------------------------------------------
// qmotionCurveEdit -- Curve editing gestures on a working copy.

// Constructor.
qmotionCurveEdit::qmotionCurveEdit ( QObject *pParent )
	: QObject(pParent), m_curve(qmotionCurve::zeroCurve()), m_iChannel(0),
		m_bC1(true), m_bSnapToGrid(true),
		m_limits(QPointF(0.0, -qmotionBBox::infinity()),
			QPointF(qmotionBBox::infinity(), qmotionBBox::infinity())),
		m_dragMode(DragNone), m_iDragSegment(-1), m_iDragPower(-1)
{
}


// Foreground curve (working copy).
void qmotionCurveEdit::setCurve ( const qmotionCurve& curve, bool bClearSelect )
{
	if (curve.isEmpty())
		throw std::invalid_argument("qmotionCurveEdit::setCurve: empty curve");

	resetDrag();

	m_curve = curve;

	if (m_iChannel >= m_curve.channels()) {
		m_iChannel = 0;
		bClearSelect = true;
		emit channelChanged(m_iChannel);
	}

	if (bClearSelect) {
		m_select.deselectAll();
	} else {
		// Drop what went out of range.
		const int iSegments = spline().segments();
		QListIterator<int> iter(m_select.sorted());
		while (iter.hasNext()) {
			const int iKnot = iter.next();
			if (iKnot > iSegments)
				m_select.deselectKnot(iKnot);
		}
	}

	emit selectionChanged();
}


// Active channel.
void qmotionCurveEdit::setChannel ( int iChannel )
{
	// Fail on bad channel index...
	m_curve.spline(iChannel);

	if (iChannel == m_iChannel)
		return;

	resetDrag();

	m_iChannel = iChannel;
	m_select.deselectAll();

	emit channelChanged(m_iChannel);
	emit selectionChanged();
}


// Active channel working spline.
const qmotionSpline& qmotionCurveEdit::spline (void) const
{
	return m_curve.spline(m_iChannel);
}

void qmotionCurveEdit::setSpline ( const qmotionSpline& spline )
{
	m_curve.setSpline(m_iChannel, spline);
}


// Knot selection.
void qmotionCurveEdit::clickSelect (
	const QList<int>& knots, Qt::KeyboardModifiers modifiers )
{
	m_select.clickSelect(knots, modifiers.testFlag(Qt::ShiftModifier));

	emit selectionChanged();
}

void qmotionCurveEdit::deselectAll (void)
{
	m_select.deselectAll();

	emit selectionChanged();
}


// Drag gestures.
void qmotionCurveEdit::beginKnotDrag ( int iKnot, const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	// Fail on bad knot index...
	spline().knotValue(iKnot);

	clickSelect(QList<int>() << iKnot, modifiers);
	beginDrag(DragKnot, pos, modifiers);
}

void qmotionCurveEdit::beginSegmentDrag ( int iSegment, const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	if (iSegment < 0 || iSegment >= spline().segments())
		throw std::out_of_range("qmotionCurveEdit: segment index out of range");

	clickSelect(QList<int>() << iSegment << iSegment + 1, modifiers);
	beginDrag(DragSegment, pos, modifiers);
}

void qmotionCurveEdit::beginControlPointDrag ( int iSegment, int iPower,
	const QPointF& pos, Qt::KeyboardModifiers modifiers )
{
	// Fail on bad control point index...
	spline().coefficient(iPower, iSegment);
	if (spline().isKnotPower(iPower))
		throw std::out_of_range("qmotionCurveEdit: not a control point");

	beginDrag(DragControlPoint, pos, modifiers);

	m_iDragSegment = iSegment;
	m_iDragPower = iPower;
}

void qmotionCurveEdit::beginSelectDrag ( const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	beginDrag(DragSelect, pos, modifiers);
}


void qmotionCurveEdit::dragMove ( const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	if (m_dragMode == DragNone)
		return;

	applyDrag(snapPoint(m_limits.clip(pos), modifiers), modifiers);
}


bool qmotionCurveEdit::dragEnd ( const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	if (m_dragMode == DragNone)
		return false;

	const QPointF& posEnd = snapPoint(m_limits.clip(pos), modifiers);

	if (m_dragMode == DragSelect) {
		applyDrag(posEnd, modifiers);
		resetDrag();
		return false;
	}

	// Accidental clicks are no edits.
	const bool bChanged
		= (posEnd.x() != m_posStart.x() || posEnd.y() != m_posStart.y());
	if (bChanged)
		applyDrag(posEnd, modifiers);
	else
		m_curve = m_orig;

	const QString& sName = dragName(m_dragMode);

	resetDrag();

	if (bChanged)
		emit curveChanged(m_curve, sName);

	return bChanged;
}


// Gesture helpers.
void qmotionCurveEdit::beginDrag ( DragMode dragMode, const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	// Whatever was left from the previous gesture.
	resetDrag();

	m_dragMode = dragMode;
	m_orig = m_curve;

	if (m_dragMode != DragSelect) {
		m_grid.setSpline(spline());
		// Never snap a knot to itself...
		if (m_dragMode != DragControlPoint) {
			const qmotionSpline& orig = spline();
			QListIterator<int> iter(m_select.sorted());
			while (iter.hasNext())
				m_grid.removeValue(orig.knotValue(iter.next()));
		}
	}

	m_posStart = snapPoint(m_limits.clip(pos), modifiers);

	if (m_dragMode != DragSelect)
		emit curveChanging(m_posStart, false);
}


void qmotionCurveEdit::resetDrag (void)
{
	m_dragMode = DragNone;
	m_grid.clear();
	m_orig = qmotionCurve();

	m_iDragSegment = -1;
	m_iDragPower = -1;
}


QString qmotionCurveEdit::dragName ( DragMode dragMode )
{
	switch (dragMode) {
	case DragKnot:
		return tr("move knot");
	case DragSegment:
		return tr("move segment");
	case DragControlPoint:
		return tr("move control point");
	case DragSelect:
		return tr("select");
	case DragNone:
	default:
		return QString();
	}
}


QPointF qmotionCurveEdit::snapPoint ( const QPointF& pos,
	Qt::KeyboardModifiers modifiers ) const
{
	if (!m_bSnapToGrid || modifiers.testFlag(Qt::ShiftModifier))
		return pos;

	return QPointF(pos.x(), m_grid.snap(pos.y()));
}


void qmotionCurveEdit::applyDrag ( const QPointF& pos,
	Qt::KeyboardModifiers modifiers )
{
	switch (m_dragMode) {
	case DragKnot:
	case DragSegment:
		moveSelectedKnots(pos - m_posStart,
			m_bSnapToGrid && !modifiers.testFlag(Qt::ShiftModifier));
		m_curve.restrictToBBox(m_limits, m_iChannel);
		emit curveChanging(pos, true);
		break;
	case DragControlPoint: {
		const qmotionSpline& orig = m_orig.spline(m_iChannel);
		const double dValue = orig.coefficient(m_iDragPower, m_iDragSegment)
			+ (pos.y() - m_posStart.y());
		qmotionSpline copy(orig);
		copy.positionControlPoint(m_iDragSegment, m_iDragPower, dValue, m_bC1);
		setSpline(copy);
		m_curve.restrictToBBox(m_limits, m_iChannel);
		emit curveChanging(pos, false);
		break;
	}
	case DragSelect:
		m_select.rectSelect(spline().knots(), m_posStart.x(), pos.x());
		emit selectionChanged();
		break;
	case DragNone:
	default:
		break;
	}
}


// Move selected knots by an offset from the original.
void qmotionCurveEdit::moveSelectedKnots ( const QPointF& offset, bool bSnap )
{
	const qmotionSpline& orig = m_orig.spline(m_iChannel);
	qmotionSpline copy(orig);

	QListIterator<int> iter(m_select.sorted());
	while (iter.hasNext()) {
		const int iKnot = iter.next();
		QPointF target = QPointF(orig.knot(iKnot), orig.knotValue(iKnot)) + offset;
		if (bSnap)
			target.setY(m_grid.snap(target.y()));
		copy.positionKnot(iKnot, target, m_bC1, orig);
	}

	// Mirror again, now that all the knot times are final.
	if (m_bC1 && copy.degree() == qmotionSpline::MaxDegree) {
		const int iSegments = copy.segments();
		iter.toFront();
		while (iter.hasNext()) {
			const int iKnot = iter.next();
			if (iKnot > 0 && iKnot < iSegments) {
				copy.positionControlPoint(iKnot, qmotionSpline::FirstCP,
					copy.coefficient(qmotionSpline::FirstCP, iKnot), true);
			}
		}
	}

	setSpline(copy);
}


// Discrete edits.
bool qmotionCurveEdit::insertKnot ( const QPointF& pos )
{
	resetDrag();

	qmotionSpline copy(spline());
	if (!copy.insertKnot(m_limits.clip(pos)))
		return false;

	setSpline(copy);
	m_curve.restrictToBBox(m_limits, m_iChannel);

	// Knot indexes have shifted.
	deselectAll();

	emit curveChanged(m_curve, tr("insert knot"));

	return true;
}


bool qmotionCurveEdit::removeKnot ( int iKnot )
{
	resetDrag();

	qmotionSpline copy(spline());
	if (!copy.removeKnot(iKnot))
		return false;

	setSpline(copy);
	deselectAll();

	emit curveChanged(m_curve, tr("remove knot"));

	return true;
}


bool qmotionCurveEdit::removeSelectedKnots (void)
{
	if (m_select.isEmpty())
		return false;

	resetDrag();

	qmotionSpline copy(spline());

	// At least one segment must remain.
	int iRemoved = 0;
	QListIterator<int> iter(m_select.sorted());
	while (iter.hasNext()) {
		if (!copy.removeKnot(iter.next() - iRemoved))
			break;
		++iRemoved;
	}

	if (iRemoved < 1)
		return false;

	setSpline(copy);
	deselectAll();

	emit curveChanged(m_curve, tr("remove knots"));

	return true;
}


bool qmotionCurveEdit::nudgeSelectedKnots ( const QPointF& offset )
{
	if (m_select.isEmpty())
		return false;

	resetDrag();

	m_orig = m_curve;
	moveSelectedKnots(offset, false);
	m_curve.restrictToBBox(m_limits, m_iChannel);
	m_orig = qmotionCurve();

	emit curveChanged(m_curve, tr("nudge knots"));

	return true;
}


// end of qmotionCurveEdit.cpp
