// qmotionSpline.cpp
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

#include "qmotionSpline.h"

#include <QtGlobal>

#include <stdexcept>

#include <cmath>


// Minimum spacing kept between knots while dragging.
const double qmotionSpline::Epsilon = 1e-3;


// de Casteljau subdivision of a single segment column, at u in [0, 1].
static void split_column ( const QList<double>& col, double u,
	QList<double>& left, QList<double>& right )
{
	QList<double> work(col);
	const int n = work.count();

	left.clear();
	right.clear();

	left.append(work.first());
	right.prepend(work.last());

	for (int k = 1; k < n; ++k) {
		for (int i = 0; i < n - k; ++i)
			work[i] = (1.0 - u) * work.at(i) + u * work.at(i + 1);
		left.append(work.first());
		right.prepend(work.at(n - k - 1));
	}
}


// de Casteljau evaluation of a single segment column.
static double eval_column ( const QList<double>& col, double u )
{
	QList<double> work(col);
	const int n = work.count();

	for (int k = 1; k < n; ++k) {
		for (int i = 0; i < n - k; ++i)
			work[i] = (1.0 - u) * work.at(i) + u * work.at(i + 1);
	}

	return work.first();
}


//----------------------------------------------------------------------
// class qmotionSpline -- Piecewise polynomial in Bernstein basis.
//

// Constructors.
qmotionSpline::qmotionSpline (void)
{
	*this = zeroSpline();
}

qmotionSpline::qmotionSpline (
	const QList<double>& knots, const Matrix& coeffs )
{
	if (!setData(knots, coeffs))
		throw std::invalid_argument("qmotionSpline: malformed knots/coefficients");
}


// Zero spline factory: single segment over [0, 1].
qmotionSpline qmotionSpline::zeroSpline ( int iDegree )
{
	if (iDegree < 1 || iDegree > MaxDegree)
		throw std::out_of_range("qmotionSpline::zeroSpline: unsupported degree");

	QList<double> knots;
	knots << 0.0 << 1.0;

	Matrix coeffs;
	for (int i = 0; i <= iDegree; ++i)
		coeffs.append(Row() << 0.0);

	return qmotionSpline(knots, coeffs);
}


// Replace contents, if valid.
bool qmotionSpline::setData (
	const QList<double>& knots, const Matrix& coeffs )
{
	if (!isValidData(knots, coeffs))
		return false;

	m_knots  = knots;
	m_coeffs = coeffs;

	return true;
}


// Shape validation.
bool qmotionSpline::isValidData (
	const QList<double>& knots, const Matrix& coeffs )
{
	const int iSegments = knots.count() - 1;
	if (iSegments < 1)
		return false;

	const int iOrder = coeffs.count();
	if (iOrder < 2 || iOrder > MaxDegree + 1)
		return false;

	for (int i = 0; i <= iSegments; ++i) {
		if (!std::isfinite(knots.at(i)))
			return false;
		if (i > 0 && knots.at(i) <= knots.at(i - 1))
			return false;
	}

	QListIterator<Row> iter(coeffs);
	while (iter.hasNext()) {
		const Row& row = iter.next();
		if (row.count() != iSegments)
			return false;
		QListIterator<double> val(row);
		while (val.hasNext()) {
			if (!std::isfinite(val.next()))
				return false;
		}
	}

	return true;
}


// Checked element accessors.
double qmotionSpline::knot ( int iKnot ) const
{
	checkKnot(iKnot);

	return m_knots.at(iKnot);
}

double qmotionSpline::knotValue ( int iKnot ) const
{
	checkKnot(iKnot);

	if (iKnot == segments())
		return m_coeffs.last().last();
	else
		return m_coeffs.at(Knot).at(iKnot);
}

double qmotionSpline::coefficient ( int iPower, int iSegment ) const
{
	checkPower(iPower);
	checkSegment(iSegment);

	return m_coeffs.at(iPower).at(iSegment);
}


// Point location.
double qmotionSpline::timeAt ( int iSegment, int iPower ) const
{
	if (iSegment == segments())
		return end();

	checkSegment(iSegment);
	checkPower(iPower);

	const double alpha = double(iPower) / double(degree());
	return (1.0 - alpha) * m_knots.at(iSegment)
		+ alpha * m_knots.at(iSegment + 1);
}

QPointF qmotionSpline::point ( int iSegment, int iPower ) const
{
	if (iSegment == segments())
		return QPointF(end(), m_coeffs.last().last());

	return QPointF(timeAt(iSegment, iPower), coefficient(iPower, iSegment));
}


// Bounding box of all knots.
qmotionBBox qmotionSpline::bbox (void) const
{
	qmotionBBox bbox;

	const int iSegments = segments();
	for (int iKnot = 0; iKnot <= iSegments; ++iKnot)
		bbox.expand(QPointF(m_knots.at(iKnot), knotValue(iKnot)));

	return bbox;
}


// Coefficient extremes.
double qmotionSpline::minValue (void) const
{
	double dMin = qmotionBBox::infinity();

	QListIterator<Row> iter(m_coeffs);
	while (iter.hasNext()) {
		QListIterator<double> val(iter.next());
		while (val.hasNext())
			dMin = qMin(dMin, val.next());
	}

	return dMin;
}

double qmotionSpline::maxValue (void) const
{
	double dMax = -qmotionBBox::infinity();

	QListIterator<Row> iter(m_coeffs);
	while (iter.hasNext()) {
		QListIterator<double> val(iter.next());
		while (val.hasNext())
			dMax = qMax(dMax, val.next());
	}

	return dMax;
}


// Evaluation (held to the spline domain).
double qmotionSpline::value ( double t ) const
{
	const int iSegments = segments();

	int iSegment = searchSortedRight(m_knots, t) - 1;
	if (iSegment < 0)
		iSegment = 0;
	else
	if (iSegment > iSegments - 1)
		iSegment = iSegments - 1;

	const double dt = segmentDuration(iSegment);
	double u = (dt > 0.0 ? (t - m_knots.at(iSegment)) / dt : 0.0);
	if (u < 0.0)
		u = 0.0;
	else
	if (u > 1.0)
		u = 1.0;

	QList<double> col;
	QListIterator<Row> iter(m_coeffs);
	while (iter.hasNext())
		col.append(iter.next().at(iSegment));

	return eval_column(col, u);
}


// Slope at a knot.
double qmotionSpline::derivativeAtKnot ( int iKnot, Side side ) const
{
	const int iDegree = degree();

	if (side == Right) {
		checkSegment(iKnot);
		const double dt = segmentDuration(iKnot);
		if (dt == 0.0)
			return 0.0;
		return iDegree * (m_coeffs.at(FirstCP).at(iKnot)
			- m_coeffs.at(Knot).at(iKnot)) / dt;
	} else {
		checkSegment(iKnot - 1);
		const int iSegment = iKnot - 1;
		const double dt = segmentDuration(iSegment);
		if (dt == 0.0)
			return 0.0;
		return iDegree * (m_coeffs.at(iDegree).at(iSegment)
			- m_coeffs.at(iDegree - 1).at(iSegment)) / dt;
	}
}

void qmotionSpline::setDerivativeAtKnot (
	int iKnot, double dSlope, Side side )
{
	const int iDegree = degree();

	if (side == Right) {
		checkSegment(iKnot);
		m_coeffs[FirstCP][iKnot] = m_coeffs.at(Knot).at(iKnot)
			+ segmentDuration(iKnot) * dSlope / iDegree;
	} else {
		checkSegment(iKnot - 1);
		const int iSegment = iKnot - 1;
		m_coeffs[iDegree - 1][iSegment] = m_coeffs.at(iDegree).at(iSegment)
			- segmentDuration(iSegment) * dSlope / iDegree;
	}
}


// Knot repositioning, as a delta from the original.
void qmotionSpline::positionKnot ( int iKnot, const QPointF& pos,
	bool bC1, const qmotionSpline& orig )
{
	checkKnot(iKnot);
	orig.checkKnot(iKnot);

	const int iSegments = segments();
	const int iDegree = degree();

	// Stay strictly in between the neighbour knots...
	double xmin = 0.0;
	double xmax = qmotionBBox::infinity();
	if (iKnot > 0)
		xmin = orig.m_knots.at(iKnot - 1) + Epsilon;
	if (iKnot < iSegments)
		xmax = orig.m_knots.at(iKnot + 1) - Epsilon;

	double x = pos.x();
	if (x > xmax)
		x = xmax;
	if (x < xmin)
		x = xmin;
	m_knots[iKnot] = x;

	// Knots are always position continuous.
	const double dy = pos.y() - orig.knotValue(iKnot);
	if (iKnot > 0) {
		m_coeffs[iDegree][iKnot - 1]
			= orig.m_coeffs.at(iDegree).at(iKnot - 1) + dy;
	}
	if (iKnot < iSegments) {
		m_coeffs[Knot][iKnot]
			= orig.m_coeffs.at(Knot).at(iKnot) + dy;
	}

	// Linear splines have no control points to carry along.
	if (iDegree < 2)
		return;

	if (iKnot == iSegments) {
		m_coeffs[iDegree - 1][iKnot - 1]
			= orig.m_coeffs.at(iDegree - 1).at(iKnot - 1) + dy;
	}
	else
	if (bC1 && iDegree == MaxDegree) {
		positionControlPoint(iKnot, FirstCP,
			orig.m_coeffs.at(FirstCP).at(iKnot) + dy, true);
	} else {
		m_coeffs[FirstCP][iKnot]
			= orig.m_coeffs.at(FirstCP).at(iKnot) + dy;
		if (iKnot > 0) {
			m_coeffs[iDegree - 1][iKnot - 1]
				= orig.m_coeffs.at(iDegree - 1).at(iKnot - 1) + dy;
		}
	}
}


// Control point repositioning (vertical only).
void qmotionSpline::positionControlPoint (
	int iSegment, int iPower, double dValue, bool bC1 )
{
	checkSegment(iSegment);
	checkPower(iPower);

	if (isKnotPower(iPower))
		throw std::out_of_range("qmotionSpline::positionControlPoint: not a control point");

	m_coeffs[iPower][iSegment] = dValue;

	// Mirror across the knot, only for cubics.
	const int iDegree = degree();
	if (!bC1 || iDegree != MaxDegree)
		return;

	if (iPower == FirstCP) {
		// Left-most control point?
		if (iSegment == 0)
			return;
		const double y = m_coeffs.at(Knot).at(iSegment);
		const double dy = dValue - y;
		m_coeffs[SecondCP][iSegment - 1] = y - dy / ratio(iSegment - 1);
	} else {
		// Right-most control point?
		if (iSegment == segments() - 1)
			return;
		const double y = m_coeffs.at(iDegree).at(iSegment);
		const double dy = dValue - y;
		m_coeffs[FirstCP][iSegment + 1] = y - ratio(iSegment) * dy;
	}
}


// Knot insertion.
bool qmotionSpline::insertKnot ( const QPointF& pos )
{
	const double x = pos.x();
	const double y = pos.y();

	if (!std::isfinite(x) || !std::isfinite(y))
		return false;

	const int iIndex = searchSortedRight(m_knots, x);

	// Refuse duplicate knot times.
	if (iIndex > 0 && m_knots.at(iIndex - 1) == x) {
	#ifdef CONFIG_DEBUG
		qDebug("qmotionSpline::insertKnot(%g) duplicate knot time.", x);
	#endif
		return false;
	}

	const int iDegree = degree();
	const int iSegments = segments();

	if (iIndex == 0) {
		// Before the first segment: straight line into the first knot.
		const double y1 = m_coeffs.at(Knot).first();
		for (int i = 0; i <= iDegree; ++i) {
			const double alpha = double(i) / double(iDegree);
			m_coeffs[i].prepend((1.0 - alpha) * y + alpha * y1);
		}
		m_knots.prepend(x);
	}
	else
	if (iIndex > iSegments) {
		// After the last segment: straight line out of the last knot.
		const double y0 = m_coeffs.last().last();
		for (int i = 0; i <= iDegree; ++i) {
			const double alpha = double(i) / double(iDegree);
			m_coeffs[i].append((1.0 - alpha) * y0 + alpha * y);
		}
		m_knots.append(x);
	}
	else {
		// Split the hosting segment, then lift the new knot.
		const int iSegment = iIndex - 1;
		const double u = (x - m_knots.at(iSegment)) / segmentDuration(iSegment);

		QList<double> col;
		for (int i = 0; i <= iDegree; ++i)
			col.append(m_coeffs.at(i).at(iSegment));

		QList<double> left, right;
		split_column(col, u, left, right);

		const double dy = y - left.last();
		left[iDegree] += dy;
		right[Knot] += dy;
		if (iDegree > 1) {
			left[iDegree - 1] += dy;
			right[FirstCP] += dy;
		}

		for (int i = 0; i <= iDegree; ++i) {
			m_coeffs[i][iSegment] = left.at(i);
			m_coeffs[i].insert(iSegment + 1, right.at(i));
		}
		m_knots.insert(iIndex, x);
	}

	return true;
}


// Knot removal.
bool qmotionSpline::removeKnot ( int iKnot )
{
	checkKnot(iKnot);

	const int iSegments = segments();
	if (iSegments < 2) {
	#ifdef CONFIG_DEBUG
		qDebug("qmotionSpline::removeKnot(%d) last segment.", iKnot);
	#endif
		return false;
	}

	const int iOrder = order();

	if (iKnot == iSegments) {
		m_knots.removeLast();
		for (int i = 0; i < iOrder; ++i)
			m_coeffs[i].removeLast();
		return true;
	}

	// Left segment takes over the right half of the removed one.
	const int iSegment = iKnot;
	if (iSegment > 0) {
		for (int i = iOrder / 2; i < iOrder; ++i)
			m_coeffs[i][iSegment - 1] = m_coeffs.at(i).at(iSegment);
	}

	m_knots.removeAt(iKnot);
	for (int i = 0; i < iOrder; ++i)
		m_coeffs[i].removeAt(iSegment);

	return true;
}


// Limits enforcement.
void qmotionSpline::restrictToBBox ( const qmotionBBox& bbox )
{
	// Move the knots as a whole, so they stay strictly increasing.
	const double dLeft = bbox.left();
	const double dRight = bbox.right();

	double dOffset = 0.0;
	if (start() < dLeft)
		dOffset = dLeft - start();
	else
	if (end() > dRight)
		dOffset = qMax(dRight - end(), dLeft - start());
	if (!std::isfinite(dOffset))
		dOffset = 0.0;

	const int iKnots = m_knots.count();
	for (int i = 0; i < iKnots; ++i)
		m_knots[i] += dOffset;

	// Still too long, squeeze it in.
	if (end() > dRight && dRight > dLeft) {
		const double dFactor = (dRight - dLeft) / (end() - dLeft);
		for (int i = 0; i < iKnots; ++i)
			m_knots[i] = dLeft + (m_knots.at(i) - dLeft) * dFactor;
	}

	const int iOrder = order();
	const int iSegments = segments();
	for (int i = 0; i < iOrder; ++i) {
		Row& row = m_coeffs[i];
		for (int j = 0; j < iSegments; ++j)
			row[j] = bbox.clipY(row.at(j));
	}
}


// Transformations.
void qmotionSpline::scale ( double dFactor )
{
	const int iOrder = order();
	const int iSegments = segments();
	for (int i = 0; i < iOrder; ++i) {
		Row& row = m_coeffs[i];
		for (int j = 0; j < iSegments; ++j)
			row[j] *= dFactor;
	}
}

void qmotionSpline::stretch ( double dFactor )
{
	// Knot times must stay strictly increasing.
	if (dFactor <= 0.0)
		return;

	const int iKnots = m_knots.count();
	for (int i = 0; i < iKnots; ++i)
		m_knots[i] *= dFactor;
}

void qmotionSpline::shift ( double dOffset )
{
	// Never left of time zero.
	dOffset = qMax(dOffset, -start());

	const int iKnots = m_knots.count();
	for (int i = 0; i < iKnots; ++i)
		m_knots[i] += dOffset;
}

void qmotionSpline::flipHorizontally (void)
{
	const int iSegments = segments();

	QList<double> knots;
	knots.append(m_knots.first());
	for (int i = iSegments - 1; i >= 0; --i)
		knots.append(knots.last() + segmentDuration(i));
	m_knots = knots;

	Matrix coeffs;
	QListIterator<Row> iter(m_coeffs);
	while (iter.hasNext()) {
		const Row& row = iter.next();
		Row rev;
		for (int j = iSegments - 1; j >= 0; --j)
			rev.append(row.at(j));
		coeffs.prepend(rev);
	}
	m_coeffs = coeffs;
}

void qmotionSpline::flipVertically (void)
{
	const double dMax = maxValue();

	const int iOrder = order();
	const int iSegments = segments();
	for (int i = 0; i < iOrder; ++i) {
		Row& row = m_coeffs[i];
		for (int j = 0; j < iSegments; ++j)
			row[j] = dMax - row.at(j);
	}
}


// Exact comparison.
bool qmotionSpline::operator== ( const qmotionSpline& spline ) const
{
	return (m_knots == spline.m_knots && m_coeffs == spline.m_coeffs);
}


// Sorted insertion point helpers.
int qmotionSpline::searchSortedLeft (
	const QList<double>& list, double dValue )
{
	int iLeft = 0;
	int iRight = list.count();
	while (iLeft < iRight) {
		const int iMid = (iLeft + iRight) >> 1;
		if (list.at(iMid) < dValue)
			iLeft = iMid + 1;
		else
			iRight = iMid;
	}

	return iLeft;
}

int qmotionSpline::searchSortedRight (
	const QList<double>& list, double dValue )
{
	int iLeft = 0;
	int iRight = list.count();
	while (iLeft < iRight) {
		const int iMid = (iLeft + iRight) >> 1;
		if (list.at(iMid) <= dValue)
			iLeft = iMid + 1;
		else
			iRight = iMid;
	}

	return iRight;
}


// Segment duration ratio.
double qmotionSpline::ratio ( int iSegment ) const
{
	const double dt = segmentDuration(iSegment);
	if (dt == 0.0)
		return 1.0;

	return segmentDuration(iSegment + 1) / dt;
}


// Range checks.
void qmotionSpline::checkKnot ( int iKnot ) const
{
	if (iKnot < 0 || iKnot > segments())
		throw std::out_of_range("qmotionSpline: knot index out of range");
}

void qmotionSpline::checkSegment ( int iSegment ) const
{
	if (iSegment < 0 || iSegment >= segments())
		throw std::out_of_range("qmotionSpline: segment index out of range");
}

void qmotionSpline::checkPower ( int iPower ) const
{
	if (iPower < 0 || iPower > degree())
		throw std::out_of_range("qmotionSpline: power index out of range");
}


// end of qmotionSpline.cpp
