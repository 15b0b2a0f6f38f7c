// qmotionSpline.h
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

#ifndef __qmotionSpline_h
#define __qmotionSpline_h

#include "qmotionBBox.h"

#include <QList>


//----------------------------------------------------------------------
// class qmotionSpline -- Piecewise polynomial in Bernstein basis.
//
// Coefficients are indexed [power][segment]: power 0 holds the left
// knot value of each segment, power degree() the right knot value and
// anything in between the intermediate control points.
//

class qmotionSpline
{
public:

	// Coefficient row type (one value per segment).
	typedef QList<double> Row;
	typedef QList<Row> Matrix;

	// Derivative side at a knot.
	enum Side { Left = 0, Right = 1 };

	// Some well known power indexes.
	enum { Knot = 0, FirstCP = 1, SecondCP = 2 };

	// Highest supported degree.
	enum { MaxDegree = 3 };

	// Minimum spacing kept between knots while dragging.
	static const double Epsilon;

	// Constructors (default is the cubic zero spline).
	qmotionSpline();
	qmotionSpline(const QList<double>& knots, const Matrix& coeffs);

	// Zero spline factory.
	static qmotionSpline zeroSpline(int iDegree = 3);

	// Replace contents, if valid.
	bool setData(const QList<double>& knots, const Matrix& coeffs);

	// Shape validation.
	static bool isValidData(const QList<double>& knots, const Matrix& coeffs);

	// Accessors.
	const QList<double>& knots() const { return m_knots; }
	const Matrix& coefficients() const { return m_coeffs; }

	int degree() const { return m_coeffs.count() - 1; }
	int order() const { return m_coeffs.count(); }
	int segments() const { return m_knots.count() - 1; }

	double start() const { return m_knots.first(); }
	double end() const { return m_knots.last(); }
	double duration() const { return end() - start(); }

	// Checked element accessors.
	double knot(int iKnot) const;
	double knotValue(int iKnot) const;
	double coefficient(int iPower, int iSegment) const;

	bool isKnotPower(int iPower) const
		{ return (iPower == Knot || iPower == degree()); }

	// Point location (time, value).
	double timeAt(int iSegment, int iPower) const;
	QPointF point(int iSegment, int iPower = Knot) const;

	// Bounding box of all knots.
	qmotionBBox bbox() const;

	// Coefficient extremes.
	double minValue() const;
	double maxValue() const;

	// Evaluation.
	double value(double t) const;

	// Slope at a knot.
	double derivativeAtKnot(int iKnot, Side side = Right) const;
	void setDerivativeAtKnot(int iKnot, double dSlope, Side side = Right);

	// Constrained repositioning.
	void positionKnot(int iKnot, const QPointF& pos, bool bC1,
		const qmotionSpline& orig);
	void positionControlPoint(int iSegment, int iPower,
		double dValue, bool bC1);

	// Knot insertion/removal.
	bool insertKnot(const QPointF& pos);
	bool removeKnot(int iKnot);

	// Limits enforcement.
	void restrictToBBox(const qmotionBBox& bbox);

	// Transformations.
	void scale(double dFactor);
	void stretch(double dFactor);
	void shift(double dOffset);
	void flipHorizontally();
	void flipVertically();

	// Exact comparison.
	bool operator== (const qmotionSpline& spline) const;
	bool operator!= (const qmotionSpline& spline) const
		{ return !(*this == spline); }

	// Sorted insertion point helpers.
	static int searchSortedLeft(const QList<double>& list, double dValue);
	static int searchSortedRight(const QList<double>& list, double dValue);

protected:

	// Segment duration ratio dt(seg + 1) / dt(seg).
	double ratio(int iSegment) const;

	double segmentDuration(int iSegment) const
		{ return m_knots.at(iSegment + 1) - m_knots.at(iSegment); }

	// Range checks (throw std::out_of_range).
	void checkKnot(int iKnot) const;
	void checkSegment(int iSegment) const;
	void checkPower(int iPower) const;

private:

	// Instance variables.
	QList<double> m_knots;
	Matrix m_coeffs;
};


#endif  // __qmotionSpline_h

// end of qmotionSpline.h
