// qmotionCurve.h
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

#ifndef __qmotionCurve_h
#define __qmotionCurve_h

#include "qmotionSpline.h"

#include <QList>


//----------------------------------------------------------------------
// class qmotionCurve -- Multi-channel motion curve (value type).
//

class qmotionCurve
{
public:

	// Channel wildcard for curve wide operations.
	enum { AllChannels = -1 };

	// Constructors.
	qmotionCurve() {}
	qmotionCurve(const QList<qmotionSpline>& splines)
		: m_splines(splines) {}

	// Zero curve factory.
	static qmotionCurve zeroCurve(int iChannels = 1);

	// Channel splines accessors.
	const QList<qmotionSpline>& splines() const
		{ return m_splines; }

	const qmotionSpline& spline(int iChannel) const;
	void setSpline(int iChannel, const qmotionSpline& spline);
	void addSpline(const qmotionSpline& spline)
		{ m_splines.append(spline); }

	int channels() const { return m_splines.count(); }
	bool isEmpty() const { return m_splines.isEmpty(); }

	// Time domain.
	double start() const;
	double end() const;
	double duration() const { return end(); }

	// Bounding box over all channels.
	qmotionBBox bbox() const;

	// Sampled values (one per channel).
	QList<double> values(double t) const;

	// Channel-wise (or curve-wide) transformations.
	void scale(double dFactor, int iChannel = AllChannels);
	void stretch(double dFactor, int iChannel = AllChannels);
	void shift(double dOffset, int iChannel = AllChannels);
	void flipHorizontally(int iChannel = AllChannels);
	void flipVertically(int iChannel = AllChannels);
	void restrictToBBox(const qmotionBBox& bbox, int iChannel = AllChannels);

	// Exact comparison.
	bool operator== (const qmotionCurve& curve) const
		{ return m_splines == curve.m_splines; }
	bool operator!= (const qmotionCurve& curve) const
		{ return m_splines != curve.m_splines; }

protected:

	// Channel range check (throws std::out_of_range).
	void checkChannel(int iChannel) const;

	// Channel iteration bounds.
	void channelRange(int iChannel, int& iFirst, int& iLast) const;

private:

	// Instance variables.
	QList<qmotionSpline> m_splines;
};


#endif  // __qmotionCurve_h

// end of qmotionCurve.h
