// qmotionCurveFitter.h
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

#ifndef __qmotionCurveFitter_h
#define __qmotionCurveFitter_h

#include "qmotionRecorder.h"
#include "qmotionCurve.h"


//----------------------------------------------------------------------
// class qmotionCurveFitter -- Recorded trajectory to curve interface.
//

class qmotionCurveFitter
{
public:

	// Virtual destructor.
	virtual ~qmotionCurveFitter() {}

	// Fit a curve through the recorded samples.
	virtual bool fitCurve(const qmotionRecorder::Samples& samples,
		qmotionCurve& curve) = 0;
};


//----------------------------------------------------------------------
// class qmotionHermiteFitter -- Decimated C1 cubic Hermite fitter.
//

class qmotionHermiteFitter : public qmotionCurveFitter
{
public:

	// Constructor.
	qmotionHermiteFitter(double dMinSpacing = 0.1)
		: m_dMinSpacing(dMinSpacing) {}

	// Minimum knot spacing (decimation).
	void setMinSpacing(double dMinSpacing)
		{ m_dMinSpacing = dMinSpacing; }
	double minSpacing() const
		{ return m_dMinSpacing; }

	// Fit a curve through the recorded samples.
	bool fitCurve(const qmotionRecorder::Samples& samples,
		qmotionCurve& curve) override;

private:

	// Instance variables.
	double m_dMinSpacing;
};


#endif  // __qmotionCurveFitter_h

// end of qmotionCurveFitter.h
