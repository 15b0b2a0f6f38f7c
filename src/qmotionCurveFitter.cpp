// qmotionCurveFitter.cpp
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

#include "qmotionCurveFitter.h"

#include <cmath>


//----------------------------------------------------------------------
// class qmotionHermiteFitter -- Decimated C1 cubic Hermite fitter.
//

bool qmotionHermiteFitter::fitCurve (
	const qmotionRecorder::Samples& samples, qmotionCurve& curve )
{
	if (samples.count() < 2)
		return false;

	const int iChannels = samples.first().values.count();
	if (iChannels < 1)
		return false;

	// Decimate to the minimum knot spacing, always keeping the last one.
	qmotionRecorder::Samples knots;
	const int iSamples = samples.count();
	for (int i = 0; i < iSamples; ++i) {
		const qmotionRecorder::Sample& sample = samples.at(i);
		if (sample.values.count() != iChannels)
			return false;
		if (!std::isfinite(sample.time))
			continue;
		if (knots.isEmpty()) {
			knots.append(sample);
			continue;
		}
		const double dt = sample.time - knots.last().time;
		if (dt <= 0.0)
			continue;
		if (dt >= m_dMinSpacing)
			knots.append(sample);
		else
		if (i == iSamples - 1) {
			// Replace the short tail, unless it is the very first.
			if (knots.count() > 1)
				knots.last() = sample;
			else
				knots.append(sample);
		}
	}

	const int iKnots = knots.count();
	if (iKnots < 2)
		return false;

	QList<double> xs;
	for (int i = 0; i < iKnots; ++i)
		xs.append(knots.at(i).time);

	qmotionCurve result;

	for (int iChannel = 0; iChannel < iChannels; ++iChannel) {
		// Finite difference slopes.
		QList<double> slopes;
		for (int i = 0; i < iKnots; ++i) {
			const int i0 = (i > 0 ? i - 1 : i);
			const int i1 = (i < iKnots - 1 ? i + 1 : i);
			slopes.append(
				(knots.at(i1).values.at(iChannel) - knots.at(i0).values.at(iChannel))
				/ (xs.at(i1) - xs.at(i0)));
		}
		// Hermite to Bernstein coefficients.
		qmotionSpline::Matrix coeffs;
		for (int k = 0; k < 4; ++k)
			coeffs.append(qmotionSpline::Row());
		for (int i = 0; i < iKnots - 1; ++i) {
			const double dt = xs.at(i + 1) - xs.at(i);
			const double y0 = knots.at(i).values.at(iChannel);
			const double y1 = knots.at(i + 1).values.at(iChannel);
			coeffs[0].append(y0);
			coeffs[1].append(y0 + slopes.at(i) * dt / 3.0);
			coeffs[2].append(y1 - slopes.at(i + 1) * dt / 3.0);
			coeffs[3].append(y1);
		}
		qmotionSpline spline;
		if (!spline.setData(xs, coeffs))
			return false;
		result.addSpline(spline);
	}

	curve = result;

	return true;
}


// end of qmotionCurveFitter.cpp
