// qmotionCurve.cpp
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

#include "qmotionCurve.h"

#include <QtGlobal>

#include <stdexcept>


//----------------------------------------------------------------------
// class qmotionCurve -- Multi-channel motion curve.
//

// Zero curve factory.
qmotionCurve qmotionCurve::zeroCurve ( int iChannels )
{
	qmotionCurve curve;

	for (int i = 0; i < iChannels; ++i)
		curve.addSpline(qmotionSpline::zeroSpline());

	return curve;
}


// Channel splines accessors.
const qmotionSpline& qmotionCurve::spline ( int iChannel ) const
{
	checkChannel(iChannel);

	return m_splines.at(iChannel);
}

void qmotionCurve::setSpline ( int iChannel, const qmotionSpline& spline )
{
	checkChannel(iChannel);

	m_splines[iChannel] = spline;
}


// Time domain.
double qmotionCurve::start (void) const
{
	if (m_splines.isEmpty())
		return 0.0;

	double dStart = m_splines.first().start();
	QListIterator<qmotionSpline> iter(m_splines);
	while (iter.hasNext())
		dStart = qMin(dStart, iter.next().start());

	return dStart;
}

double qmotionCurve::end (void) const
{
	if (m_splines.isEmpty())
		return 0.0;

	double dEnd = m_splines.first().end();
	QListIterator<qmotionSpline> iter(m_splines);
	while (iter.hasNext())
		dEnd = qMax(dEnd, iter.next().end());

	return dEnd;
}


// Bounding box over all channels.
qmotionBBox qmotionCurve::bbox (void) const
{
	qmotionBBox bbox;

	QListIterator<qmotionSpline> iter(m_splines);
	while (iter.hasNext())
		bbox.expand(iter.next().bbox());

	return bbox;
}


// Sampled values.
QList<double> qmotionCurve::values ( double t ) const
{
	QList<double> vals;

	QListIterator<qmotionSpline> iter(m_splines);
	while (iter.hasNext())
		vals.append(iter.next().value(t));

	return vals;
}


// Channel-wise transformations.
void qmotionCurve::scale ( double dFactor, int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);
	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].scale(dFactor);
}

void qmotionCurve::stretch ( double dFactor, int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);
	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].stretch(dFactor);
}

void qmotionCurve::shift ( double dOffset, int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);

	// All channels move together, never left of time zero.
	if (iChannel == AllChannels && !isEmpty())
		dOffset = qMax(dOffset, -start());

	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].shift(dOffset);
}

void qmotionCurve::flipHorizontally ( int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);
	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].flipHorizontally();
}

void qmotionCurve::flipVertically ( int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);
	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].flipVertically();
}

void qmotionCurve::restrictToBBox ( const qmotionBBox& bbox, int iChannel )
{
	int iFirst, iLast;
	channelRange(iChannel, iFirst, iLast);
	for (int i = iFirst; i <= iLast; ++i)
		m_splines[i].restrictToBBox(bbox);
}


// Channel range check.
void qmotionCurve::checkChannel ( int iChannel ) const
{
	if (iChannel < 0 || iChannel >= m_splines.count())
		throw std::out_of_range("qmotionCurve: channel index out of range");
}


// Channel iteration bounds.
void qmotionCurve::channelRange ( int iChannel, int& iFirst, int& iLast ) const
{
	if (iChannel == AllChannels) {
		iFirst = 0;
		iLast = m_splines.count() - 1;
	} else {
		checkChannel(iChannel);
		iFirst = iLast = iChannel;
	}
}


// end of qmotionCurve.cpp
