// qmotionRecorder.h
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

#ifndef __qmotionRecorder_h
#define __qmotionRecorder_h

#include <QList>


//----------------------------------------------------------------------
// class qmotionRecorder -- Append-only recorded trajectory.
//

class qmotionRecorder
{
public:

	// Recorded sample.
	struct Sample
	{
		double time;
		QList<double> values;
	};

	typedef QList<Sample> Samples;

	// Constructor.
	qmotionRecorder() {}

	// Recording buffer methods.
	void clear()
		{ m_samples.clear(); }

	void append(double dTime, const QList<double>& values)
	{
		Sample sample;
		sample.time = dTime;
		sample.values = values;
		m_samples.append(sample);
	}

	// Accessors.
	const Samples& samples() const
		{ return m_samples; }
	int count() const
		{ return m_samples.count(); }
	bool isEmpty() const
		{ return m_samples.isEmpty(); }

private:

	// Instance variables.
	Samples m_samples;
};


#endif  // __qmotionRecorder_h

// end of qmotionRecorder.h
