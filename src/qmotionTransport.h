// qmotionTransport.h
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

#ifndef __qmotionTransport_h
#define __qmotionTransport_h

#include "qmotionObserver.h"


//----------------------------------------------------------------------
// class qmotionTransport -- Playback/record transport state machine.
//

class qmotionTransport
{
public:

	// Transport states.
	enum State { Paused = 0, Playing, Recording };

	// Constructor.
	qmotionTransport();

	// State accessors.
	State state() const { return m_state; }

	bool isPaused() const    { return (m_state == Paused); }
	bool isPlaying() const   { return (m_state == Playing); }
	bool isRecording() const { return (m_state == Recording); }

	// Cursor position (observable).
	void setPosition(double dPosition)
		{ m_position.setValue(dPosition); }
	double position() const
		{ return m_position.value(); }

	qmotionSubject *positionSubject()
		{ return &m_position; }

	// Playback duration.
	void setDuration(double dDuration)
		{ m_dDuration = dDuration; }
	double duration() const
		{ return m_dDuration; }

	// Loop mode.
	void setLooping(bool bLooping)
		{ m_bLooping = bLooping; }
	bool isLooping() const
		{ return m_bLooping; }
	void toggleLooping()
		{ m_bLooping = !m_bLooping; }

	// Absolute position origin.
	void setStartTime(double dStartTime)
		{ m_dStartTime = dStartTime; }
	double startTime() const
		{ return m_dStartTime; }

	// Most recent timestamp seen by move().
	double latestTimestamp() const
		{ return m_dLatestTimestamp; }

	// State transitions (illegal ones are ignored).
	bool play();
	bool pause();
	bool record();
	void stop();

	// Timestamp update; returns the (looped) position.
	double move(double dTimestamp);

	// State names.
	static const char *stateName(State state);

protected:

	// Legal transitions only.
	bool changeState(State state);

private:

	// Instance variables.
	State  m_state;

	qmotionSubject m_position;

	double m_dDuration;
	bool   m_bLooping;
	double m_dStartTime;
	double m_dLatestTimestamp;
};


#endif  // __qmotionTransport_h

// end of qmotionTransport.h
