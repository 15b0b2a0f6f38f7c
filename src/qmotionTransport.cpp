// qmotionTransport.cpp
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

#include "qmotionTransport.h"

#include <QtGlobal>

#include <cmath>
#include <limits>


//----------------------------------------------------------------------
// class qmotionTransport -- Playback/record transport state machine.
//

// Constructor.
qmotionTransport::qmotionTransport (void)
	: m_state(Paused), m_position(0.0), m_dDuration(1.0),
		m_bLooping(true), m_dStartTime(0.0), m_dLatestTimestamp(0.0)
{
	m_position.setName("Position");
}


// State transitions.
bool qmotionTransport::play (void)
{
	return changeState(Playing);
}

bool qmotionTransport::pause (void)
{
	return changeState(Paused);
}

bool qmotionTransport::record (void)
{
	if (m_state != Paused)
		return false;

	// Recording has no a priori end.
	m_dStartTime = m_dLatestTimestamp;
	m_dDuration = std::numeric_limits<double>::infinity();

	return changeState(Recording);
}

void qmotionTransport::stop (void)
{
	m_state = Paused;

	setPosition(0.0);
}


// Timestamp update.
double qmotionTransport::move ( double dTimestamp )
{
	m_dLatestTimestamp = dTimestamp;

	double dPosition = dTimestamp - m_dStartTime;
	if (m_bLooping && std::isfinite(m_dDuration) && m_dDuration > 0.0) {
		dPosition = std::fmod(dPosition, m_dDuration);
		if (dPosition < 0.0)
			dPosition += m_dDuration;
	}

	if (m_state != Paused)
		setPosition(dPosition);

	return dPosition;
}


// Legal transitions only.
bool qmotionTransport::changeState ( State state )
{
	const bool bLegal
		= (m_state == Paused && (state == Playing || state == Recording))
		|| (m_state == Playing && state == Paused)
		|| (m_state == Recording && state == Paused);

	if (!bLegal)
		return false;

#ifdef CONFIG_DEBUG
	qDebug("qmotionTransport::changeState(%s -> %s)",
		stateName(m_state), stateName(state));
#endif

	m_state = state;

	return true;
}


// State names.
const char *qmotionTransport::stateName ( State state )
{
	switch (state) {
	case Playing:
		return "PLAYING";
	case Recording:
		return "RECORDING";
	case Paused:
	default:
		return "PAUSED";
	}
}


// end of qmotionTransport.cpp
