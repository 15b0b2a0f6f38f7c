// qmotionPlayback.h
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

#ifndef __qmotionPlayback_h
#define __qmotionPlayback_h

#include "qmotionCurve.h"

#include <QString>


//----------------------------------------------------------------------
// class qmotionPlayback -- Motion back-end playback interface.
//

class qmotionPlayback
{
public:

	// Virtual destructor.
	virtual ~qmotionPlayback() {}

	// Start playing a curve; reports the absolute start time.
	virtual bool play(const qmotionCurve& curve, bool bLoop,
		double dOffset, double *pStartTime) = 0;

	// Stop any playback.
	virtual bool stop() = 0;

	// Last failure description.
	virtual QString errorString() const = 0;
};


//----------------------------------------------------------------------
// class qmotionLivePreview -- Best-effort motor positioning.
//

class qmotionLivePreview
{
public:

	// Virtual destructor.
	virtual ~qmotionLivePreview() {}

	// Fire-and-forget.
	virtual void setPosition(double dValue, int iChannel) = 0;
};


#endif  // __qmotionPlayback_h

// end of qmotionPlayback.h
