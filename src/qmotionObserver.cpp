// qmotionObserver.cpp
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

#include "qmotionObserver.h"


//---------------------------------------------------------------------------
// qmotionSubject - Scalar value model.

// Constructor.
qmotionSubject::qmotionSubject ( double dValue )
	: m_dValue(dValue), m_dPrevValue(dValue)
{
}

// Destructor.
qmotionSubject::~qmotionSubject (void)
{
	// Observers must not detach from a dead subject.
	const QList<qmotionObserver *> observers = m_observers;
	m_observers.clear();

	QListIterator<qmotionObserver *> iter(observers);
	while (iter.hasNext())
		iter.next()->setSubject(nullptr);
}


// Direct value accessors.
void qmotionSubject::setValue ( double dValue, qmotionObserver *pSender )
{
	if (dValue == m_dValue)
		return;

	m_dPrevValue = m_dValue;
	m_dValue = dValue;

	notify(pSender, true);
}


// Observer/view updater.
void qmotionSubject::notify ( qmotionObserver *pSender, bool bUpdate )
{
	QListIterator<qmotionObserver *> iter(m_observers);
	while (iter.hasNext()) {
		qmotionObserver *pObserver = iter.next();
		if (pSender && pSender == pObserver)
			continue;
		pObserver->update(bUpdate);
	}
}


// end of qmotionObserver.cpp
