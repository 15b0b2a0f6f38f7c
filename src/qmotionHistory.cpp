// qmotionHistory.cpp
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

#include "qmotionHistory.h"

#include <stdexcept>


//----------------------------------------------------------------------
// class qmotionHistory - implementation.
//

// Constructor.
qmotionHistory::qmotionHistory ( int iMaxLength, QObject *pParent )
	: QObject(pParent), m_iIndex(-1), m_iMaxLength(iMaxLength),
		m_iSerial(0), m_iSavedSerial(0)
{
}

// Destructor.
qmotionHistory::~qmotionHistory (void)
{
	clear();
}


// History stack cleaner.
void qmotionHistory::clear (void)
{
	m_entries.clear();

	m_iIndex = -1;
	m_iSavedSerial = 0;
}


// Maximum length (zero is unlimited).
void qmotionHistory::setMaxLength ( int iMaxLength )
{
	m_iMaxLength = iMaxLength;

	// Drop oldest entries, if over the top...
	while (m_iMaxLength > 0 && m_entries.count() > m_iMaxLength) {
		if (m_iIndex > 0) {
			m_entries.removeFirst();
			--m_iIndex;
		}
		else m_entries.removeLast();
	}
}


// Push a new snapshot.
void qmotionHistory::capture ( const qmotionCurve& curve, const QString& sName )
{
	// Trim the history from current cursor...
	while (m_entries.count() > m_iIndex + 1)
		m_entries.removeLast();

	Entry entry;
	entry.name   = sName;
	entry.curve  = curve;
	entry.serial = ++m_iSerial;

	m_entries.append(entry);
	m_iIndex = m_entries.count() - 1;

	// Oldest entries fall off the bottom.
	if (m_iMaxLength > 0) {
		while (m_entries.count() > m_iMaxLength) {
			m_entries.removeFirst();
			--m_iIndex;
		}
	}

#ifdef CONFIG_DEBUG
	qDebug("qmotionHistory::capture(\"%s\") index=%d count=%d",
		sName.toUtf8().constData(), m_iIndex, m_entries.count());
#endif

	emit updateNotifySignal();
}


// Cursor movement.
bool qmotionHistory::undo (void)
{
	if (!isUndoable())
		return false;

	--m_iIndex;

	emit updateNotifySignal();

	return true;
}

bool qmotionHistory::redo (void)
{
	if (!isRedoable())
		return false;

	++m_iIndex;

	emit updateNotifySignal();

	return true;
}


// Snapshot at the cursor.
const qmotionCurve& qmotionHistory::retrieve (void) const
{
	if (m_iIndex < 0 || m_iIndex >= m_entries.count())
		throw std::out_of_range("qmotionHistory::retrieve: empty history");

	return m_entries.at(m_iIndex).curve;
}


// Status accessors.
bool qmotionHistory::isUndoable (void) const
{
	return (m_iIndex > 0);
}

bool qmotionHistory::isRedoable (void) const
{
	return (m_iIndex < m_entries.count() - 1);
}

bool qmotionHistory::isSavable (void) const
{
	if (m_iIndex < 0)
		return false;

	return (m_entries.at(m_iIndex).serial != m_iSavedSerial);
}


// Mark current snapshot as the last saved one.
void qmotionHistory::setSaved (void)
{
	if (m_iIndex < 0)
		return;

	m_iSavedSerial = m_entries.at(m_iIndex).serial;

	emit updateNotifySignal();
}


// Descriptive entry names.
QString qmotionHistory::undoName (void) const
{
	if (!isUndoable())
		return QString();

	return m_entries.at(m_iIndex).name;
}

QString qmotionHistory::redoName (void) const
{
	if (!isRedoable())
		return QString();

	return m_entries.at(m_iIndex + 1).name;
}


// end of qmotionHistory.cpp
