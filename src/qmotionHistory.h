// qmotionHistory.h
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

#ifndef __qmotionHistory_h
#define __qmotionHistory_h

#include "qmotionCurve.h"

#include <QObject>
#include <QString>


//----------------------------------------------------------------------
// class qmotionHistory - Linear undo/redo stack of curve snapshots.
//

class qmotionHistory : public QObject
{
	Q_OBJECT

public:

	// Constructor.
	qmotionHistory(int iMaxLength = 0, QObject *pParent = nullptr);

	// Destructor.
	~qmotionHistory();

	// History stack cleaner.
	void clear();

	// Maximum length (zero is unlimited).
	void setMaxLength(int iMaxLength);
	int maxLength() const
		{ return m_iMaxLength; }

	// Push a new snapshot, trimming any redo tail.
	void capture(const qmotionCurve& curve, const QString& sName = QString());

	// Cursor movement.
	bool undo();
	bool redo();

	// Snapshot at the cursor (throws std::out_of_range if empty).
	const qmotionCurve& retrieve() const;

	// Status accessors.
	bool isEmpty() const
		{ return m_entries.isEmpty(); }
	int count() const
		{ return m_entries.count(); }
	int index() const
		{ return m_iIndex; }

	bool isUndoable() const;
	bool isRedoable() const;
	bool isSavable() const;

	// Mark current snapshot as the last saved one.
	void setSaved();

	// Descriptive entry names (for menu actions).
	QString undoName() const;
	QString redoName() const;

signals:

	// History update notification.
	void updateNotifySignal();

private:

	// Snapshot entry.
	struct Entry
	{
		QString      name;
		qmotionCurve curve;
		unsigned int serial;
	};

	// Instance variables.
	QList<Entry> m_entries;

	int m_iIndex;
	int m_iMaxLength;

	unsigned int m_iSerial;
	unsigned int m_iSavedSerial;
};


#endif	// __qmotionHistory_h

// end of qmotionHistory.h
