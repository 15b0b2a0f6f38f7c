// qmotionMessages.h
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

#ifndef __qmotionMessages_h
#define __qmotionMessages_h

#include <QObject>
#include <QStringList>

// Forward declarations.
class QFile;


//-------------------------------------------------------------------------
// qmotionMessages - Messages log sink.

class qmotionMessages : public QObject
{
	Q_OBJECT

public:

	// Constructor.
	qmotionMessages(QObject *pParent = nullptr);
	// Destructor.
	~qmotionMessages();

	// Messages line limit accessors.
	void setMessagesLimit(int iMessagesLimit);
	int messagesLimit() const
		{ return m_iMessagesLimit; }

	// Logging settings.
	bool isLogging() const;
	void setLogging(bool bEnabled, const QString& sFilename = QString());

	// The main utility methods.
	void appendMessages(const QString& s);
	void appendMessagesError(const QString& s);

	// Retained lines.
	const QStringList& lines() const
		{ return m_lines; }

	// History reset.
	void clear();

signals:

	// New message line notification.
	void messageAppended(const QString& sText, bool bError);

protected:

	// Output methods.
	void appendMessagesLine(const QString& s);
	void appendMessagesLog(const QString& s);

private:

	// Instance variables.
	QStringList m_lines;
	int m_iMessagesLimit;

	// Logging stuff.
	QFile *m_pMessagesLog;
};


#endif  // __qmotionMessages_h


// end of qmotionMessages.h
