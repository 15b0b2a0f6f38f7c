// qmotionMessages.cpp
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

#include "qmotionAbout.h"
#include "qmotionMessages.h"

#include <QFile>
#include <QTextStream>
#include <QDateTime>
#include <QTime>


//-------------------------------------------------------------------------
// qmotionMessages - Messages log sink.

// Constructor.
qmotionMessages::qmotionMessages ( QObject *pParent )
	: QObject(pParent), m_iMessagesLimit(1000), m_pMessagesLog(nullptr)
{
}


// Destructor.
qmotionMessages::~qmotionMessages (void)
{
	// No more notifications.
	setLogging(false);
}


// Messages line limit accessors.
void qmotionMessages::setMessagesLimit ( int iMessagesLimit )
{
	m_iMessagesLimit = iMessagesLimit;

	while (m_iMessagesLimit > 0 && m_lines.count() > m_iMessagesLimit)
		m_lines.removeFirst();
}


// Messages logging stuff.
bool qmotionMessages::isLogging (void) const
{
	return (m_pMessagesLog != nullptr);
}

void qmotionMessages::setLogging ( bool bEnabled, const QString& sFilename )
{
	if (m_pMessagesLog) {
		appendMessages(tr("Logging stopped --- %1 ---")
			.arg(QDateTime::currentDateTime().toString()));
		m_pMessagesLog->close();
		delete m_pMessagesLog;
		m_pMessagesLog = nullptr;
	}

	if (bEnabled) {
		m_pMessagesLog = new QFile(sFilename);
		if (m_pMessagesLog->open(QIODevice::Text | QIODevice::Append)) {
			appendMessages(tr("Logging started --- %1 ---")
				.arg(QDateTime::currentDateTime().toString()));
		} else {
			qWarning("qmotionMessages: could not open log file \"%s\".",
				sFilename.toUtf8().constData());
			delete m_pMessagesLog;
			m_pMessagesLog = nullptr;
		}
	}
}


// Messages log output method.
void qmotionMessages::appendMessagesLog ( const QString& s )
{
	if (m_pMessagesLog) {
		QTextStream(m_pMessagesLog) << s << '\n';
		m_pMessagesLog->flush();
	}
}

// Messages retained output method.
void qmotionMessages::appendMessagesLine ( const QString& s )
{
	m_lines.append(s);

	// Check for message line limit...
	while (m_iMessagesLimit > 0 && m_lines.count() > m_iMessagesLimit)
		m_lines.removeFirst();
}


// The main utility methods.
void qmotionMessages::appendMessages ( const QString& s )
{
	const QString sText
		= QTime::currentTime().toString("hh:mm:ss.zzz") + ' ' + s;

	appendMessagesLine(sText);
	appendMessagesLog(sText);

#ifdef CONFIG_DEBUG
	qDebug("%s", sText.toUtf8().constData());
#endif

	emit messageAppended(sText, false);
}

void qmotionMessages::appendMessagesError ( const QString& s )
{
	const QString sText
		= QTime::currentTime().toString("hh:mm:ss.zzz") + ' '
		+ tr("ERROR:") + ' ' + s.simplified();

	appendMessagesLine(sText);
	appendMessagesLog(sText);

	qWarning("%s", sText.toUtf8().constData());

	emit messageAppended(sText, true);
}


// History reset.
void qmotionMessages::clear (void)
{
	m_lines.clear();
}


// end of qmotionMessages.cpp
