// qmotionDocument.cpp
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
#include "qmotionDocument.h"

#include <QDomDocument>

#include <QObject>
#include <QFile>
#include <QTextStream>
#include <QStringList>

#if QT_VERSION < QT_VERSION_CHECK(5, 14, 0)
namespace Qt {
const QString::SplitBehavior SkipEmptyParts = QString::SkipEmptyParts;
}
#endif


//-------------------------------------------------------------------------
// qmotionDocument -- Document file import/export helper class.
//

// Constructor.
qmotionDocument::qmotionDocument ( QDomDocument *pDocument,
	const QString& sTagName )
	: m_pDocument(pDocument), m_sTagName(sTagName)
{
}

// Default destructor.
qmotionDocument::~qmotionDocument (void)
{
}


//-------------------------------------------------------------------------
// qmotionDocument -- accessors.
//

QDomDocument *qmotionDocument::document (void) const
{
	return m_pDocument;
}

// Document root tag-name.
const QString& qmotionDocument::tagName (void) const
{
	return m_sTagName;
}


// Last load/save error description.
const QString& qmotionDocument::errorString (void) const
{
	return m_sErrorString;
}

void qmotionDocument::setErrorString ( const QString& sErrorString )
{
	m_sErrorString = sErrorString;

#ifdef CONFIG_DEBUG
	qDebug("qmotionDocument: %s", sErrorString.toUtf8().constData());
#endif
}


// Regular text element factory method.
void qmotionDocument::saveTextElement ( const QString& sTagName,
	const QString& sText, QDomElement *pElem )
{
	QDomElement eTag = m_pDocument->createElement(sTagName);
	eTag.appendChild(m_pDocument->createTextNode(sText));
	pElem->appendChild(eTag);
}


//-------------------------------------------------------------------------
// qmotionDocument -- loaders.
//

// External storage simple load method.
bool qmotionDocument::load ( const QString& sFilename )
{
	// Open file...
	QFile file(sFilename);
	if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
		setErrorString(QObject::tr("Could not open \"%1\" for reading: %2")
			.arg(sFilename).arg(file.errorString()));
		return false;
	}

	QTextStream ts(&file);
	const QString sText = ts.readAll();
	file.close();

	return loadDocument(sText);
}


// In-memory load method.
bool qmotionDocument::loadText ( const QString& sText )
{
	return loadDocument(sText);
}


// Parse it a-la-DOM :-)
bool qmotionDocument::loadDocument ( const QString& sText )
{
	QString sError;
	int iLine = 0;
	int iColumn = 0;
	if (!m_pDocument->setContent(sText, &sError, &iLine, &iColumn)) {
		setErrorString(QObject::tr("Parse error at line %1, column %2: %3")
			.arg(iLine).arg(iColumn).arg(sError));
		return false;
	}

	// Get root element and check for proper tag name.
	QDomElement elem = m_pDocument->documentElement();
	if (elem.tagName() != m_sTagName) {
		setErrorString(QObject::tr("Unexpected root element <%1>.")
			.arg(elem.tagName()));
		return false;
	}

	return loadElement(&elem);
}


//-------------------------------------------------------------------------
// qmotionDocument -- savers.
//

// External storage simple save method.
bool qmotionDocument::save ( const QString& sFilename )
{
	if (!saveDocument())
		return false;

	// Finally, we're ready to save to external file.
	QFile file(sFilename);
	if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
		setErrorString(QObject::tr("Could not open \"%1\" for writing: %2")
			.arg(sFilename).arg(file.errorString()));
		return false;
	}

	QTextStream ts(&file);
	ts << m_pDocument->toString() << '\n';
	ts.flush();
	file.close();

	if (file.error() != QFileDevice::NoError) {
		setErrorString(QObject::tr("Could not write \"%1\": %2")
			.arg(sFilename).arg(file.errorString()));
		return false;
	}

	return true;
}


// In-memory save method.
bool qmotionDocument::saveText ( QString& sText )
{
	if (!saveDocument())
		return false;

	sText = m_pDocument->toString();
	return true;
}


// Build the root element.
bool qmotionDocument::saveDocument (void)
{
	// We must have a valid tag name...
	if (m_sTagName.isEmpty()) {
		setErrorString(QObject::tr("Missing document tag name."));
		return false;
	}

	// Start over from a blank document.
	*m_pDocument = QDomDocument(QMOTION_TITLE);

	QDomElement elem = m_pDocument->createElement(m_sTagName);
	elem.setAttribute("version", PROJECT_VERSION);
	if (!saveElement(&elem))
		return false;
	m_pDocument->appendChild(elem);

	return true;
}


//-------------------------------------------------------------------------
// qmotionDocument -- helpers.
//

// Exact (round-trip) number lists.
QString qmotionDocument::textFromValues ( const QList<double>& values )
{
	QStringList list;

	QListIterator<double> iter(values);
	while (iter.hasNext())
		list.append(QString::number(iter.next(), 'g', 17));

	return list.join(' ');
}

bool qmotionDocument::valuesFromText (
	const QString& sText, QList<double>& values )
{
	values.clear();

	const QStringList& list = sText.simplified().split(' ', Qt::SkipEmptyParts);
	QStringListIterator iter(list);
	while (iter.hasNext()) {
		bool bOk = false;
		const double dValue = iter.next().toDouble(&bOk);
		if (!bOk)
			return false;
		values.append(dValue);
	}

	return true;
}


// end of qmotionDocument.cpp
