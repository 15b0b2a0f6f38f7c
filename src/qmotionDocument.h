// qmotionDocument.h
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

#ifndef __qmotionDocument_h
#define __qmotionDocument_h

#include <QString>
#include <QList>

// Forward declartions.
class QDomDocument;
class QDomElement;


//-------------------------------------------------------------------------
// qmotionDocument -- Document file import/export abstract class.
//

class qmotionDocument
{
public:

	// Constructor.
	qmotionDocument(QDomDocument *pDocument,
		const QString& sTagName = QString());
	// Default destructor.
	virtual ~qmotionDocument();

	// Accessors.
	QDomDocument *document() const;
	const QString& tagName() const;

	// Last load/save error description.
	const QString& errorString() const;

	// Regular text element factory method.
	void saveTextElement (const QString& sTagName, const QString& sText,
		QDomElement *pElement);

	// External storage simple methods.
	bool load (const QString& sFilename);
	bool save (const QString& sFilename);

	// In-memory storage methods.
	bool loadText (const QString& sText);
	bool saveText (QString& sText);

	// External storage element pure virtual methods.
	virtual bool loadElement (QDomElement *pElement) = 0;
	virtual bool saveElement (QDomElement *pElement) = 0;

	// Exact (round-trip) number lists.
	static QString textFromValues (const QList<double>& values);
	static bool    valuesFromText (const QString& sText, QList<double>& values);

protected:

	// Error description setter.
	void setErrorString(const QString& sErrorString);

	// Parse and dispatch the root element.
	bool loadDocument(const QString& sText);

	// Build the root element.
	bool saveDocument();

private:

	// Instance variables.
	QDomDocument *m_pDocument;
	QString m_sTagName;

	QString m_sErrorString;
};


#endif  // __qmotionDocument_h

// end of qmotionDocument.h
