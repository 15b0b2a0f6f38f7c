// qmotionCurveStore.cpp
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

#include "qmotionCurveStore.h"
#include "qmotionCurveDocument.h"

#include <QDomDocument>
#include <QFileInfo>
#include <QObject>
#include <QDir>


//----------------------------------------------------------------------
// class qmotionCurveFileStore -- One XML document per curve name.
//

// Constructor.
qmotionCurveFileStore::qmotionCurveFileStore ( const QString& sBaseDir )
	: m_sBaseDir(sBaseDir)
{
	if (m_sBaseDir.isEmpty())
		m_sBaseDir = QDir::currentPath();
}


// Curve file extension (suffix).
const QString& qmotionCurveFileStore::defaultExt (void)
{
	static const QString s_sDefaultExt("qmc");

	return s_sDefaultExt;
}


// Curve name to file path.
QString qmotionCurveFileStore::filePath ( const QString& sName ) const
{
	QString sFilename = sName;
	if (QFileInfo(sFilename).suffix().isEmpty())
		sFilename += '.' + defaultExt();

	return QDir(m_sBaseDir).absoluteFilePath(sFilename);
}


// Available curve names.
QStringList qmotionCurveFileStore::curveNames (void) const
{
	QStringList names;

	const QDir dir(m_sBaseDir);
	const QStringList& files = dir.entryList(
		QStringList() << "*." + defaultExt(), QDir::Files, QDir::Name);
	QStringListIterator iter(files);
	while (iter.hasNext())
		names.append(QFileInfo(iter.next()).completeBaseName());

	return names;
}


// Persistence methods.
bool qmotionCurveFileStore::saveCurve (
	const QString& sName, const qmotionCurve& curve )
{
	m_sErrorString.clear();

	if (sName.isEmpty()) {
		m_sErrorString = QObject::tr("Empty curve name.");
		return false;
	}

	const QDir dir(m_sBaseDir);
	if (!dir.exists() && !dir.mkpath(".")) {
		m_sErrorString = QObject::tr("Could not create directory \"%1\".")
			.arg(m_sBaseDir);
		return false;
	}

	QDomDocument doc;
	qmotionCurve copy(curve);
	qmotionCurveDocument document(&doc, &copy);
	if (!document.save(filePath(sName))) {
		m_sErrorString = document.errorString();
		return false;
	}

	return true;
}


bool qmotionCurveFileStore::loadCurve (
	const QString& sName, qmotionCurve& curve )
{
	m_sErrorString.clear();

	const QString& sFilename = filePath(sName);
	if (!QFileInfo(sFilename).exists()) {
		m_sErrorString = QObject::tr("Curve \"%1\" does not exist.").arg(sName);
		return false;
	}

	QDomDocument doc;
	qmotionCurve loaded;
	qmotionCurveDocument document(&doc, &loaded);
	if (!document.load(sFilename)) {
		m_sErrorString = document.errorString();
		return false;
	}

	curve = loaded;

	return true;
}


// end of qmotionCurveStore.cpp
