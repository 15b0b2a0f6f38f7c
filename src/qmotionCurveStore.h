// qmotionCurveStore.h
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

#ifndef __qmotionCurveStore_h
#define __qmotionCurveStore_h

#include "qmotionCurve.h"

#include <QString>
#include <QStringList>


//----------------------------------------------------------------------
// class qmotionCurveStore -- Curve persistence interface.
//

class qmotionCurveStore
{
public:

	// Virtual destructor.
	virtual ~qmotionCurveStore() {}

	// Persistence methods.
	virtual bool saveCurve(const QString& sName, const qmotionCurve& curve) = 0;
	virtual bool loadCurve(const QString& sName, qmotionCurve& curve) = 0;

	// Last failure description.
	virtual QString errorString() const = 0;
};


//----------------------------------------------------------------------
// class qmotionCurveFileStore -- One XML document per curve name.
//

class qmotionCurveFileStore : public qmotionCurveStore
{
public:

	// Constructor.
	qmotionCurveFileStore(const QString& sBaseDir = QString());

	// Base directory path.
	void setBaseDir(const QString& sBaseDir)
		{ m_sBaseDir = sBaseDir; }
	const QString& baseDir() const
		{ return m_sBaseDir; }

	// Curve file extension (suffix).
	static const QString& defaultExt();

	// Curve name to file path.
	QString filePath(const QString& sName) const;

	// Available curve names.
	QStringList curveNames() const;

	// Persistence methods.
	bool saveCurve(const QString& sName, const qmotionCurve& curve) override;
	bool loadCurve(const QString& sName, qmotionCurve& curve) override;

	QString errorString() const override
		{ return m_sErrorString; }

private:

	// Instance variables.
	QString m_sBaseDir;
	QString m_sErrorString;
};


#endif  // __qmotionCurveStore_h

// end of qmotionCurveStore.h
