// qmotionOptions.h
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

#ifndef __qmotionOptions_h
#define __qmotionOptions_h

#include <QSettings>
#include <QStringList>


//-------------------------------------------------------------------------
// qmotionOptions - Prototype settings class.
//

class qmotionOptions
{
public:

	// Constructor.
	qmotionOptions();
	// Default destructor.
	~qmotionOptions();

	// The settings object accessor.
	QSettings& settings();

	// Explicit I/O methods.
	void loadOptions();
	void saveOptions();

	// Command line arguments parser.
	bool parse_args(const QStringList& args);
	void show_error(const QString& msg);

	// Startup supplied curve files.
	QStringList curveFiles;

	// Startup supplied curve transforms.
	int     iSamples;
	double  dScale;
	double  dStretch;
	double  dShift;
	QString sOutputFile;

	// Editor options...
	bool    bC1;
	bool    bSnapToGrid;
	double  dSnapTolerance;
	bool    bLivePreview;
	double  dKnotShift;
	double  dNudgeTime;
	double  dNudgeValue;
	double  dFineFactor;

	// Motion limits...
	bool    bLimits;
	double  dLimitsMin;
	double  dLimitsMax;

	// Transport options...
	bool    bLooping;
	double  dPlaybackLatency;

	// History options...
	int     iHistoryLimit;

	// Logging options...
	bool    bMessagesLog;
	QString sMessagesLogPath;

	// Curve store options...
	QString sCurveDir;
	double  dFitSpacing;

private:

	// Settings member variables.
	QSettings m_settings;
};


#endif  // __qmotionOptions_h


// end of qmotionOptions.h
