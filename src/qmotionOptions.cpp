// qmotionOptions.cpp
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
#include "qmotionOptions.h"

#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>

#include <cstdio>


//-------------------------------------------------------------------------
// qmotionOptions - Prototype settings structure.
//

// Constructor.
qmotionOptions::qmotionOptions (void)
	: m_settings(QMOTION_DOMAIN, QMOTION_TITLE)
{
	// Startup supplied curve transforms.
	iSamples = 0;
	dScale   = 1.0;
	dStretch = 1.0;
	dShift   = 0.0;

	// Editor options...
	bC1            = true;
	bSnapToGrid    = true;
	dSnapTolerance = 0.001;
	bLivePreview   = false;
	dKnotShift     = 0.5;
	dNudgeTime     = 0.5;
	dNudgeValue    = 0.01;
	dFineFactor    = 0.1;

	// Motion limits...
	bLimits    = false;
	dLimitsMin = 0.0;
	dLimitsMax = 1.0;

	// Transport options...
	bLooping = true;
	dPlaybackLatency = 0.01;

	// History options...
	iHistoryLimit = 20;

	// Logging options...
	bMessagesLog = false;
	sMessagesLogPath = "qmotion.log";

	// Curve store options...
	sCurveDir = QDir::currentPath();
	dFitSpacing = 0.1;
}


// Default Destructor.
qmotionOptions::~qmotionOptions (void)
{
}


// Settings accessor.
QSettings& qmotionOptions::settings (void)
{
	return m_settings;
}


// Explicit load method.
void qmotionOptions::loadOptions (void)
{
	// And go into general options group.
	m_settings.beginGroup("/Options");

	// Load editor options...
	m_settings.beginGroup("/Editor");
	bC1            = m_settings.value("/C1", bC1).toBool();
	bSnapToGrid    = m_settings.value("/SnapToGrid", bSnapToGrid).toBool();
	dSnapTolerance = m_settings.value("/SnapTolerance", dSnapTolerance).toDouble();
	bLivePreview   = m_settings.value("/LivePreview", bLivePreview).toBool();
	dKnotShift     = m_settings.value("/KnotShift", dKnotShift).toDouble();
	dNudgeTime     = m_settings.value("/NudgeTime", dNudgeTime).toDouble();
	dNudgeValue    = m_settings.value("/NudgeValue", dNudgeValue).toDouble();
	dFineFactor    = m_settings.value("/FineFactor", dFineFactor).toDouble();
	bLimits        = m_settings.value("/Limits", bLimits).toBool();
	dLimitsMin     = m_settings.value("/LimitsMin", dLimitsMin).toDouble();
	dLimitsMax     = m_settings.value("/LimitsMax", dLimitsMax).toDouble();
	m_settings.endGroup();

	// Transport options group.
	m_settings.beginGroup("/Transport");
	bLooping         = m_settings.value("/Looping", bLooping).toBool();
	dPlaybackLatency = m_settings.value("/PlaybackLatency", dPlaybackLatency).toDouble();
	m_settings.endGroup();

	// History options group.
	m_settings.beginGroup("/History");
	iHistoryLimit = m_settings.value("/HistoryLimit", iHistoryLimit).toInt();
	m_settings.endGroup();

	// Load logging options...
	m_settings.beginGroup("/Logging");
	bMessagesLog     = m_settings.value("/MessagesLog", bMessagesLog).toBool();
	sMessagesLogPath = m_settings.value("/MessagesLogPath", sMessagesLogPath).toString();
	m_settings.endGroup();

	// Curve store options group.
	m_settings.beginGroup("/Curves");
	sCurveDir   = m_settings.value("/CurveDir", sCurveDir).toString();
	dFitSpacing = m_settings.value("/FitSpacing", dFitSpacing).toDouble();
	m_settings.endGroup();

	m_settings.endGroup(); // Options group.
}


// Explicit save method.
void qmotionOptions::saveOptions (void)
{
	// Make program version available in the future.
	m_settings.beginGroup("/Program");
	m_settings.setValue("/Version", PROJECT_VERSION);
	m_settings.endGroup();

	// And go into general options group.
	m_settings.beginGroup("/Options");

	// Save editor options...
	m_settings.beginGroup("/Editor");
	m_settings.setValue("/C1", bC1);
	m_settings.setValue("/SnapToGrid", bSnapToGrid);
	m_settings.setValue("/SnapTolerance", dSnapTolerance);
	m_settings.setValue("/LivePreview", bLivePreview);
	m_settings.setValue("/KnotShift", dKnotShift);
	m_settings.setValue("/NudgeTime", dNudgeTime);
	m_settings.setValue("/NudgeValue", dNudgeValue);
	m_settings.setValue("/FineFactor", dFineFactor);
	m_settings.setValue("/Limits", bLimits);
	m_settings.setValue("/LimitsMin", dLimitsMin);
	m_settings.setValue("/LimitsMax", dLimitsMax);
	m_settings.endGroup();

	// Transport options...
	m_settings.beginGroup("/Transport");
	m_settings.setValue("/Looping", bLooping);
	m_settings.setValue("/PlaybackLatency", dPlaybackLatency);
	m_settings.endGroup();

	// History options...
	m_settings.beginGroup("/History");
	m_settings.setValue("/HistoryLimit", iHistoryLimit);
	m_settings.endGroup();

	// Save logging options...
	m_settings.beginGroup("/Logging");
	m_settings.setValue("/MessagesLog", bMessagesLog);
	m_settings.setValue("/MessagesLogPath", sMessagesLogPath);
	m_settings.endGroup();

	// Curve store options...
	m_settings.beginGroup("/Curves");
	m_settings.setValue("/CurveDir", sCurveDir);
	m_settings.setValue("/FitSpacing", dFitSpacing);
	m_settings.endGroup();

	m_settings.endGroup(); // Options group.

	// Save/commit to disk.
	m_settings.sync();
}


//-------------------------------------------------------------------------
// Command-line argument stuff.
//

void qmotionOptions::show_error( const QString& msg )
{
	const QByteArray tmp = msg.toUtf8() + '\n';
	::fputs(tmp.constData(), stderr);
}


// Parse command line arguments into m_settings.
bool qmotionOptions::parse_args ( const QStringList& args )
{
	QCommandLineParser parser;
	parser.setApplicationDescription(
		QMOTION_TITLE " - " + QObject::tr(QMOTION_SUBTITLE));

	parser.addOption({{"n", "samples"},
		QObject::tr("Print N evenly spaced samples of the curve"), "count"});
	parser.addOption({"scale",
		QObject::tr("Scale all channel values by factor"), "factor"});
	parser.addOption({"stretch",
		QObject::tr("Stretch all channels in time by factor"), "factor"});
	parser.addOption({"shift",
		QObject::tr("Shift all channels in time by offset"), "offset"});
	parser.addOption({{"o", "output"},
		QObject::tr("Save the resulting curve to file"), "file"});
	parser.addHelpOption();
	parser.addVersionOption();
	parser.addPositionalArgument("curve-file",
		QObject::tr("Curve file (.qmc)"),
		QObject::tr("[curve-file...]"));
	parser.process(args);

	bool bOk = true;

	if (parser.isSet("samples")) {
		iSamples = parser.value("samples").toInt(&bOk);
		if (!bOk || iSamples < 0) {
			show_error(QObject::tr("Option -n requires a non-negative count."));
			return false;
		}
	}

	if (parser.isSet("scale")) {
		dScale = parser.value("scale").toDouble(&bOk);
		if (!bOk) {
			show_error(QObject::tr("Option --scale requires a number."));
			return false;
		}
	}

	if (parser.isSet("stretch")) {
		dStretch = parser.value("stretch").toDouble(&bOk);
		if (!bOk || dStretch <= 0.0) {
			show_error(QObject::tr("Option --stretch requires a positive number."));
			return false;
		}
	}

	if (parser.isSet("shift")) {
		dShift = parser.value("shift").toDouble(&bOk);
		if (!bOk) {
			show_error(QObject::tr("Option --shift requires a number."));
			return false;
		}
	}

	if (parser.isSet("output"))
		sOutputFile = QFileInfo(parser.value("output")).absoluteFilePath();

	foreach (const QString& sArg, parser.positionalArguments()) {
		curveFiles.append(QFileInfo(sArg).absoluteFilePath());
	}

	// Alright with argument parsing.
	return true;
}


// end of qmotionOptions.cpp
