// main.cpp
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
#include "qmotionSession.h"
#include "qmotionCurveStore.h"

#include <QCoreApplication>
#include <QFileInfo>
#include <QDir>
#include <QTextStream>

#include <cstdio>


//-------------------------------------------------------------------------
// Curve summary and sampling printout.

static void printCurve ( QTextStream& out, const QString& sName,
	const qmotionCurve& curve, int iSamples )
{
	const qmotionBBox& bbox = curve.bbox();

	out << sName << ": "
		<< QObject::tr("%1 channel(s), time %2 .. %3, value %4 .. %5")
			.arg(curve.channels())
			.arg(curve.start()).arg(curve.end())
			.arg(bbox.bottom()).arg(bbox.top())
		<< '\n';

	for (int i = 0; i < curve.channels(); ++i) {
		const qmotionSpline& spline = curve.spline(i);
		out << "  [" << i << "] "
			<< QObject::tr("degree %1, %2 segment(s)")
				.arg(spline.degree()).arg(spline.segments())
			<< '\n';
	}

	if (iSamples < 1)
		return;

	const double t0 = curve.start();
	const double dt = (iSamples > 1
		? (curve.end() - t0) / double(iSamples - 1) : 0.0);

	for (int i = 0; i < iSamples; ++i) {
		const double t = t0 + dt * double(i);
		out << QString::number(t, 'g', 10);
		QListIterator<double> iter(curve.values(t));
		while (iter.hasNext())
			out << ' ' << QString::number(iter.next(), 'g', 10);
		out << '\n';
	}
}


//-------------------------------------------------------------------------
// main - The main program trunk.
//

int main ( int argc, char **argv )
{
	QCoreApplication app(argc, argv);

	app.setOrganizationName(QMOTION_DOMAIN);
	app.setApplicationName(QMOTION_TITLE);
	app.setApplicationVersion(PROJECT_VERSION);

	// Construct default settings; override with command line arguments.
	qmotionOptions options;
	options.loadOptions();
	if (!options.parse_args(app.arguments())) {
		app.quit();
		return 1;
	}

	if (options.curveFiles.isEmpty()) {
		options.show_error(QObject::tr("No curve file given."));
		return 1;
	}

	if (!options.sOutputFile.isEmpty() && options.curveFiles.count() > 1) {
		options.show_error(QObject::tr("Option -o takes a single curve file."));
		return 1;
	}

	qmotionSession session(&options);
	qmotionCurveFileStore store(options.sCurveDir);
	session.setCurveStore(&store);

	QTextStream out(stdout);
	int iErrors = 0;

	// Relative paths are taken from the curve directory.
	const QDir dir(options.sCurveDir);
	QStringListIterator iter(options.curveFiles);
	while (iter.hasNext()) {
		const QFileInfo info(dir, iter.next());
		store.setBaseDir(info.absolutePath());
		if (!session.loadCurve(info.fileName())) {
			++iErrors;
			continue;
		}
		// Apply transforms.
		if (options.dScale != 1.0)
			session.scaleCurve(options.dScale);
		if (options.dStretch != 1.0)
			session.stretchCurve(options.dStretch);
		if (options.dShift != 0.0)
			session.shiftCurve(options.dShift);
		printCurve(out, info.completeBaseName(),
			session.curve(), options.iSamples);
		if (!options.sOutputFile.isEmpty()) {
			const QFileInfo output(options.sOutputFile);
			store.setBaseDir(output.absolutePath());
			if (!session.saveCurve(output.fileName()))
				++iErrors;
		}
	}

	out.flush();

	return (iErrors > 0 ? 1 : 0);
}

// end of main.cpp
