// qmotionSessionTest.cpp
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

#include "qmotionSession.h"
#include "qmotionOptions.h"
#include "qmotionMessages.h"
#include "qmotionCurveStore.h"
#include "qmotionPlayback.h"

#include <gtest/gtest.h>

#include <QHash>


namespace {

// In-memory curve store.
class MemoryStore : public qmotionCurveStore
{
public:

	MemoryStore() : m_bFail(false) {}

	bool saveCurve(const QString& sName, const qmotionCurve& curve) override
	{
		if (m_bFail) {
			m_sErrorString = "disk full";
			return false;
		}
		m_curves.insert(sName, curve);
		return true;
	}

	bool loadCurve(const QString& sName, qmotionCurve& curve) override
	{
		if (!m_curves.contains(sName)) {
			m_sErrorString = "no such curve";
			return false;
		}
		curve = m_curves.value(sName);
		return true;
	}

	QString errorString() const override
		{ return m_sErrorString; }

	bool m_bFail;
	QHash<QString, qmotionCurve> m_curves;
	QString m_sErrorString;
};


// Back-end playback recording its calls.
class FakePlayback : public qmotionPlayback
{
public:

	FakePlayback() : m_bFail(false), m_iPlays(0), m_iStops(0),
		m_bLoop(false), m_dOffset(-1.0) {}

	bool play(const qmotionCurve&, bool bLoop,
		double dOffset, double *pStartTime) override
	{
		if (m_bFail)
			return false;
		++m_iPlays;
		m_bLoop = bLoop;
		m_dOffset = dOffset;
		*pStartTime = 100.0;
		return true;
	}

	bool stop() override
		{ ++m_iStops; return true; }

	QString errorString() const override
		{ return "motors offline"; }

	bool m_bFail;
	int m_iPlays;
	int m_iStops;
	bool m_bLoop;
	double m_dOffset;
};


// Motor positioning sink.
class FakeLivePreview : public qmotionLivePreview
{
public:

	FakeLivePreview() : m_iCalls(0), m_dValue(0.0), m_iChannel(-1) {}

	void setPosition(double dValue, int iChannel) override
	{
		++m_iCalls;
		m_dValue = dValue;
		m_iChannel = iChannel;
	}

	int m_iCalls;
	double m_dValue;
	int m_iChannel;
};

}


TEST(qmotionSessionTest, StartsWithSavedZeroCurve)
{
	qmotionSession session;

	EXPECT_EQ(session.curve(), qmotionCurve::zeroCurve());
	EXPECT_EQ(session.edit()->curve(), session.curve());
	EXPECT_FALSE(session.isModified());
	EXPECT_TRUE(session.curveName().isEmpty());
	EXPECT_EQ(session.history()->count(), 1);
	EXPECT_TRUE(session.transport()->isPaused());

	session.newCurve(3);
	EXPECT_EQ(session.curve().channels(), 3);
	EXPECT_FALSE(session.history()->isUndoable());
}


TEST(qmotionSessionTest, SaveMarkerOnlyOnSuccess)
{
	qmotionSession session;
	MemoryStore store;

	EXPECT_FALSE(session.saveCurve("orphan"));
	EXPECT_FALSE(session.loadCurve("orphan"));

	session.setCurveStore(&store);

	ASSERT_TRUE(session.edit()->insertKnot(QPointF(0.5, 0.25)));
	EXPECT_TRUE(session.isModified());
	EXPECT_EQ(session.history()->undoName(), QString("insert knot"));

	store.m_bFail = true;
	session.messages()->clear();
	EXPECT_FALSE(session.saveCurve("wave"));
	EXPECT_TRUE(session.isModified());
	EXPECT_TRUE(session.curveName().isEmpty());
	EXPECT_FALSE(session.messages()->lines().isEmpty());

	store.m_bFail = false;
	ASSERT_TRUE(session.saveCurve("wave"));
	EXPECT_FALSE(session.isModified());
	EXPECT_EQ(session.curveName(), QString("wave"));

	session.newCurve();
	EXPECT_FALSE(session.loadCurve("missing"));
	EXPECT_EQ(session.curve(), qmotionCurve::zeroCurve());

	ASSERT_TRUE(session.loadCurve("wave"));
	EXPECT_EQ(session.curve().spline(0).segments(), 2);
	EXPECT_EQ(session.edit()->curve(), session.curve());
	EXPECT_FALSE(session.isModified());
	EXPECT_FALSE(session.history()->isUndoable());
}


TEST(qmotionSessionTest, UndoRedoFollowEdits)
{
	qmotionSession session;

	int iChanged = 0;
	QObject::connect(&session, &qmotionSession::curveChanged,
		[&iChanged] () { ++iChanged; });

	ASSERT_TRUE(session.edit()->insertKnot(QPointF(0.5, 0.25)));
	const qmotionCurve edited = session.curve();
	EXPECT_EQ(iChanged, 1);

	ASSERT_TRUE(session.undo());
	EXPECT_EQ(session.curve(), qmotionCurve::zeroCurve());
	EXPECT_EQ(session.edit()->curve(), qmotionCurve::zeroCurve());
	EXPECT_FALSE(session.undo());

	ASSERT_TRUE(session.redo());
	EXPECT_EQ(session.curve(), edited);
	EXPECT_EQ(session.edit()->curve(), edited);
	EXPECT_EQ(iChanged, 3);
}


TEST(qmotionSessionTest, CurveWideTransforms)
{
	qmotionSession session;
	ASSERT_TRUE(session.edit()->insertKnot(QPointF(0.5, 0.25)));

	ASSERT_TRUE(session.scaleCurve(2.0));
	EXPECT_EQ(session.curve().spline(0).knotValue(1), 0.5);

	EXPECT_FALSE(session.stretchCurve(0.0));
	ASSERT_TRUE(session.stretchCurve(2.0));
	EXPECT_EQ(session.curve().end(), 2.0);

	ASSERT_TRUE(session.shiftCurve(3.0));
	EXPECT_EQ(session.curve().start(), 3.0);

	ASSERT_TRUE(session.shiftCurveLeft());
	EXPECT_EQ(session.curve().start(), 2.5);
	ASSERT_TRUE(session.shiftCurveRight());
	EXPECT_EQ(session.curve().start(), 3.0);

	ASSERT_TRUE(session.removeDelay());
	EXPECT_EQ(session.curve().start(), 0.0);
	EXPECT_EQ(session.history()->undoName(), QString("remove delay"));

	ASSERT_TRUE(session.resetCurve());
	EXPECT_EQ(session.curve(), qmotionCurve::zeroCurve());
	EXPECT_TRUE(session.isModified());
	EXPECT_EQ(session.history()->count(), 9);
}


TEST(qmotionSessionTest, RemoveDelayKeepsChannelTiming)
{
	QList<double> knots0;
	knots0 << 1.0 << 2.0;
	QList<double> knots1;
	knots1 << 1.5 << 2.5;
	qmotionSpline::Matrix coeffs;
	coeffs << (qmotionSpline::Row() << 0.0);
	coeffs << (qmotionSpline::Row() << 1.0);

	MemoryStore store;
	store.m_curves.insert("staggered", qmotionCurve(QList<qmotionSpline>()
		<< qmotionSpline(knots0, coeffs)
		<< qmotionSpline(knots1, coeffs)));

	qmotionSession session;
	session.setCurveStore(&store);
	ASSERT_TRUE(session.loadCurve("staggered"));

	ASSERT_TRUE(session.removeDelay());
	EXPECT_EQ(session.curve().spline(0).start(), 0.0);
	EXPECT_EQ(session.curve().spline(1).start(), 0.5);
}


TEST(qmotionSessionTest, NegativeKnotTimesMoveOverOnCommit)
{
	QList<double> knots;
	knots << -2.0 << -1.0 << 1.0;
	qmotionSpline::Matrix coeffs;
	coeffs << (qmotionSpline::Row() << 0.0 << 1.0);
	coeffs << (qmotionSpline::Row() << 1.0 << 0.5);

	MemoryStore store;
	store.m_curves.insert("early", qmotionCurve(QList<qmotionSpline>()
		<< qmotionSpline(knots, coeffs)));

	qmotionSession session;
	session.setCurveStore(&store);
	ASSERT_TRUE(session.loadCurve("early"));

	ASSERT_TRUE(session.scaleCurve(1.0));
	const qmotionSpline spline = session.curve().spline(0);
	EXPECT_EQ(spline.knots(), QList<double>() << 0.0 << 1.0 << 3.0);
	EXPECT_TRUE(qmotionSpline::isValidData(spline.knots(), spline.coefficients()));

	// What was committed saves and loads back.
	ASSERT_TRUE(session.saveCurve("early"));
	ASSERT_TRUE(session.loadCurve("early"));
	EXPECT_EQ(session.curve().spline(0).knots(), spline.knots());
}


TEST(qmotionSessionTest, PlayUsesBackEndStartTime)
{
	qmotionSession session;

	QList<int> states;
	QObject::connect(&session, &qmotionSession::stateChanged,
		[&states] (int iState) { states.append(iState); });

	EXPECT_FALSE(session.play());
	EXPECT_TRUE(session.transport()->isPaused());

	FakePlayback playback;
	session.setPlayback(&playback);

	playback.m_bFail = true;
	EXPECT_FALSE(session.play());
	EXPECT_TRUE(session.transport()->isPaused());
	EXPECT_TRUE(states.isEmpty());

	playback.m_bFail = false;
	session.setPosition(-1.0);
	EXPECT_EQ(session.transport()->position(), 0.0);

	ASSERT_TRUE(session.play());
	EXPECT_TRUE(session.transport()->isPlaying());
	EXPECT_NEAR(session.transport()->startTime(), 100.01, 1e-12);
	EXPECT_EQ(session.transport()->duration(), 1.0);
	EXPECT_TRUE(playback.m_bLoop);
	EXPECT_EQ(playback.m_dOffset, 0.0);
	EXPECT_FALSE(session.play());

	ASSERT_TRUE(session.togglePlayback());
	EXPECT_TRUE(session.transport()->isPaused());
	EXPECT_EQ(playback.m_iStops, 1);

	EXPECT_EQ(states, QList<int>()
		<< int(qmotionTransport::Playing)
		<< int(qmotionTransport::Paused));
}


TEST(qmotionSessionTest, PlayingPastTheEndStops)
{
	qmotionSession session;
	FakePlayback playback;
	session.setPlayback(&playback);

	session.toggleLooping();
	EXPECT_FALSE(session.transport()->isLooping());
	EXPECT_FALSE(session.options()->bLooping);

	ASSERT_TRUE(session.play());

	EXPECT_NEAR(session.newData(100.51, QList<double>()), 0.5, 1e-9);
	EXPECT_TRUE(session.transport()->isPlaying());

	session.newData(101.5, QList<double>());
	EXPECT_TRUE(session.transport()->isPaused());
	EXPECT_EQ(session.transport()->position(), 0.0);
}


TEST(qmotionSessionTest, RecordingCommitsFittedCurve)
{
	qmotionSession session;

	// Empty takes are dropped.
	ASSERT_TRUE(session.toggleRecording());
	EXPECT_FALSE(session.toggleRecording());
	EXPECT_EQ(session.curve(), qmotionCurve::zeroCurve());

	session.newData(10.0, QList<double>() << 5.0);
	EXPECT_TRUE(session.recorder()->isEmpty());

	ASSERT_TRUE(session.keyPress(Qt::Key_R));
	EXPECT_TRUE(session.transport()->isRecording());
	EXPECT_EQ(session.transport()->startTime(), 10.0);

	EXPECT_EQ(session.newData(10.0, QList<double>() << 0.0), 0.0);
	EXPECT_EQ(session.newData(11.0, QList<double>() << 1.0), 1.0);
	EXPECT_EQ(session.newData(12.0, QList<double>() << 0.0), 2.0);
	EXPECT_EQ(session.recorder()->count(), 3);

	ASSERT_TRUE(session.keyPress(Qt::Key_R));
	EXPECT_TRUE(session.transport()->isPaused());
	EXPECT_TRUE(session.recorder()->isEmpty());

	const qmotionSpline& spline = session.curve().spline(0);
	EXPECT_EQ(spline.knots(), QList<double>() << 0.0 << 1.0 << 2.0);
	EXPECT_EQ(spline.knotValue(1), 1.0);
	EXPECT_EQ(session.history()->undoName(), QString("record"));
	EXPECT_TRUE(session.isModified());
}


TEST(qmotionSessionTest, KeyboardShortcuts)
{
	qmotionSession session;
	qmotionCurveEdit *pEdit = session.edit();

	// Select the end knot and raise it.
	pEdit->clickSelect(QList<int>() << 1);
	ASSERT_TRUE(session.keyPress(Qt::Key_Up));
	EXPECT_NEAR(session.curve().spline(0).knotValue(1), 0.01, 1e-12);

	ASSERT_TRUE(session.keyPress(Qt::Key_Up, Qt::ShiftModifier));
	EXPECT_NEAR(session.curve().spline(0).knotValue(1), 0.011, 1e-12);

	ASSERT_TRUE(session.keyPress(Qt::Key_Right));
	EXPECT_EQ(session.curve().end(), 1.5);

	ASSERT_TRUE(session.keyPress(Qt::Key_Z, Qt::ControlModifier));
	EXPECT_EQ(session.curve().end(), 1.0);
	ASSERT_TRUE(session.keyPress(Qt::Key_Z,
		Qt::ControlModifier | Qt::ShiftModifier));
	EXPECT_EQ(session.curve().end(), 1.5);
	ASSERT_TRUE(session.keyPress(Qt::Key_Z, Qt::MetaModifier));
	EXPECT_EQ(session.curve().end(), 1.0);

	ASSERT_TRUE(pEdit->isSnapToGrid());
	ASSERT_TRUE(session.keyPress(Qt::Key_U, Qt::ControlModifier));
	EXPECT_FALSE(pEdit->isSnapToGrid());
	EXPECT_FALSE(session.keyPress(Qt::Key_U,
		Qt::ControlModifier | Qt::ShiftModifier));

	ASSERT_TRUE(session.keyPress(Qt::Key_C));
	EXPECT_FALSE(pEdit->isC1());

	ASSERT_TRUE(session.keyPress(Qt::Key_L));
	EXPECT_FALSE(session.transport()->isLooping());

	// Single segment stays.
	pEdit->clickSelect(QList<int>() << 0);
	ASSERT_TRUE(session.keyPress(Qt::Key_Delete));
	EXPECT_EQ(session.curve().spline(0).segments(), 1);

	EXPECT_FALSE(session.keyPress(Qt::Key_X, Qt::ControlModifier));
	EXPECT_FALSE(session.keyPress(Qt::Key_A));
}


TEST(qmotionSessionTest, LivePreviewFollowsKnotDrag)
{
	qmotionSession session;
	FakePlayback playback;
	FakeLivePreview preview;
	session.setPlayback(&playback);
	session.setLivePreview(&preview);

	qmotionCurveEdit *pEdit = session.edit();

	// Preview is off by default.
	pEdit->beginKnotDrag(1, QPointF(1.0, 0.0));
	pEdit->dragMove(QPointF(0.8, 0.4));
	pEdit->dragEnd(QPointF(1.0, 0.0));
	EXPECT_EQ(preview.m_iCalls, 0);

	session.toggleLivePreview();
	ASSERT_TRUE(session.isLivePreview());

	// Any edit stops playback.
	ASSERT_TRUE(session.play());
	pEdit->beginKnotDrag(1, QPointF(1.0, 0.0));
	EXPECT_TRUE(session.transport()->isPaused());
	EXPECT_EQ(playback.m_iStops, 1);

	pEdit->dragMove(QPointF(0.8, 0.4));
	EXPECT_EQ(preview.m_iCalls, 1);
	EXPECT_EQ(preview.m_dValue, 0.4);
	EXPECT_EQ(preview.m_iChannel, 0);
	EXPECT_EQ(session.transport()->position(), 0.8);

	ASSERT_TRUE(pEdit->dragEnd(QPointF(0.8, 0.4)));
	EXPECT_NEAR(session.curve().spline(0).knotValue(1), 0.4, 1e-12);
	EXPECT_EQ(session.history()->undoName(), QString("move knot"));
}


TEST(qmotionSessionTest, LimitsRestrictCommits)
{
	qmotionOptions options;
	qmotionSession session(&options);
	EXPECT_EQ(session.options(), &options);

	ASSERT_TRUE(session.edit()->insertKnot(QPointF(0.5, 3.0)));
	EXPECT_EQ(session.curve().spline(0).knotValue(1), 3.0);

	session.toggleLimits();
	ASSERT_TRUE(session.isLimits());
	EXPECT_EQ(session.edit()->limits().top(), options.dLimitsMax);

	ASSERT_TRUE(session.scaleCurve(1.0));
	EXPECT_LE(session.curve().spline(0).maxValue(), 1.0);
	EXPECT_GE(session.curve().spline(0).minValue(), 0.0);
	EXPECT_EQ(session.edit()->curve(), session.curve());
}


// end of qmotionSessionTest.cpp
