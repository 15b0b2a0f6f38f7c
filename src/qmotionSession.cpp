// qmotionSession.cpp
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

#include <limits>


//-------------------------------------------------------------------------
// qmotionSession -- Curve editing session orchestration.

// Constructor.
qmotionSession::qmotionSession ( qmotionOptions *pOptions, QObject *pParent )
	: QObject(pParent), m_pOptions(pOptions), m_bOptionsOwned(false),
		m_pCurveStore(nullptr), m_pPlayback(nullptr),
		m_pLivePreview(nullptr), m_pCurveFitter(nullptr),
		m_iState(qmotionTransport::Paused)
{
	// Stand-alone defaults.
	if (m_pOptions == nullptr) {
		m_pOptions = new qmotionOptions();
		m_bOptionsOwned = true;
	}

	m_pMessages = new qmotionMessages(this);
	m_pHistory = new qmotionHistory(m_pOptions->iHistoryLimit, this);
	m_pEdit = new qmotionCurveEdit(this);

	if (m_pOptions->bMessagesLog)
		m_pMessages->setLogging(true, m_pOptions->sMessagesLogPath);

	m_pEdit->setC1(m_pOptions->bC1);
	m_pEdit->setSnapToGrid(m_pOptions->bSnapToGrid);
	m_pEdit->setSnapTolerance(m_pOptions->dSnapTolerance);
	updateLimits();

	m_transport.setLooping(m_pOptions->bLooping);
	m_hermiteFitter.setMinSpacing(m_pOptions->dFitSpacing);

	QObject::connect(m_pEdit,
		SIGNAL(curveChanging(const QPointF&, bool)),
		SLOT(curveChangingSlot(const QPointF&, bool)));
	QObject::connect(m_pEdit,
		SIGNAL(curveChanged(const qmotionCurve&, const QString&)),
		SLOT(curveChangedSlot(const qmotionCurve&, const QString&)));

	// Start with something to edit.
	newCurve();
}


// Destructor.
qmotionSession::~qmotionSession (void)
{
	m_pEdit->disconnect(this);

	if (m_bOptionsOwned)
		delete m_pOptions;
}


// Curve fitter accessors.
void qmotionSession::setCurveFitter ( qmotionCurveFitter *pCurveFitter )
{
	m_pCurveFitter = pCurveFitter;
}

qmotionCurveFitter *qmotionSession::curveFitter (void)
{
	if (m_pCurveFitter)
		return m_pCurveFitter;

	return &m_hermiteFitter;
}


// Current committed curve.
const qmotionCurve& qmotionSession::curve (void) const
{
	return m_pHistory->retrieve();
}


// Whether there are unsaved changes.
bool qmotionSession::isModified (void) const
{
	return m_pHistory->isSavable();
}


// Curve persistence.
void qmotionSession::newCurve ( int iChannels )
{
	stopPlayback();

	const qmotionCurve& curve = qmotionCurve::zeroCurve(iChannels);

	m_pHistory->clear();
	m_pHistory->capture(curve, tr("new"));
	m_pHistory->setSaved();

	m_pEdit->setCurve(curve);
	m_sCurveName.clear();

	emit curveChanged();
}


bool qmotionSession::loadCurve ( const QString& sName )
{
	if (m_pCurveStore == nullptr) {
		m_pMessages->appendMessagesError(
			tr("Could not load curve \"%1\": no curve store.").arg(sName));
		return false;
	}

	qmotionCurve curve;
	if (!m_pCurveStore->loadCurve(sName, curve) || curve.isEmpty()) {
		m_pMessages->appendMessagesError(
			tr("Could not load curve \"%1\": %2.")
			.arg(sName).arg(m_pCurveStore->errorString()));
		return false;
	}

	stopPlayback();

	m_pHistory->clear();
	m_pHistory->capture(curve, tr("load"));
	m_pHistory->setSaved();

	m_pEdit->setCurve(curve);
	m_sCurveName = sName;

	m_pMessages->appendMessages(tr("Curve \"%1\" loaded.").arg(sName));

	emit curveChanged();

	return true;
}


bool qmotionSession::saveCurve ( const QString& sName )
{
	if (m_pCurveStore == nullptr) {
		m_pMessages->appendMessagesError(
			tr("Could not save curve \"%1\": no curve store.").arg(sName));
		return false;
	}

	if (!m_pCurveStore->saveCurve(sName, curve())) {
		m_pMessages->appendMessagesError(
			tr("Could not save curve \"%1\": %2.")
			.arg(sName).arg(m_pCurveStore->errorString()));
		return false;
	}

	// Only now it is safe.
	m_pHistory->setSaved();
	m_sCurveName = sName;

	m_pMessages->appendMessages(tr("Curve \"%1\" saved.").arg(sName));

	return true;
}


// History navigation.
bool qmotionSession::undo (void)
{
	if (!m_pHistory->undo())
		return false;

	stopPlayback();

	m_pEdit->setCurve(curve());

	emit curveChanged();

	return true;
}

bool qmotionSession::redo (void)
{
	if (!m_pHistory->redo())
		return false;

	stopPlayback();

	m_pEdit->setCurve(curve());

	emit curveChanged();

	return true;
}


// Curve wide transformations.
bool qmotionSession::scaleCurve ( double dFactor )
{
	stopPlayback();

	qmotionCurve copy(curve());
	copy.scale(dFactor);
	commitCurve(copy, tr("scale"));

	return true;
}

bool qmotionSession::stretchCurve ( double dFactor )
{
	if (dFactor <= 0.0)
		return false;

	stopPlayback();

	qmotionCurve copy(curve());
	copy.stretch(dFactor);
	commitCurve(copy, tr("stretch"));

	return true;
}

bool qmotionSession::shiftCurve ( double dOffset )
{
	stopPlayback();

	qmotionCurve copy(curve());
	copy.shift(dOffset);
	commitCurve(copy, tr("shift"));

	return true;
}

// Shift by the knot-shift step.
bool qmotionSession::shiftCurveLeft (void)
{
	return shiftCurve(-m_pOptions->dKnotShift);
}

bool qmotionSession::shiftCurveRight (void)
{
	return shiftCurve(+m_pOptions->dKnotShift);
}

bool qmotionSession::removeDelay (void)
{
	stopPlayback();

	// Shifting is clamped at time zero.
	qmotionCurve copy(curve());
	copy.shift(-std::numeric_limits<double>::infinity());
	commitCurve(copy, tr("remove delay"));

	return true;
}

bool qmotionSession::resetCurve (void)
{
	stopPlayback();

	commitCurve(qmotionCurve::zeroCurve(curve().channels()), tr("reset"));

	return true;
}


// Transport control.
bool qmotionSession::play (void)
{
	if (!m_transport.isPaused())
		return false;

	if (m_pPlayback == nullptr) {
		m_pMessages->appendMessagesError(tr("Could not play: no playback."));
		return false;
	}

	const qmotionCurve& current = curve();

	double dStartTime = 0.0;
	if (!m_pPlayback->play(current, m_transport.isLooping(),
			m_transport.position(), &dStartTime)) {
		m_pMessages->appendMessagesError(
			tr("Could not play: %1.").arg(m_pPlayback->errorString()));
		return false;
	}

	m_transport.setStartTime(dStartTime + m_pOptions->dPlaybackLatency);
	m_transport.setDuration(current.duration());

	const bool bResult = m_transport.play();

	updateState();

	return bResult;
}


bool qmotionSession::pause (void)
{
	if (!m_transport.isPlaying())
		return false;

	stopPlayback();

	return true;
}


bool qmotionSession::togglePlayback (void)
{
	if (m_transport.isPlaying())
		return pause();
	else
		return play();
}


void qmotionSession::stop (void)
{
	stopPlayback();

	m_transport.stop();

	updateState();
}


bool qmotionSession::toggleRecording (void)
{
	if (m_transport.isRecording())
		return stopRecording();
	else
		return startRecording();
}


void qmotionSession::toggleLooping (void)
{
	m_transport.toggleLooping();

	m_pOptions->bLooping = m_transport.isLooping();
}


void qmotionSession::setPosition ( double dPosition )
{
	m_transport.setPosition(qMax(0.0, dPosition));
}


// Edit mode toggles.
void qmotionSession::toggleC1 (void)
{
	m_pOptions->bC1 = !m_pOptions->bC1;
	m_pEdit->setC1(m_pOptions->bC1);
}

void qmotionSession::toggleSnapToGrid (void)
{
	m_pOptions->bSnapToGrid = !m_pOptions->bSnapToGrid;
	m_pEdit->setSnapToGrid(m_pOptions->bSnapToGrid);
}

void qmotionSession::toggleLivePreview (void)
{
	m_pOptions->bLivePreview = !m_pOptions->bLivePreview;
}

void qmotionSession::toggleLimits (void)
{
	m_pOptions->bLimits = !m_pOptions->bLimits;

	updateLimits();
}


bool qmotionSession::isLivePreview (void) const
{
	return m_pOptions->bLivePreview;
}

bool qmotionSession::isLimits (void) const
{
	return m_pOptions->bLimits;
}


// Back-end sample feed.
double qmotionSession::newData ( double dTimestamp, const QList<double>& values )
{
	const double t = m_transport.move(dTimestamp);

	if (m_transport.isPlaying() && t > m_transport.duration()) {
		m_transport.stop();
		updateState();
	}

	if (m_transport.isRecording())
		m_recorder.append(t, values);

	return t;
}


// Keyboard shortcut dispatcher.
bool qmotionSession::keyPress ( int iKey, Qt::KeyboardModifiers modifiers )
{
	const bool bControl = modifiers.testFlag(Qt::ControlModifier)
		|| modifiers.testFlag(Qt::MetaModifier);
	const bool bShift = modifiers.testFlag(Qt::ShiftModifier);

	if (bControl) {
		switch (iKey) {
		case Qt::Key_Z:
			if (bShift)
				redo();
			else
				undo();
			return true;
		case Qt::Key_U:
			if (bShift)
				return false;
			toggleSnapToGrid();
			return true;
		default:
			return false;
		}
	}

	const double dFine = (bShift ? m_pOptions->dFineFactor : 1.0);
	const double dTime = m_pOptions->dNudgeTime * dFine;
	const double dValue = m_pOptions->dNudgeValue * dFine;

	switch (iKey) {
	case Qt::Key_Space:
		togglePlayback();
		break;
	case Qt::Key_R:
		toggleRecording();
		break;
	case Qt::Key_L:
		toggleLooping();
		break;
	case Qt::Key_C:
		toggleC1();
		break;
	case Qt::Key_Backspace:
	case Qt::Key_Delete:
		m_pEdit->removeSelectedKnots();
		break;
	case Qt::Key_Left:
		m_pEdit->nudgeSelectedKnots(QPointF(-dTime, 0.0));
		break;
	case Qt::Key_Right:
		m_pEdit->nudgeSelectedKnots(QPointF(+dTime, 0.0));
		break;
	case Qt::Key_Up:
		m_pEdit->nudgeSelectedKnots(QPointF(0.0, +dValue));
		break;
	case Qt::Key_Down:
		m_pEdit->nudgeSelectedKnots(QPointF(0.0, -dValue));
		break;
	default:
		return false;
	}

	return true;
}


// Curve editor feedback.
void qmotionSession::curveChangingSlot ( const QPointF& pos, bool bPointer )
{
	stopPlayback();

	if (bPointer && m_pOptions->bLivePreview && m_pLivePreview) {
		m_transport.setPosition(pos.x());
		m_pLivePreview->setPosition(pos.y(), m_pEdit->channel());
	}
}


void qmotionSession::curveChangedSlot (
	const qmotionCurve& curve, const QString& sName )
{
	commitCurve(curve, sName);
}


// Commit a new curve into history.
void qmotionSession::commitCurve (
	const qmotionCurve& curve, const QString& sName )
{
	qmotionCurve copy(curve);
	copy.restrictToBBox(limitsBBox());

	m_pHistory->capture(copy, sName);

	m_pEdit->setCurve(copy, false);

#ifdef CONFIG_DEBUG
	qDebug("qmotionSession::commitCurve(\"%s\") index=%d count=%d",
		sName.toUtf8().constData(), m_pHistory->index(), m_pHistory->count());
#endif

	emit curveChanged();
}


// Stop back-end playback, if any.
void qmotionSession::stopPlayback (void)
{
	if (m_transport.isPaused())
		return;

	if (m_pPlayback && !m_pPlayback->stop()) {
		m_pMessages->appendMessagesError(
			tr("Could not stop playback: %1.").arg(m_pPlayback->errorString()));
	}

	m_transport.pause();

	updateState();
}


// Recording helpers.
bool qmotionSession::startRecording (void)
{
	stopPlayback();

	m_recorder.clear();

	const bool bResult = m_transport.record();

	updateState();

	return bResult;
}


bool qmotionSession::stopRecording (void)
{
	m_transport.stop();

	updateState();

	if (m_recorder.isEmpty())
		return false;

	qmotionCurve curve;
	const bool bResult = curveFitter()->fitCurve(m_recorder.samples(), curve);
	const int iSamples = m_recorder.count();
	m_recorder.clear();

	if (!bResult) {
		m_pMessages->appendMessagesError(
			tr("Could not fit a curve through %1 recorded samples.")
			.arg(iSamples));
		return false;
	}

	commitCurve(curve, tr("record"));

	return true;
}


// Motion limits from options.
qmotionBBox qmotionSession::limitsBBox (void) const
{
	const double dInf = qmotionBBox::infinity();

	if (m_pOptions->bLimits) {
		return qmotionBBox(
			QPointF(0.0, m_pOptions->dLimitsMin),
			QPointF(dInf, m_pOptions->dLimitsMax));
	}

	return qmotionBBox(QPointF(0.0, -dInf), QPointF(dInf, dInf));
}

void qmotionSession::updateLimits (void)
{
	m_pEdit->setLimits(limitsBBox());
}


// Transport state notification.
void qmotionSession::updateState (void)
{
	const int iState = int(m_transport.state());
	if (iState == m_iState)
		return;

	m_iState = iState;

	emit stateChanged(m_iState);
}


// end of qmotionSession.cpp
