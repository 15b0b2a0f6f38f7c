// qmotionSession.h
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

#ifndef __qmotionSession_h
#define __qmotionSession_h

#include "qmotionCurveEdit.h"
#include "qmotionHistory.h"
#include "qmotionTransport.h"
#include "qmotionRecorder.h"
#include "qmotionCurveFitter.h"

#include <QObject>

// Forward declarations.
class qmotionOptions;
class qmotionMessages;
class qmotionCurveStore;
class qmotionPlayback;
class qmotionLivePreview;


//-------------------------------------------------------------------------
// qmotionSession -- Curve editing session orchestration.

class qmotionSession : public QObject
{
	Q_OBJECT

public:

	// Constructor.
	qmotionSession(qmotionOptions *pOptions = nullptr, QObject *pParent = nullptr);
	// Destructor.
	~qmotionSession();

	// Owned components.
	qmotionOptions    *options() const  { return m_pOptions; }
	qmotionMessages   *messages() const { return m_pMessages; }
	qmotionHistory    *history() const  { return m_pHistory; }
	qmotionCurveEdit  *edit() const     { return m_pEdit; }

	qmotionTransport *transport() { return &m_transport; }
	qmotionRecorder  *recorder()  { return &m_recorder; }

	// Collaborators (not owned).
	void setCurveStore(qmotionCurveStore *pCurveStore)
		{ m_pCurveStore = pCurveStore; }
	qmotionCurveStore *curveStore() const
		{ return m_pCurveStore; }

	void setPlayback(qmotionPlayback *pPlayback)
		{ m_pPlayback = pPlayback; }
	qmotionPlayback *playback() const
		{ return m_pPlayback; }

	void setLivePreview(qmotionLivePreview *pLivePreview)
		{ m_pLivePreview = pLivePreview; }
	qmotionLivePreview *livePreview() const
		{ return m_pLivePreview; }

	// Default is the internal Hermite fitter.
	void setCurveFitter(qmotionCurveFitter *pCurveFitter);
	qmotionCurveFitter *curveFitter();

	// Current committed curve.
	const qmotionCurve& curve() const;

	// Current curve name (last loaded or saved).
	const QString& curveName() const
		{ return m_sCurveName; }

	// Whether there are unsaved changes.
	bool isModified() const;

	// Curve persistence.
	void newCurve(int iChannels = 1);
	bool loadCurve(const QString& sName);
	bool saveCurve(const QString& sName);

	// History navigation.
	bool undo();
	bool redo();

	// Curve wide transformations.
	bool scaleCurve(double dFactor);
	bool stretchCurve(double dFactor);
	bool shiftCurve(double dOffset);
	bool shiftCurveLeft();
	bool shiftCurveRight();
	bool removeDelay();
	bool resetCurve();

	// Transport control.
	bool play();
	bool pause();
	bool togglePlayback();
	void stop();
	bool toggleRecording();
	void toggleLooping();
	void setPosition(double dPosition);

	// Edit mode toggles.
	void toggleC1();
	void toggleSnapToGrid();
	void toggleLivePreview();
	void toggleLimits();

	bool isLivePreview() const;
	bool isLimits() const;

	// Back-end sample feed; returns the transport position.
	double newData(double dTimestamp, const QList<double>& values);

	// Keyboard shortcut dispatcher.
	bool keyPress(int iKey, Qt::KeyboardModifiers modifiers = Qt::NoModifier);

signals:

	// Committed curve changed (edit, undo/redo, load).
	void curveChanged();

	// Transport state changed.
	void stateChanged(int iState);

protected slots:

	// Curve editor feedback.
	void curveChangingSlot(const QPointF& pos, bool bPointer);
	void curveChangedSlot(const qmotionCurve& curve, const QString& sName);

protected:

	// Commit a new curve into history.
	void commitCurve(const qmotionCurve& curve, const QString& sName);

	// Stop back-end playback, if any.
	void stopPlayback();

	// Recording helpers.
	bool startRecording();
	bool stopRecording();

	// Motion limits from options.
	void updateLimits();
	qmotionBBox limitsBBox() const;

	// Transport state notification.
	void updateState();

private:

	// Instance variables.
	qmotionOptions   *m_pOptions;
	bool              m_bOptionsOwned;

	qmotionMessages  *m_pMessages;
	qmotionHistory   *m_pHistory;
	qmotionCurveEdit *m_pEdit;

	qmotionTransport  m_transport;
	qmotionRecorder   m_recorder;

	qmotionCurveStore  *m_pCurveStore;
	qmotionPlayback    *m_pPlayback;
	qmotionLivePreview *m_pLivePreview;
	qmotionCurveFitter *m_pCurveFitter;

	qmotionHermiteFitter m_hermiteFitter;

	QString m_sCurveName;

	int m_iState;
};


#endif  // __qmotionSession_h


// end of qmotionSession.h
