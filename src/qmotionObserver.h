// qmotionObserver.h
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

#ifndef __qmotionObserver_h
#define __qmotionObserver_h

#include <QString>
#include <QList>

// Forward declarations.
class qmotionSubject;
class qmotionObserver;


//---------------------------------------------------------------------------
// qmotionSubject - Scalar value model (eg. transport cursor position).

class qmotionSubject
{
public:

	// Constructor.
	qmotionSubject(double dValue = 0.0);

	// Destructor.
	~qmotionSubject();

	// Direct value accessors.
	void setValue(double dValue, qmotionObserver *pSender = nullptr);
	double value() const
		{ return m_dValue; }

	double prevValue() const
		{ return m_dPrevValue; }

	// Observers notification.
	void notify(qmotionObserver *pSender, bool bUpdate);

	// Observer list accessors.
	void attach(qmotionObserver *pObserver)
		{ m_observers.append(pObserver); }
	void detach(qmotionObserver *pObserver)
		{ m_observers.removeAll(pObserver); }

	const QList<qmotionObserver *>& observers() const
		{ return m_observers; }

	// Value name accessors.
	void setName(const QString& sName)
		{ m_sName = sName.trimmed(); }
	const QString& name() const
		{ return m_sName; }

private:

	// Instance variables.
	double  m_dValue;
	double  m_dPrevValue;

	// Human readable name/label.
	QString m_sName;

	// List of observers (obviously)
	QList<qmotionObserver *> m_observers;
};


//---------------------------------------------------------------------------
// qmotionObserver - Scalar value view.

class qmotionObserver
{
public:

	// Constructor.
	qmotionObserver(qmotionSubject *pSubject = nullptr) : m_pSubject(pSubject)
		{ if (m_pSubject) m_pSubject->attach(this); }

	// Virtual destructor.
	virtual ~qmotionObserver()
		{ if (m_pSubject) m_pSubject->detach(this); }

	// Subject value accessor.
	void setSubject(qmotionSubject *pSubject)
	{
		if (m_pSubject)
			m_pSubject->detach(this);

		m_pSubject = pSubject;

		if (m_pSubject)
			m_pSubject->attach(this);
	}

	qmotionSubject *subject() const
		{ return m_pSubject; }

	// Indirect value accessors.
	void setValue(double dValue)
		{ if (m_pSubject) m_pSubject->setValue(dValue, this); }
	double value() const
		{ return (m_pSubject ? m_pSubject->value() : 0.0); }

	// Pure virtual view updater.
	virtual void update(bool bUpdate) = 0;

private:

	// Instance variables.
	qmotionSubject *m_pSubject;
};


#endif  // __qmotionObserver_h

// end of qmotionObserver.h
