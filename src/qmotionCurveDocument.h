// qmotionCurveDocument.h
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

#ifndef __qmotionCurveDocument_h
#define __qmotionCurveDocument_h

#include "qmotionDocument.h"
#include "qmotionCurve.h"


//----------------------------------------------------------------------
// class qmotionCurveDocument -- Curve XML document.
//
// <curve version="..." channels="N">
//   <spline channel="i">
//     <degree>3</degree>
//     <knots>x0 x1 ...</knots>
//     <coefficients><row power="p">...</row>...</coefficients>
//   </spline>
// </curve>
//

class qmotionCurveDocument : public qmotionDocument
{
public:

	// Constructor.
	qmotionCurveDocument(QDomDocument *pDocument, qmotionCurve *pCurve);

	// Curve accessor.
	qmotionCurve *curve() const
		{ return m_pCurve; }

	// External storage element overrides.
	bool loadElement(QDomElement *pElement) override;
	bool saveElement(QDomElement *pElement) override;

	// Convenience (de)serializers.
	static QString toText(const qmotionCurve& curve);
	static bool fromText(const QString& sText, qmotionCurve& curve);

protected:

	// Per channel spline element.
	bool loadSpline(QDomElement *pElement, qmotionSpline& spline);
	void saveSpline(const qmotionSpline& spline, int iChannel,
		QDomElement *pElement);

private:

	// Instance variables.
	qmotionCurve *m_pCurve;
};


#endif  // __qmotionCurveDocument_h

// end of qmotionCurveDocument.h
