// qmotionCurveDocument.cpp
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

#include "qmotionCurveDocument.h"

#include <QDomDocument>
#include <QObject>


//----------------------------------------------------------------------
// class qmotionCurveDocument -- Curve XML document.
//

// Constructor.
qmotionCurveDocument::qmotionCurveDocument (
	QDomDocument *pDocument, qmotionCurve *pCurve )
	: qmotionDocument(pDocument, "curve"), m_pCurve(pCurve)
{
}


// Curve element loader.
bool qmotionCurveDocument::loadElement ( QDomElement *pElement )
{
	qmotionCurve curve;

	for (QDomNode nChild = pElement->firstChild();
			!nChild.isNull(); nChild = nChild.nextSibling()) {
		// Convert node to element, if any.
		QDomElement eChild = nChild.toElement();
		if (eChild.isNull())
			continue;
		// Check for channel spline...
		if (eChild.tagName() == "spline") {
			qmotionSpline spline;
			if (!loadSpline(&eChild, spline))
				return false;
			curve.addSpline(spline);
		}
	}

	if (curve.isEmpty()) {
		setErrorString(QObject::tr("Curve has no splines."));
		return false;
	}

	// Only replace when all went well.
	*m_pCurve = curve;

	return true;
}


// Per channel spline element loader.
bool qmotionCurveDocument::loadSpline (
	QDomElement *pElement, qmotionSpline& spline )
{
	const QString& sChannel = pElement->attribute("channel");

	int iDegree = -1;
	QList<double> knots;
	qmotionSpline::Matrix coeffs;

	for (QDomNode nChild = pElement->firstChild();
			!nChild.isNull(); nChild = nChild.nextSibling()) {
		QDomElement eChild = nChild.toElement();
		if (eChild.isNull())
			continue;
		if (eChild.tagName() == "degree")
			iDegree = eChild.text().toInt();
		else
		if (eChild.tagName() == "knots") {
			if (!valuesFromText(eChild.text(), knots)) {
				setErrorString(QObject::tr("Bad knots on channel %1.")
					.arg(sChannel));
				return false;
			}
		}
		else
		if (eChild.tagName() == "coefficients") {
			for (QDomNode nRow = eChild.firstChild();
					!nRow.isNull(); nRow = nRow.nextSibling()) {
				QDomElement eRow = nRow.toElement();
				if (eRow.isNull() || eRow.tagName() != "row")
					continue;
				qmotionSpline::Row row;
				if (!valuesFromText(eRow.text(), row)) {
					setErrorString(QObject::tr("Bad coefficients on channel %1.")
						.arg(sChannel));
					return false;
				}
				coeffs.append(row);
			}
		}
	}

	if (iDegree >= 0 && iDegree != coeffs.count() - 1) {
		setErrorString(QObject::tr("Degree mismatch on channel %1.")
			.arg(sChannel));
		return false;
	}

	if (!spline.setData(knots, coeffs)) {
		setErrorString(QObject::tr("Malformed spline on channel %1.")
			.arg(sChannel));
		return false;
	}

	return true;
}


// Curve element saver.
bool qmotionCurveDocument::saveElement ( QDomElement *pElement )
{
	const int iChannels = m_pCurve->channels();
	if (iChannels < 1) {
		setErrorString(QObject::tr("Curve has no splines."));
		return false;
	}

	pElement->setAttribute("channels", QString::number(iChannels));

	for (int iChannel = 0; iChannel < iChannels; ++iChannel)
		saveSpline(m_pCurve->spline(iChannel), iChannel, pElement);

	return true;
}


// Per channel spline element saver.
void qmotionCurveDocument::saveSpline (
	const qmotionSpline& spline, int iChannel, QDomElement *pElement )
{
	QDomElement eSpline = document()->createElement("spline");
	eSpline.setAttribute("channel", QString::number(iChannel));

	saveTextElement("degree", QString::number(spline.degree()), &eSpline);
	saveTextElement("knots", textFromValues(spline.knots()), &eSpline);

	QDomElement eCoeffs = document()->createElement("coefficients");
	const int iOrder = spline.order();
	for (int iPower = 0; iPower < iOrder; ++iPower) {
		QDomElement eRow = document()->createElement("row");
		eRow.setAttribute("power", QString::number(iPower));
		eRow.appendChild(document()->createTextNode(
			textFromValues(spline.coefficients().at(iPower))));
		eCoeffs.appendChild(eRow);
	}
	eSpline.appendChild(eCoeffs);

	pElement->appendChild(eSpline);
}


// Convenience (de)serializers.
QString qmotionCurveDocument::toText ( const qmotionCurve& curve )
{
	QDomDocument doc;
	qmotionCurve copy(curve);
	qmotionCurveDocument document(&doc, &copy);

	QString sText;
	if (!document.saveText(sText))
		return QString();

	return sText;
}

bool qmotionCurveDocument::fromText ( const QString& sText, qmotionCurve& curve )
{
	QDomDocument doc;
	qmotionCurveDocument document(&doc, &curve);

	return document.loadText(sText);
}


// end of qmotionCurveDocument.cpp
