// qmotionHistoryTest.cpp
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

#include "qmotionHistory.h"

#include <gtest/gtest.h>

#include <stdexcept>


namespace {

// Distinguishable snapshots.
qmotionCurve snapshot ( double dOffset )
{
	qmotionCurve curve = qmotionCurve::zeroCurve();
	curve.shift(dOffset);
	return curve;
}

}


TEST(qmotionHistoryTest, CaptureAfterUndoTruncatesRedoTail)
{
	qmotionHistory history;
	const qmotionCurve a = snapshot(1.0);
	const qmotionCurve b = snapshot(2.0);
	const qmotionCurve c = snapshot(3.0);

	history.capture(a);
	history.capture(b);
	ASSERT_TRUE(history.undo());
	EXPECT_EQ(history.retrieve(), a);
	EXPECT_TRUE(history.isRedoable());

	history.capture(c);

	EXPECT_FALSE(history.isRedoable());
	EXPECT_EQ(history.retrieve(), c);
	EXPECT_EQ(history.count(), 2);

	ASSERT_TRUE(history.undo());
	EXPECT_EQ(history.retrieve(), a);
	EXPECT_FALSE(history.isUndoable());
	EXPECT_FALSE(history.undo());
}


TEST(qmotionHistoryTest, EmptyHistoryRetrieveThrows)
{
	qmotionHistory history;

	EXPECT_TRUE(history.isEmpty());
	EXPECT_FALSE(history.isUndoable());
	EXPECT_FALSE(history.isRedoable());
	EXPECT_FALSE(history.isSavable());
	EXPECT_FALSE(history.undo());
	EXPECT_FALSE(history.redo());
	EXPECT_THROW(history.retrieve(), std::out_of_range);
}


TEST(qmotionHistoryTest, RedoWalksForward)
{
	qmotionHistory history;
	history.capture(snapshot(1.0), "one");
	history.capture(snapshot(2.0), "two");
	history.capture(snapshot(3.0), "three");

	EXPECT_EQ(history.undoName(), QString("three"));
	EXPECT_TRUE(history.redoName().isEmpty());

	history.undo();
	history.undo();
	EXPECT_EQ(history.index(), 0);
	EXPECT_EQ(history.redoName(), QString("two"));

	ASSERT_TRUE(history.redo());
	ASSERT_TRUE(history.redo());
	EXPECT_FALSE(history.redo());
	EXPECT_EQ(history.retrieve(), snapshot(3.0));
}


TEST(qmotionHistoryTest, SavedMarkerFollowsSnapshot)
{
	qmotionHistory history;
	history.capture(snapshot(1.0));
	EXPECT_TRUE(history.isSavable());

	history.setSaved();
	EXPECT_FALSE(history.isSavable());

	history.capture(snapshot(2.0));
	EXPECT_TRUE(history.isSavable());

	history.undo();
	EXPECT_FALSE(history.isSavable());

	// Same content, another edit.
	history.capture(snapshot(1.0));
	EXPECT_TRUE(history.isSavable());

	history.clear();
	EXPECT_TRUE(history.isEmpty());
	EXPECT_FALSE(history.isSavable());
}


TEST(qmotionHistoryTest, MaxLengthDropsOldest)
{
	qmotionHistory history(3);
	for (int i = 1; i <= 5; ++i)
		history.capture(snapshot(double(i)));

	EXPECT_EQ(history.count(), 3);
	EXPECT_EQ(history.index(), 2);
	EXPECT_EQ(history.retrieve(), snapshot(5.0));

	history.undo();
	history.undo();
	EXPECT_FALSE(history.isUndoable());
	EXPECT_EQ(history.retrieve(), snapshot(3.0));

	// Shrinking keeps the current entry.
	history.setMaxLength(1);
	EXPECT_EQ(history.count(), 1);
	EXPECT_EQ(history.retrieve(), snapshot(3.0));
}


TEST(qmotionHistoryTest, UpdateNotifications)
{
	qmotionHistory history;

	int iUpdates = 0;
	QObject::connect(&history, &qmotionHistory::updateNotifySignal,
		[&iUpdates] () { ++iUpdates; });

	history.capture(snapshot(1.0));
	history.capture(snapshot(2.0));
	history.undo();
	history.redo();
	history.redo();

	EXPECT_EQ(iUpdates, 4);
}


// end of qmotionHistoryTest.cpp
