// qmotionTransportTest.cpp
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

#include "qmotionTransport.h"

#include <gtest/gtest.h>

#include <cmath>


namespace {

// Cursor view counting its updates.
class CursorObserver : public qmotionObserver
{
public:

	CursorObserver(qmotionSubject *pSubject)
		: qmotionObserver(pSubject), m_iUpdates(0) {}

	void update(bool) override
		{ ++m_iUpdates; }

	int updates() const
		{ return m_iUpdates; }

private:

	int m_iUpdates;
};

}


TEST(qmotionTransportTest, DefaultState)
{
	qmotionTransport transport;

	EXPECT_TRUE(transport.isPaused());
	EXPECT_EQ(transport.position(), 0.0);
	EXPECT_EQ(transport.duration(), 1.0);
	EXPECT_TRUE(transport.isLooping());
	EXPECT_EQ(transport.startTime(), 0.0);
}


TEST(qmotionTransportTest, MoveWhilePausedKeepsPosition)
{
	qmotionTransport transport;
	transport.setPosition(0.25);

	const double t = transport.move(10.5);

	EXPECT_EQ(t, 0.5);
	EXPECT_EQ(transport.position(), 0.25);
	EXPECT_EQ(transport.latestTimestamp(), 10.5);
}


TEST(qmotionTransportTest, RecordThenStopRewinds)
{
	qmotionTransport transport;
	transport.move(100.0);

	ASSERT_TRUE(transport.record());
	EXPECT_TRUE(transport.isRecording());
	EXPECT_EQ(transport.startTime(), 100.0);
	EXPECT_TRUE(std::isinf(transport.duration()));

	EXPECT_EQ(transport.move(102.5), 2.5);
	EXPECT_EQ(transport.position(), 2.5);

	transport.stop();
	EXPECT_TRUE(transport.isPaused());
	EXPECT_EQ(transport.position(), 0.0);
}


TEST(qmotionTransportTest, IllegalTransitionsAreIgnored)
{
	qmotionTransport transport;

	EXPECT_FALSE(transport.pause());
	EXPECT_TRUE(transport.isPaused());

	ASSERT_TRUE(transport.play());
	EXPECT_FALSE(transport.play());
	EXPECT_FALSE(transport.record());
	EXPECT_TRUE(transport.isPlaying());

	ASSERT_TRUE(transport.pause());
	ASSERT_TRUE(transport.record());
	EXPECT_FALSE(transport.play());
	EXPECT_TRUE(transport.isRecording());

	ASSERT_TRUE(transport.pause());
	EXPECT_TRUE(transport.isPaused());
}


TEST(qmotionTransportTest, LoopingWrapsPosition)
{
	qmotionTransport transport;
	transport.setStartTime(10.0);
	transport.setDuration(2.0);
	ASSERT_TRUE(transport.play());

	EXPECT_EQ(transport.move(11.5), 1.5);
	EXPECT_EQ(transport.move(13.0), 1.0);
	EXPECT_EQ(transport.move(9.5), 1.5);

	transport.toggleLooping();
	EXPECT_FALSE(transport.isLooping());
	EXPECT_EQ(transport.move(13.0), 3.0);
	EXPECT_EQ(transport.position(), 3.0);
}


TEST(qmotionTransportTest, CursorObserverNotified)
{
	qmotionTransport transport;
	CursorObserver cursor(transport.positionSubject());

	transport.move(0.5);
	EXPECT_EQ(cursor.updates(), 0);

	transport.play();
	transport.move(0.5);
	transport.move(0.5);
	EXPECT_EQ(cursor.updates(), 1);
	EXPECT_EQ(cursor.value(), 0.5);

	transport.stop();
	EXPECT_EQ(cursor.updates(), 2);
	EXPECT_EQ(cursor.value(), 0.0);
}


TEST(qmotionTransportTest, StateNames)
{
	EXPECT_STREQ(qmotionTransport::stateName(qmotionTransport::Paused), "PAUSED");
	EXPECT_STREQ(qmotionTransport::stateName(qmotionTransport::Playing), "PLAYING");
	EXPECT_STREQ(qmotionTransport::stateName(qmotionTransport::Recording), "RECORDING");
}


// end of qmotionTransportTest.cpp
