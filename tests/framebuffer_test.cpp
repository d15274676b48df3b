/*
Chip-8 Interpreter/Emulator
Copyright (C) 2016  Alex Kowald

This program is free software: you can redistribute it and/or modify
it under the terms of the GNU General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

This program is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU General Public License for more details.

You should have received a copy of the GNU General Public License
along with this program.  If not, see <http://www.gnu.org/licenses/>.
*/
#include <gtest/gtest.h>

#include "framebuffer.h"

static int CountLit(const Framebuffer &fb)
{
	int lit = 0;
	for(int y=0; y<Framebuffer::H; y++)
	{
		for(int x=0; x<Framebuffer::W; x++)
		{
			if(fb.GetPixel(x, y)) lit++;
		}
	}
	return lit;
}

TEST(FramebufferTest, ClearTurnsEveryPixelOff)
{
	Framebuffer fb;
	for(int y=0; y<Framebuffer::H; y++)
	{
		for(int x=0; x<Framebuffer::W; x += 3) fb.SetPixel(x, y, true);
	}
	ASSERT_GT(CountLit(fb), 0);

	fb.Clear();
	EXPECT_EQ(CountLit(fb), 0);
}

TEST(FramebufferTest, CoordinatesWrapAroundTheEdges)
{
	Framebuffer fb;
	fb.SetPixel(Framebuffer::W, Framebuffer::H, true);
	EXPECT_TRUE(fb.GetPixel(0, 0));

	fb.SetPixel(-1, -1, true);
	EXPECT_TRUE(fb.GetPixel(Framebuffer::W-1, Framebuffer::H-1));
	EXPECT_EQ(CountLit(fb), 2);
}

TEST(FramebufferTest, FullRowOnBlankScreenSetsPixelsAndReportsThem)
{
	Framebuffer fb;
	const uint8_t row = 0xFF;

	EXPECT_TRUE(fb.DrawSprite(0, 0, &row, 1, SpriteMode::TurnOnOnly));
	for(int x=0; x<8; x++) EXPECT_TRUE(fb.GetPixel(x, 0)) << "x=" << x;
	EXPECT_FALSE(fb.GetPixel(8, 0));
	EXPECT_EQ(CountLit(fb), 8);
}

TEST(FramebufferTest, RedrawOnLitPixelsLeavesThemOn)
{
	Framebuffer fb;
	const uint8_t row = 0xFF;
	fb.DrawSprite(0, 0, &row, 1, SpriteMode::TurnOnOnly);

	EXPECT_FALSE(fb.DrawSprite(0, 0, &row, 1, SpriteMode::TurnOnOnly));
	for(int x=0; x<8; x++) EXPECT_TRUE(fb.GetPixel(x, 0)) << "x=" << x;
	EXPECT_EQ(CountLit(fb), 8);
}

TEST(FramebufferTest, PartialOverlapReportsOnlyNewPixels)
{
	Framebuffer fb;
	const uint8_t left = 0xF0;
	const uint8_t all = 0xFF;
	fb.DrawSprite(10, 5, &left, 1, SpriteMode::TurnOnOnly);

	EXPECT_TRUE(fb.DrawSprite(10, 5, &all, 1, SpriteMode::TurnOnOnly));
	EXPECT_EQ(CountLit(fb), 8);
}

TEST(FramebufferTest, ClearBitsLeavePixelsUntouched)
{
	Framebuffer fb;
	fb.SetPixel(1, 0, true);
	const uint8_t row = 0x80; // Only the leftmost pixel.

	fb.DrawSprite(0, 0, &row, 1, SpriteMode::TurnOnOnly);
	EXPECT_TRUE(fb.GetPixel(0, 0));
	EXPECT_TRUE(fb.GetPixel(1, 0));

	fb.DrawSprite(0, 0, &row, 1, SpriteMode::Xor);
	EXPECT_FALSE(fb.GetPixel(0, 0));
	EXPECT_TRUE(fb.GetPixel(1, 0));
}

TEST(FramebufferTest, SpriteWrapsColumnsToTheLeftEdge)
{
	Framebuffer fb;
	const uint8_t row = 0xFF;
	fb.DrawSprite(60, 0, &row, 1, SpriteMode::TurnOnOnly);

	for(int x=60; x<64; x++) EXPECT_TRUE(fb.GetPixel(x, 0)) << "x=" << x;
	for(int x=0; x<4; x++) EXPECT_TRUE(fb.GetPixel(x, 0)) << "x=" << x;
	for(int x=4; x<60; x++) EXPECT_FALSE(fb.GetPixel(x, 0)) << "x=" << x;
}

TEST(FramebufferTest, SpriteWrapsRowsToTheTopEdge)
{
	Framebuffer fb;
	const uint8_t rows[3] = {0x80, 0x80, 0x80};
	fb.DrawSprite(0, 30, rows, 3, SpriteMode::TurnOnOnly);

	EXPECT_TRUE(fb.GetPixel(0, 30));
	EXPECT_TRUE(fb.GetPixel(0, 31));
	EXPECT_TRUE(fb.GetPixel(0, 0));
	EXPECT_EQ(CountLit(fb), 3);
}

TEST(FramebufferTest, OriginOutsideOfTheScreenWraps)
{
	Framebuffer fb;
	const uint8_t row = 0x80;
	fb.DrawSprite(70, 35, &row, 1, SpriteMode::TurnOnOnly);

	EXPECT_TRUE(fb.GetPixel(6, 3));
	EXPECT_EQ(CountLit(fb), 1);
}

TEST(FramebufferTest, EmptySpriteDrawsNothing)
{
	Framebuffer fb;

	EXPECT_FALSE(fb.DrawSprite(0, 0, nullptr, 0, SpriteMode::TurnOnOnly));
	EXPECT_EQ(CountLit(fb), 0);
}

TEST(FramebufferTest, XorModeTogglesAndReportsErasedPixels)
{
	Framebuffer fb;
	const uint8_t row = 0xFF;

	EXPECT_FALSE(fb.DrawSprite(0, 0, &row, 1, SpriteMode::Xor));
	EXPECT_EQ(CountLit(fb), 8);

	EXPECT_TRUE(fb.DrawSprite(0, 0, &row, 1, SpriteMode::Xor));
	EXPECT_EQ(CountLit(fb), 0);
}

TEST(FramebufferTest, UpdateIsConsumedOnce)
{
	Framebuffer fb;
	fb.ConsumeUpdate();
	EXPECT_FALSE(fb.ConsumeUpdate());

	fb.SetPixel(3, 3, true);
	EXPECT_TRUE(fb.ConsumeUpdate());
	EXPECT_FALSE(fb.ConsumeUpdate());

	fb.Clear();
	EXPECT_TRUE(fb.ConsumeUpdate());
}
