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
#pragma once

#include <cstdint>
#include <bitset>

enum class SpriteMode
{
	// A set sprite bit turns its pixel on. Pixels that are already on stay on.
	// VF reports whether any pixel was newly turned on.
	TurnOnOnly,
	// A set sprite bit toggles its pixel. VF reports whether any pixel was turned off.
	Xor,
};

// Monochrome 64x32 display. Coordinates wrap around the screen edges.
class Framebuffer
{
public:
	static constexpr int W = 64; // Width of the screen in pixels.
	static constexpr int H = 32; // Height of the screen in pixels.

	Framebuffer();

	bool GetPixel(int x, int y) const;
	void SetPixel(int x, int y, bool on);
	void Clear();

	// Draws count rows of 8 pixels each with the top left corner at (x, y).
	// Returns the collision flag for the given mode.
	bool DrawSprite(int x, int y, const uint8_t *rows, int count, SpriteMode mode);

	// True once after any change to the pixels.
	bool ConsumeUpdate();

private:
	static int Cell(int x, int y);

	std::bitset<W*H> display;
	bool updated;
};
