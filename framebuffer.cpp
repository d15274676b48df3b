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
#include "framebuffer.h"

constexpr int Framebuffer::W;
constexpr int Framebuffer::H;

Framebuffer::Framebuffer()
{
	Clear();
}

int Framebuffer::Cell(int x, int y)
{
	x %= W;
	y %= H;
	if(x < 0) x += W;
	if(y < 0) y += H;

	return W*y + x;
}

bool Framebuffer::GetPixel(int x, int y) const
{
	return display[Cell(x, y)];
}

void Framebuffer::SetPixel(int x, int y, bool on)
{
	display[Cell(x, y)] = on;
	updated = true;
}

void Framebuffer::Clear()
{
	display.reset();
	updated = true;
}

bool Framebuffer::DrawSprite(int x, int y, const uint8_t *rows, int count, SpriteMode mode)
{
	bool collision = false;

	for(int height=0; height<count; height++)
	{
		for(int bit=0; bit<8; bit++)
		{
			if(!((rows[height] >> (7-bit)) & 0x1)) continue;

			int cell = Cell(x+bit, y+height);
			if(mode == SpriteMode::Xor)
			{
				if(display[cell]) collision = true; // Set pixel is being unset.
				display.flip(cell);
			}else if(!display[cell])
			{
				display[cell] = true;
				collision = true;
			}
		}
	}

	updated = true;
	return collision;
}

bool Framebuffer::ConsumeUpdate()
{
	bool result = updated;
	updated = false;
	return result;
}
