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
#include <string>

#include "machine.h"

struct SDL_Window;
struct SDL_Renderer;
struct SDL_Texture;

// SDL host for a Machine: owns the window, maps keys, paces frames and
// drives the executor.
class Emulator
{
public:
	Emulator();
	~Emulator();

	bool LoadProgram(const std::string &fileName);
	void Run();
	void SetBackgroundColor(uint32_t color);
	void SetForegroundColor(uint32_t color);
	void SetIPS(uint32_t ips) { this->ips = ips; };
	void SetPixelScale(unsigned int pixelScale) { this->pixelScale = pixelScale; };
	void SetSpriteMode(SpriteMode mode) { machine.spriteMode = mode; };
	void EnableDebug(bool enable) { debug = enable; };

private:
	static constexpr int W = Framebuffer::W;
	static constexpr int H = Framebuffer::H;
	static constexpr unsigned int FPS = 60;

	Machine machine;

	SDL_Window *window;
	SDL_Renderer *renderer;
	SDL_Texture *texture;

	uint32_t *pixels;
	uint32_t background;
	uint32_t foreground;

	uint32_t ips;

	bool init;
	bool halt;
	bool debug;
	int debugState;
	unsigned int pixelScale;

	void Reset();
	void ExecuteInstruction();

	bool InitSDL();
	void CleanupSDL();

	void DrawScreen();
	void DumpRegisters();
	void DumpDisplay();
	void Halt(const std::string &reason);
	bool DebuggerHandler();
};
