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
#include <sys/stat.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <chrono>
#include <algorithm>
#include <unordered_map>
#include <vector>
#include <SDL.h>

#include "emulator.h"
#include "cpu.h"
#include "fault.h"

#define PRINT_DEBUG_INSTRUCTION(addr, opCode, name) \
	if(debug) printf("0x%04X:0x%04X - %s\n", addr, opCode, name);

enum
{
	DebugState_StepInto=0,
	DebugState_Run,
};

constexpr int Emulator::W;
constexpr int Emulator::H;
constexpr unsigned int Emulator::FPS;

Emulator::Emulator()
{
	texture = nullptr;
	renderer = nullptr;
	window = nullptr;

	pixels = new uint32_t[W*H]();
	background = 0x000000; // Black.
	foreground = 0xFFFFFF; // White.

	init = false;
	debug = false;
	ips = 600; // Instructions per second.
	pixelScale = 16;

	Reset();

	if(SDL_Init(SDL_INIT_VIDEO|SDL_INIT_EVENTS) != 0)
	{
		printf("SDL_Init error: %s\n", SDL_GetError());
	}
}

Emulator::~Emulator()
{
	delete[] pixels;

	CleanupSDL();
	SDL_Quit();
}

void Emulator::Reset()
{
	machine.Reset();

	halt = false;
	debugState = DebugState_StepInto;
}

void Emulator::SetBackgroundColor(uint32_t color)
{
	color = std::min(color, 0xFFFFFFu);
	background = color;
}

void Emulator::SetForegroundColor(uint32_t color)
{
	color = std::min(color, 0xFFFFFFu);
	foreground = color;
};

void Emulator::CleanupSDL()
{
	init = false;

	if(texture != nullptr)
	{
		SDL_DestroyTexture(texture);
		texture = nullptr;
	}
	if(renderer != nullptr)
	{
		SDL_DestroyRenderer(renderer);
		renderer = nullptr;
	}
	if(window != nullptr)
	{
		SDL_DestroyWindow(window);
		window = nullptr;
	}
}

bool Emulator::InitSDL()
{
	CleanupSDL();

	// Check to see if the call to SDL_Init() was successful.
	Uint32 mask = SDL_INIT_VIDEO|SDL_INIT_EVENTS;
	if(SDL_WasInit(mask) != mask)
	{
		printf("SDL is not initialized.\n");
		return false;
	}

	window = SDL_CreateWindow("chip8vm", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, W*pixelScale, H*pixelScale, SDL_WINDOW_SHOWN);
	if(window == nullptr)
	{
		printf("SDL_CreateWindow error: %s\n", SDL_GetError());
		return false;
	}

	renderer = SDL_CreateRenderer(window, -1, SDL_RENDERER_ACCELERATED);
	if(renderer == nullptr)
	{
		printf("SDL_CreateRenderer error: %s\n", SDL_GetError());
		return false;
	}

	texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGB888, SDL_TEXTUREACCESS_STREAMING, W, H);
	if(texture == nullptr)
	{
		printf("SDL_CreateTexture error: %s\n", SDL_GetError());
		return false;
	}

	return true;
}

bool Emulator::LoadProgram(const std::string &fileName)
{
	// Make sure the program is an acceptable size.
	struct stat status;
	int success = stat(fileName.c_str(), &status);
	if(success != 0 || status.st_size <= 0 || status.st_size > MAX_PROGRAM_SIZE)
	{
		if(success == -1)
		{
			printf("Failed to load program.. Missing or invalid file: %s\n", fileName.c_str());
		}else{
			printf("Failed to load program.. Program size of %ld bytes is outside of 1-%d bytes.\n", (long int)status.st_size, MAX_PROGRAM_SIZE);
		}

		return false;
	}

	std::ifstream input(fileName.c_str(), std::ios::in|std::ios::binary);
	if (!input.is_open())
	{
		printf("Failed to load program.. Failed to open file: %s\n", fileName.c_str());
		return false;
	}

	std::vector<uint8_t> program((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
	try
	{
		machine.LoadProgram(program);
	}catch(const Fault &fault)
	{
		printf("Failed to load program.. %s\n", fault.what());
		return false;
	}
	printf("Loaded program.. %s (%ld bytes)\n", fileName.c_str(), (long int)program.size());

	Reset();

	return true;
}

void Emulator::DrawScreen()
{
	if(!init) return;
	if(!machine.framebuffer.ConsumeUpdate()) return; // Don't draw the screen unless it has changed.

	for(int y=0; y<H; y++)
	{
		for(int x=0; x<W; x++)
		{
			pixels[W*y + x] = machine.framebuffer.GetPixel(x, y) ? foreground : background;
		}
	}

	SDL_UpdateTexture(texture, NULL, pixels, W*sizeof(uint32_t));

	SDL_RenderCopy(renderer, texture, NULL, NULL);
	SDL_RenderPresent(renderer);
}

void Emulator::Run()
{
	if(!InitSDL())
	{
		CleanupSDL();

		printf("Failed to run: SDL setup failed!\n");
		return;
	}

	init = true; // Created the SDL window successfully!

	unsigned int insPerFrame = std::max(1u, ips/FPS/2);
	unsigned int consecutiveIns = 0;
	unsigned int framesFinished = 0;

	SDL_Event event;
	bool running = true;
	auto start = std::chrono::high_resolution_clock::now();

	printf("Running program at: %u IPS.. (%u)\n", ips, insPerFrame);

	static std::unordered_map<int, int> keymap = {
		{SDL_SCANCODE_1, 0x1}, {SDL_SCANCODE_2, 0x2}, {SDL_SCANCODE_3, 0x3}, {SDL_SCANCODE_4, 0xC},
		{SDL_SCANCODE_Q, 0x4}, {SDL_SCANCODE_W, 0x5}, {SDL_SCANCODE_E, 0x6}, {SDL_SCANCODE_R, 0xD},
		{SDL_SCANCODE_A, 0x7}, {SDL_SCANCODE_S, 0x8}, {SDL_SCANCODE_D, 0x9}, {SDL_SCANCODE_F, 0xE},
		{SDL_SCANCODE_Z, 0xA}, {SDL_SCANCODE_X, 0x0}, {SDL_SCANCODE_C, 0xB}, {SDL_SCANCODE_V, 0xF},
	};

	while(running && !halt)
	{
		// Execute CPU for consecutiveIns OR until the CPU is waiting for a key to be released.
		for(unsigned int i=0; i<consecutiveIns && !halt && machine.state == RunState::Running; i++)
		{
			ExecuteInstruction();
		}
		// Handle window events.
		while(SDL_PollEvent(&event))
		{
			switch(event.type)
			{
				case SDL_QUIT:
					running = false;
					break;
				case SDL_KEYUP:
				case SDL_KEYDOWN:
					if(event.type == SDL_KEYDOWN && event.key.keysym.scancode == SDL_SCANCODE_C && (event.key.keysym.mod & KMOD_CTRL))
					{
						running = false;
						break;
					}

					auto key = keymap.find(event.key.keysym.scancode);
					if(key == keymap.end()) break;

					if(event.type == SDL_KEYDOWN)
					{
						machine.KeyDown(key->second);
					}else{
						machine.KeyUp(key->second);
					}
			}
		}

		std::chrono::duration<double> elapsedSeconds = std::chrono::high_resolution_clock::now() - start;
		int frames = int(elapsedSeconds.count() * FPS) - framesFinished;
		if(frames > 0)
		{
			framesFinished += frames;
			// The delay timer decrements once per frame at a rate of 60 Hz.
			for(int i=0; i<frames; i++) machine.TickTimers();

			DrawScreen();
		}

		consecutiveIns = std::max(1, frames) * insPerFrame;
		if(machine.state == RunState::WaitingForKey || !frames) SDL_Delay(1000/FPS);
	}

	printf("Program terminated.\n");

	CleanupSDL(); // Finished running so destroy the window. SDL still remains initialized until the object is destroyed.
}

void Emulator::DumpRegisters()
{
	const Registers &regs = machine.registers;

	printf("Register dump:\n\t  0   1   2   3   4   5   6   7   8   9   A   B   C   D   E   F\nV[]\t= ");
	for(int i=0; i<MAX_REGISTERS; i++) printf("%03X ", regs.V[i]);
	printf("\nS[]\t= ");
	for(int i=0; i<machine.stack.Depth(); i++) printf("%03X ", machine.stack.At(i));

	printf("\nSP\t= 0x%X\nI\t= 0x%X\nPC\t= 0x%X\nDT\t= 0x%X\n", machine.stack.Depth(), regs.I, machine.PC, machine.delayTimer.value);
}

void Emulator::DumpDisplay()
{
	printf("Display dump:");

	for(int y=0; y<H; y++)
	{
		printf("\n%2d: ", y+1);
		for(int x=0; x<W; x++)
		{
			if(machine.framebuffer.GetPixel(x, y))
				printf("X "); // Pixel set.
			else
				printf("- "); // Pixel unset.
		}
	}
	printf("\n");
}

void Emulator::Halt(const std::string &reason)
{
	halt = true;

	printf("Program halted: %s\n", reason.c_str());

	if(debug)
	{
		DumpRegisters();
	}
}

void PrintDebugHelp()
{
	printf("Debug mode is enabled. Use the following commands to execute the program:\n h - display this message\n n - continue to next instruction\n r - show all register values\n c - continue until interrupted\n d - show display state\n q - Stop debugger\n");
}

// Return true to execute the next instruction, false otherwise.
bool Emulator::DebuggerHandler()
{
	// Crude implementation of a debugger.
	if(debugState == DebugState_Run) return true;

	static bool once = false;
	if(!once)
	{
		once = true;
		PrintDebugHelp();
	}

	std::string command;
	while(true)
	{
		printf(":");
		if(!(std::cin >> command))
		{
			halt = true;
			return false;
		}
		char c = command.at(0);
		if(c == 'h')
		{
			// Requested help.
			PrintDebugHelp();
		}else if(c == 'n')
		{
			// Execute the next instruction.
			break;
		}else if(c == 'r')
		{
			// Show the value of all registers.
			DumpRegisters();
		}else if(c == 'c')
		{
			// Continue executing instructions until interrupted.
			debugState = DebugState_Run;
			break;
		}else if(c == 'd')
		{
			// Show the display state.
			DumpDisplay();
		}else if(c == 'q')
		{
			halt = true;
			return false;
		}
	}

	return true;
}

void Emulator::ExecuteInstruction()
{
	if(halt) return;

	if(debug)
	{
		if(!DebuggerHandler())
		{
			return;
		}
	}

	uint16_t address = machine.PC;
	try
	{
		Instruction ins = Step(machine);
		PRINT_DEBUG_INSTRUCTION(address, ins.opCode, Describe(ins.op));
	}catch(const Fault &fault)
	{
		Halt(fault.Describe());
	}
}
