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
#include <cstddef>
#include <array>
#include <vector>

#include "framebuffer.h"

static constexpr int MAX_MEMORY = 0x1000; // Total memory available to the interpreter.
static constexpr int PROGRAM_SPACE = 0x200; // Program space is 0x200 and onwards.
static constexpr int MAX_PROGRAM_SIZE = MAX_MEMORY - PROGRAM_SPACE;
static constexpr int FONT_SPACE = 0x000; // Font data for characters 0-F. Sprite size is 5 bytes.
static constexpr int FONT_SPRITE_SIZE = 5;
static constexpr int STACK_SIZE = 16;
static constexpr int MAX_REGISTERS = 16;
static constexpr int MAX_KEYS = 16;

// Byte addressable 4KB store. Any access outside of it raises InvalidAddress.
class Memory
{
public:
	Memory();

	uint8_t Read(uint32_t address) const;
	void Write(uint32_t address, uint8_t value);
	void Load(uint32_t address, const uint8_t *data, size_t size);
	void Fill(uint32_t address, size_t size, uint8_t value);

private:
	std::array<uint8_t, MAX_MEMORY> bytes;
};

struct Registers
{
	// 16 general purpose 8-bit registers. VF doubles as the flag register.
	uint8_t V[MAX_REGISTERS];
	// 16-bit register generally used to store memory addresses.
	uint16_t I;
	// Register that receives the key index when a key wait completes.
	uint8_t wake;

	void Reset();
};

// 60Hz delay timer. Floors at zero.
struct DelayTimer
{
	uint8_t value;

	void Tick() { if(value > 0) value--; }
};

class Keypad
{
public:
	Keypad() { Reset(); }

	void Reset() { keys = 0; }
	// Keys outside 0-F are ignored.
	void Press(uint8_t key);
	void Release(uint8_t key);
	bool IsPressed(uint8_t key) const;

private:
	// Bit field for currently pressed keys.
	uint16_t keys;
};

// Return addresses for subroutine calls, bounded to STACK_SIZE levels.
class CallStack
{
public:
	CallStack() : depth(0) {}

	void Push(uint16_t address);
	uint16_t Pop();
	void Reset() { depth = 0; }

	int Depth() const { return depth; }
	uint16_t At(int level) const { return entries[level]; }

private:
	std::array<uint16_t, STACK_SIZE> entries;
	int depth;
};

enum class RunState
{
	Running,
	WaitingForKey,
};

// The complete virtual machine state. Owned by the host and passed by
// reference to the executor.
struct Machine
{
	Memory memory;
	Registers registers;
	DelayTimer delayTimer;
	Keypad keypad;
	Framebuffer framebuffer;
	CallStack stack;
	RunState state;
	uint16_t PC;
	SpriteMode spriteMode;

	Machine();

	// Clears all state except for the loaded program and the sprite mode.
	void Reset();
	void LoadProgram(const std::vector<uint8_t> &program);

	void KeyDown(uint8_t key);
	// Completes a pending key wait with the released key.
	void KeyUp(uint8_t key);
	// One 60Hz timer tick.
	void TickTimers();
};
