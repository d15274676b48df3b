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
#include <cstdio>
#include <cstring>
#include <string>

#include "fault.h"
#include "machine.h"

static const uint8_t fonts[16 * FONT_SPRITE_SIZE] = {
	0xF0, 0x90, 0x90, 0x90, 0xF0, // 0
	0x20, 0x60, 0x20, 0x20, 0x70, // 1
	0xF0, 0x10, 0xF0, 0x80, 0xF0, // 2
	0xF0, 0x10, 0xF0, 0x10, 0xF0, // 3
	0x90, 0x90, 0xF0, 0x10, 0x10, // 4
	0xF0, 0x80, 0xF0, 0x10, 0xF0, // 5
	0xF0, 0x80, 0xF0, 0x90, 0xF0, // 6
	0xF0, 0x10, 0x20, 0x40, 0x40, // 7
	0xF0, 0x90, 0xF0, 0x90, 0xF0, // 8
	0xF0, 0x90, 0xF0, 0x10, 0xF0, // 9
	0xF0, 0x90, 0xF0, 0x90, 0x90, // A
	0xE0, 0x90, 0xE0, 0x90, 0xE0, // B
	0xF0, 0x80, 0x80, 0x80, 0xF0, // C
	0xE0, 0x90, 0x90, 0x90, 0xE0, // D
	0xF0, 0x80, 0xF0, 0x80, 0xF0, // E
	0xF0, 0x80, 0xF0, 0x80, 0x80, // F
};

static std::string AddressError(const char *what, uint32_t address)
{
	char message[64];
	snprintf(message, sizeof(message), "%s 0x%X is outside of memory", what, address);
	return message;
}

Memory::Memory()
{
	bytes.fill(0x00);
}

uint8_t Memory::Read(uint32_t address) const
{
	if(address >= MAX_MEMORY) throw Fault(Fault::InvalidAddress, AddressError("Read from", address));

	return bytes[address];
}

void Memory::Write(uint32_t address, uint8_t value)
{
	if(address >= MAX_MEMORY) throw Fault(Fault::InvalidAddress, AddressError("Write to", address));

	bytes[address] = value;
}

void Memory::Load(uint32_t address, const uint8_t *data, size_t size)
{
	if(address > MAX_MEMORY || size > MAX_MEMORY - address)
	{
		throw Fault(Fault::InvalidAddress, AddressError("Block ending at", address + size));
	}

	if(size > 0) std::memcpy(bytes.data() + address, data, size);
}

void Memory::Fill(uint32_t address, size_t size, uint8_t value)
{
	if(address > MAX_MEMORY || size > MAX_MEMORY - address)
	{
		throw Fault(Fault::InvalidAddress, AddressError("Block ending at", address + size));
	}

	std::memset(bytes.data() + address, value, size);
}

void Registers::Reset()
{
	for(auto &reg: V) reg = 0x00;
	I = 0x0000;
	wake = 0x00;
}

void Keypad::Press(uint8_t key)
{
	if(key >= MAX_KEYS) return;

	keys |= (1 << key);
}

void Keypad::Release(uint8_t key)
{
	if(key >= MAX_KEYS) return;

	keys &= ~(1 << key);
}

bool Keypad::IsPressed(uint8_t key) const
{
	if(key >= MAX_KEYS) return false;

	return keys & (1 << key);
}

void CallStack::Push(uint16_t address)
{
	if(depth >= STACK_SIZE) throw Fault(Fault::StackOverflow, "Stack overflow");

	entries[depth++] = address;
}

uint16_t CallStack::Pop()
{
	if(depth <= 0) throw Fault(Fault::StackUnderflow, "Return with an empty stack");

	return entries[--depth];
}

Machine::Machine()
	: state(RunState::Running), PC(PROGRAM_SPACE), spriteMode(SpriteMode::TurnOnOnly)
{
	Reset();
}

void Machine::Reset()
{
	memory.Load(FONT_SPACE, fonts, sizeof(fonts));

	registers.Reset();
	delayTimer.value = 0x00;
	keypad.Reset();
	framebuffer.Clear();
	stack.Reset();

	state = RunState::Running;
	PC = PROGRAM_SPACE;
}

void Machine::LoadProgram(const std::vector<uint8_t> &program)
{
	if(program.size() > MAX_PROGRAM_SIZE)
	{
		throw Fault(Fault::InvalidAddress, AddressError("Program ending at", PROGRAM_SPACE + program.size()));
	}

	memory.Fill(PROGRAM_SPACE, MAX_PROGRAM_SIZE, 0x00);
	if(!program.empty()) memory.Load(PROGRAM_SPACE, program.data(), program.size());

	Reset();
}

void Machine::KeyDown(uint8_t key)
{
	keypad.Press(key);
}

void Machine::KeyUp(uint8_t key)
{
	if(key >= MAX_KEYS) return;

	keypad.Release(key);

	if(state == RunState::WaitingForKey)
	{
		registers.V[registers.wake & 0xF] = key;
		state = RunState::Running;
	}
}

void Machine::TickTimers()
{
	delayTimer.Tick();
}
