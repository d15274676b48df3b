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
#include <random>
#include <stdexcept>

#include "cpu.h"
#include "fault.h"
#include "machine.h"

static std::mt19937 &Rng()
{
	static std::mt19937 rng(std::random_device{}());
	return rng;
}

static void Skip(Machine &m, bool condition)
{
	if(condition) m.PC += 2;
}

uint16_t Fetch(Machine &machine)
{
	// All instructions are 2 bytes long and stored in big-endian fashion.
	uint16_t opCode = (machine.memory.Read(machine.PC) << 8)|machine.memory.Read(machine.PC+1);
	machine.PC += 2;

	return opCode;
}

static void OpClearScreen(Machine &m, const Instruction &)
{
	m.framebuffer.Clear();
}

static void OpReturn(Machine &m, const Instruction &)
{
	m.PC = m.stack.Pop();
}

static void OpJump(Machine &m, const Instruction &ins)
{
	m.PC = ins.nnn;
}

static void OpCall(Machine &m, const Instruction &ins)
{
	m.stack.Push(m.PC);
	m.PC = ins.nnn;
}

static void OpAddWithCarry(Machine &m, const Instruction &ins)
{
	uint8_t *V = m.registers.V;
	uint16_t sum = V[ins.x] + V[ins.y];
	V[ins.x] = sum & 0xFF;
	V[0xF] = (sum >> 8);
}

static void OpSubtract(Machine &m, const Instruction &ins)
{
	uint8_t *V = m.registers.V;
	uint8_t flag = V[ins.y] > V[ins.x] ? 0 : 1;
	V[ins.x] = V[ins.x] - V[ins.y];
	V[0xF] = flag;
}

static void OpSubtractReversed(Machine &m, const Instruction &ins)
{
	uint8_t *V = m.registers.V;
	uint8_t flag = V[ins.x] > V[ins.y] ? 0 : 1;
	V[ins.x] = V[ins.y] - V[ins.x];
	V[0xF] = flag;
}

// The flag is taken from Vy before anything is written so that x = F still
// ends with the shifted out bit in VF.
static void OpShiftRight(Machine &m, const Instruction &ins)
{
	uint8_t *V = m.registers.V;
	uint8_t vy = V[ins.y];
	V[ins.x] = vy >> 1;
	V[0xF] = vy & 0x1;
}

static void OpShiftLeft(Machine &m, const Instruction &ins)
{
	uint8_t *V = m.registers.V;
	uint8_t vy = V[ins.y];
	V[ins.x] = vy << 1;
	V[0xF] = vy >> 7;
}

static void OpRandom(Machine &m, const Instruction &ins)
{
	m.registers.V[ins.x] = std::uniform_int_distribution<unsigned int>(0, 255)(Rng()) & ins.kk;
}

static void OpDraw(Machine &m, const Instruction &ins)
{
	uint8_t rows[15];
	for(int height=0; height<ins.n; height++)
	{
		rows[height] = m.memory.Read(m.registers.I + height);
	}

	bool collision = m.framebuffer.DrawSprite(m.registers.V[ins.x], m.registers.V[ins.y], rows, ins.n, m.spriteMode);
	m.registers.V[0xF] = collision ? 0x1 : 0x0;
}

static void OpWaitForKey(Machine &m, const Instruction &ins)
{
	m.registers.wake = ins.x;
	m.state = RunState::WaitingForKey;
}

static void OpFontAddress(Machine &m, const Instruction &ins)
{
	m.registers.I = (FONT_SPACE + m.registers.V[ins.x] * FONT_SPRITE_SIZE) % MAX_MEMORY;
}

static void OpStoreBCD(Machine &m, const Instruction &ins)
{
	uint8_t value = m.registers.V[ins.x];
	uint32_t I = m.registers.I;

	m.memory.Write(I, (value / 100) % 10);
	m.memory.Write(I+1, (value / 10) % 10);
	m.memory.Write(I+2, value % 10);
}

static void OpStoreRegisters(Machine &m, const Instruction &ins)
{
	for(int i=0; i<=ins.x; i++)
	{
		m.memory.Write(m.registers.I + i, m.registers.V[i]);
	}
	m.registers.I += ins.x+1;
}

static void OpLoadRegisters(Machine &m, const Instruction &ins)
{
	for(int i=0; i<=ins.x; i++)
	{
		m.registers.V[i] = m.memory.Read(m.registers.I + i);
	}
	m.registers.I += ins.x+1;
}

void Execute(Machine &machine, const Instruction &ins)
{
	Machine &m = machine;
	uint8_t *V = m.registers.V;

	switch(ins.op)
	{
		case Op::CLS: OpClearScreen(m, ins); break;
		case Op::RET: OpReturn(m, ins); break;
		case Op::JP: OpJump(m, ins); break;
		case Op::CALL: OpCall(m, ins); break;
		case Op::SE_BYTE: Skip(m, V[ins.x] == ins.kk); break;
		case Op::SNE_BYTE: Skip(m, V[ins.x] != ins.kk); break;
		case Op::SE_REG: Skip(m, V[ins.x] == V[ins.y]); break;
		case Op::LD_BYTE: V[ins.x] = ins.kk; break;
		case Op::ADD_BYTE: V[ins.x] += ins.kk; break;
		case Op::LD_REG: V[ins.x] = V[ins.y]; break;
		case Op::OR:
			V[ins.x] |= V[ins.y];
			V[0xF] = 0x0;
			break;
		case Op::AND:
			V[ins.x] &= V[ins.y];
			V[0xF] = 0x0;
			break;
		case Op::XOR:
			V[ins.x] ^= V[ins.y];
			V[0xF] = 0x0;
			break;
		case Op::ADD_REG: OpAddWithCarry(m, ins); break;
		case Op::SUB: OpSubtract(m, ins); break;
		case Op::SHR: OpShiftRight(m, ins); break;
		case Op::SUBN: OpSubtractReversed(m, ins); break;
		case Op::SHL: OpShiftLeft(m, ins); break;
		case Op::SNE_REG: Skip(m, V[ins.x] != V[ins.y]); break;
		case Op::LD_I: m.registers.I = ins.nnn; break;
		case Op::JP_V0: m.PC = ins.nnn + V[0]; break;
		case Op::RND: OpRandom(m, ins); break;
		case Op::DRW: OpDraw(m, ins); break;
		case Op::SKP: Skip(m, m.keypad.IsPressed(V[ins.x])); break;
		case Op::SKNP: Skip(m, !m.keypad.IsPressed(V[ins.x])); break;
		case Op::LD_VX_DT: V[ins.x] = m.delayTimer.value; break;
		case Op::LD_VX_K: OpWaitForKey(m, ins); break;
		case Op::LD_DT_VX: m.delayTimer.value = V[ins.x]; break;
		case Op::LD_ST_VX: break; // No sound support.
		case Op::ADD_I_VX: m.registers.I += V[ins.x]; break;
		case Op::LD_F_VX: OpFontAddress(m, ins); break;
		case Op::LD_B_VX: OpStoreBCD(m, ins); break;
		case Op::LD_MEM_VX: OpStoreRegisters(m, ins); break;
		case Op::LD_VX_MEM: OpLoadRegisters(m, ins); break;
	}
}

Instruction Step(Machine &machine)
{
	if(machine.state == RunState::WaitingForKey)
	{
		throw std::logic_error("Step called while waiting for a key");
	}

	uint16_t address = machine.PC;
	uint16_t opCode = 0x0000;
	try
	{
		opCode = Fetch(machine);
		Instruction ins = Decode(opCode);
		Execute(machine, ins);
		return ins;
	}catch(Fault &fault)
	{
		fault.SetLocation(address, opCode);
		throw;
	}
}
