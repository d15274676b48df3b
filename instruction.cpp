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
#include <string>

#include "fault.h"
#include "instruction.h"

static Instruction Make(uint16_t opCode, Op op)
{
	Instruction ins;
	ins.opCode = opCode;
	ins.op = op;
	ins.x = (opCode >> 8) & 0xF;
	ins.y = (opCode >> 4) & 0xF;
	ins.n = opCode & 0xF;
	ins.kk = opCode & 0xFF;
	ins.nnn = opCode & 0xFFF;
	return ins;
}

static Fault Unknown(uint16_t opCode)
{
	char message[48];
	snprintf(message, sizeof(message), "Unhandled opcode 0x%04X", opCode);
	return Fault(Fault::UnknownInstruction, message);
}

Instruction Decode(uint16_t opCode)
{
	uint8_t w = (opCode >> 12) & 0xF;
	uint8_t z = opCode & 0xF;
	uint8_t kk = opCode & 0xFF;

	switch(w)
	{
		case 0x0:
			if(opCode == 0x00E0) return Make(opCode, Op::CLS);
			if(opCode == 0x00EE) return Make(opCode, Op::RET);
			break;
		case 0x1: return Make(opCode, Op::JP);
		case 0x2: return Make(opCode, Op::CALL);
		case 0x3: return Make(opCode, Op::SE_BYTE);
		case 0x4: return Make(opCode, Op::SNE_BYTE);
		case 0x5:
			if(z == 0x0) return Make(opCode, Op::SE_REG);
			break;
		case 0x6: return Make(opCode, Op::LD_BYTE);
		case 0x7: return Make(opCode, Op::ADD_BYTE);
		case 0x8:
			switch(z)
			{
				case 0x0: return Make(opCode, Op::LD_REG);
				case 0x1: return Make(opCode, Op::OR);
				case 0x2: return Make(opCode, Op::AND);
				case 0x3: return Make(opCode, Op::XOR);
				case 0x4: return Make(opCode, Op::ADD_REG);
				case 0x5: return Make(opCode, Op::SUB);
				case 0x6: return Make(opCode, Op::SHR);
				case 0x7: return Make(opCode, Op::SUBN);
				case 0xE: return Make(opCode, Op::SHL);
			}
			break;
		case 0x9:
			if(z == 0x0) return Make(opCode, Op::SNE_REG);
			break;
		case 0xA: return Make(opCode, Op::LD_I);
		case 0xB: return Make(opCode, Op::JP_V0);
		case 0xC: return Make(opCode, Op::RND);
		case 0xD: return Make(opCode, Op::DRW);
		case 0xE:
			if(kk == 0x9E) return Make(opCode, Op::SKP);
			if(kk == 0xA1) return Make(opCode, Op::SKNP);
			break;
		case 0xF:
			switch(kk)
			{
				case 0x07: return Make(opCode, Op::LD_VX_DT);
				case 0x0A: return Make(opCode, Op::LD_VX_K);
				case 0x15: return Make(opCode, Op::LD_DT_VX);
				case 0x18: return Make(opCode, Op::LD_ST_VX);
				case 0x1E: return Make(opCode, Op::ADD_I_VX);
				case 0x29: return Make(opCode, Op::LD_F_VX);
				case 0x33: return Make(opCode, Op::LD_B_VX);
				case 0x55: return Make(opCode, Op::LD_MEM_VX);
				case 0x65: return Make(opCode, Op::LD_VX_MEM);
			}
			break;
	}

	throw Unknown(opCode);
}

const char *Describe(Op op)
{
	switch(op)
	{
		case Op::CLS: return "00E0 - CLS: Clear the display.";
		case Op::RET: return "00EE - RET: Return from a subroutine.";
		case Op::JP: return "1nnn - JP addr: Jump to location nnn.";
		case Op::CALL: return "2nnn - CALL addr: Call subroutine at nnn.";
		case Op::SE_BYTE: return "3xkk - SE Vx, byte: Skip next instruction if Vx = kk.";
		case Op::SNE_BYTE: return "4xkk - SNE Vx, byte: Skip next instruction if Vx != kk.";
		case Op::SE_REG: return "5xy0 - SE Vx, Vy: Skip next instruction if Vx = Vy.";
		case Op::LD_BYTE: return "6xkk - LD Vx, byte: Set Vx = kk.";
		case Op::ADD_BYTE: return "7xkk - ADD Vx, byte: Set Vx = Vx + kk.";
		case Op::LD_REG: return "8xy0 - LD Vx, Vy: Set Vx = Vy.";
		case Op::OR: return "8xy1 - OR Vx, Vy: Set Vx = Vx OR Vy, set VF = 0.";
		case Op::AND: return "8xy2 - AND Vx, Vy: Set Vx = Vx AND Vy, set VF = 0.";
		case Op::XOR: return "8xy3 - XOR Vx, Vy: Set Vx = Vx XOR Vy, set VF = 0.";
		case Op::ADD_REG: return "8xy4 - ADD Vx, Vy: Set Vx = Vx + Vy, set VF = carry.";
		case Op::SUB: return "8xy5 - SUB Vx, Vy: Set Vx = Vx - Vy, set VF = NOT borrow.";
		case Op::SHR: return "8xy6 - SHR Vx {, Vy}: Set Vx = Vy SHR 1.";
		case Op::SUBN: return "8xy7 - SUBN Vx, Vy: Set Vx = Vy - Vx, set VF = NOT borrow.";
		case Op::SHL: return "8xyE - SHL Vx {, Vy}: Set Vx = Vy SHL 1.";
		case Op::SNE_REG: return "9xy0 - SNE Vx, Vy: Skip next instruction if Vx != Vy.";
		case Op::LD_I: return "Annn - LD I, addr: Set I = nnn.";
		case Op::JP_V0: return "Bnnn - JP V0, addr: Jump to location nnn + V0.";
		case Op::RND: return "Cxkk - RND Vx, byte: Set Vx = random byte AND kk.";
		case Op::DRW: return "Dxyn - DRW Vx, Vy, nibble: Display n-byte sprite starting at memory location I at (Vx, Vy), set VF = collision.";
		case Op::SKP: return "Ex9E - SKP Vx: Skip next instruction if key with the value of Vx is pressed.";
		case Op::SKNP: return "ExA1 - SKNP Vx: Skip next instruction if key with the value of Vx is not pressed.";
		case Op::LD_VX_DT: return "Fx07 - LD Vx, DT: Set Vx = delay timer value.";
		case Op::LD_VX_K: return "Fx0A - LD Vx, K: Wait for a key release, store the value of the key in Vx.";
		case Op::LD_DT_VX: return "Fx15 - LD DT, Vx: Set delay timer = Vx.";
		case Op::LD_ST_VX: return "Fx18 - LD ST, Vx: Set sound timer = Vx. No sound support, ignored.";
		case Op::ADD_I_VX: return "Fx1E - ADD I, Vx: Set I = I + Vx.";
		case Op::LD_F_VX: return "Fx29 - LD F, Vx: Set I = location of sprite for digit Vx.";
		case Op::LD_B_VX: return "Fx33 - LD B, Vx: Store BCD representation of Vx in memory locations I, I+1, and I+2.";
		case Op::LD_MEM_VX: return "Fx55 - LD [I], Vx: Store registers V0 through Vx in memory starting at location I.";
		case Op::LD_VX_MEM: return "Fx65 - LD Vx, [I]: Read registers V0 through Vx from memory starting at location I.";
	}

	return "????";
}
