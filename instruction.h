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

// One case per CHIP-8 instruction. Named after the mnemonics in Cowgod's reference.
enum class Op
{
	CLS,        // 00E0
	RET,        // 00EE
	JP,         // 1nnn
	CALL,       // 2nnn
	SE_BYTE,    // 3xkk
	SNE_BYTE,   // 4xkk
	SE_REG,     // 5xy0
	LD_BYTE,    // 6xkk
	ADD_BYTE,   // 7xkk
	LD_REG,     // 8xy0
	OR,         // 8xy1
	AND,        // 8xy2
	XOR,        // 8xy3
	ADD_REG,    // 8xy4
	SUB,        // 8xy5
	SHR,        // 8xy6
	SUBN,       // 8xy7
	SHL,        // 8xyE
	SNE_REG,    // 9xy0
	LD_I,       // Annn
	JP_V0,      // Bnnn
	RND,        // Cxkk
	DRW,        // Dxyn
	SKP,        // Ex9E
	SKNP,       // ExA1
	LD_VX_DT,   // Fx07
	LD_VX_K,    // Fx0A
	LD_DT_VX,   // Fx15
	LD_ST_VX,   // Fx18
	ADD_I_VX,   // Fx1E
	LD_F_VX,    // Fx29
	LD_B_VX,    // Fx33
	LD_MEM_VX,  // Fx55
	LD_VX_MEM,  // Fx65
};

// A decoded instruction word: wxyz wnnn wxkk
struct Instruction
{
	uint16_t opCode;
	Op op;
	uint8_t x;
	uint8_t y;
	uint8_t n;
	uint8_t kk;
	uint16_t nnn;
};

// Throws Fault(UnknownInstruction) for any word that matches no instruction.
Instruction Decode(uint16_t opCode);

// Human readable description, used by the instruction trace.
const char *Describe(Op op);
