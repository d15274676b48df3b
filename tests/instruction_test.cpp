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
#include <cstring>
#include <gtest/gtest.h>

#include "fault.h"
#include "instruction.h"

TEST(DecodeTest, SplitsOperandFields)
{
	Instruction draw = Decode(0xD123);
	EXPECT_EQ(draw.op, Op::DRW);
	EXPECT_EQ(draw.opCode, 0xD123);
	EXPECT_EQ(draw.x, 0x1);
	EXPECT_EQ(draw.y, 0x2);
	EXPECT_EQ(draw.n, 0x3);

	Instruction load = Decode(0x6A42);
	EXPECT_EQ(load.op, Op::LD_BYTE);
	EXPECT_EQ(load.x, 0xA);
	EXPECT_EQ(load.kk, 0x42);

	Instruction index = Decode(0xA2F0);
	EXPECT_EQ(index.op, Op::LD_I);
	EXPECT_EQ(index.nnn, 0x2F0);
}

TEST(DecodeTest, MapsEveryInstructionPattern)
{
	struct Case { uint16_t opCode; Op op; };
	const Case cases[] = {
		{0x00E0, Op::CLS}, {0x00EE, Op::RET}, {0x1ABC, Op::JP}, {0x2ABC, Op::CALL},
		{0x3A12, Op::SE_BYTE}, {0x4A12, Op::SNE_BYTE}, {0x5AB0, Op::SE_REG}, {0x6A12, Op::LD_BYTE},
		{0x7A12, Op::ADD_BYTE}, {0x8AB0, Op::LD_REG}, {0x8AB1, Op::OR}, {0x8AB2, Op::AND},
		{0x8AB3, Op::XOR}, {0x8AB4, Op::ADD_REG}, {0x8AB5, Op::SUB}, {0x8AB6, Op::SHR},
		{0x8AB7, Op::SUBN}, {0x8ABE, Op::SHL}, {0x9AB0, Op::SNE_REG}, {0xAABC, Op::LD_I},
		{0xBABC, Op::JP_V0}, {0xCA12, Op::RND}, {0xDAB5, Op::DRW}, {0xEA9E, Op::SKP},
		{0xEAA1, Op::SKNP}, {0xFA07, Op::LD_VX_DT}, {0xFA0A, Op::LD_VX_K}, {0xFA15, Op::LD_DT_VX},
		{0xFA18, Op::LD_ST_VX}, {0xFA1E, Op::ADD_I_VX}, {0xFA29, Op::LD_F_VX}, {0xFA33, Op::LD_B_VX},
		{0xFA55, Op::LD_MEM_VX}, {0xFA65, Op::LD_VX_MEM},
	};

	for(const Case &c: cases)
	{
		EXPECT_EQ(Decode(c.opCode).op, c.op) << "opcode 0x" << std::hex << c.opCode;
	}
}

TEST(DecodeTest, RejectsUnknownPatternsAtEveryLevel)
{
	const uint16_t unknown[] = {
		0x0000, 0x0123, 0x00E1, 0x00FF, // 0 group
		0x5AB1, 0x9ABF,                 // low nibble must be 0
		0x8AB8, 0x8ABD, 0x8ABF,         // 8 group
		0xEA00, 0xEA9F,                 // E group
		0xFA00, 0xFA19, 0xFAFF,         // F group
	};

	for(uint16_t opCode: unknown)
	{
		try
		{
			Decode(opCode);
			ADD_FAILURE() << "0x" << std::hex << opCode << " decoded";
		}catch(const Fault &fault)
		{
			EXPECT_EQ(fault.GetKind(), Fault::UnknownInstruction);
		}
	}
}

TEST(DecodeTest, UnknownInstructionNamesTheOpcode)
{
	try
	{
		Decode(0xF0FF);
		FAIL() << "0xF0FF decoded";
	}catch(const Fault &fault)
	{
		EXPECT_NE(std::string(fault.what()).find("0xF0FF"), std::string::npos) << fault.what();
	}
}

TEST(DescribeTest, StartsWithThePattern)
{
	EXPECT_EQ(std::strncmp(Describe(Op::CLS), "00E0", 4), 0);
	EXPECT_EQ(std::strncmp(Describe(Op::DRW), "Dxyn", 4), 0);
	EXPECT_EQ(std::strncmp(Describe(Op::LD_VX_MEM), "Fx65", 4), 0);
}
