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
#include <stdexcept>
#include <string>

// Fatal machine condition. Execution cannot continue once one is raised.
class Fault : public std::runtime_error
{
public:
	enum Kind
	{
		UnknownInstruction,
		StackUnderflow,
		StackOverflow,
		InvalidAddress,
	};

	Fault(Kind kind, const std::string &message);

	Kind GetKind() const { return kind; }

	// Attached by the executor once the faulting instruction is known.
	void SetLocation(uint16_t address, uint16_t opCode);
	bool HasLocation() const { return located; }
	uint16_t GetAddress() const { return address; }
	uint16_t GetOpCode() const { return opCode; }

	// Message plus opcode and address when they are known.
	std::string Describe() const;

private:
	Kind kind;
	bool located;
	uint16_t address;
	uint16_t opCode;
};
