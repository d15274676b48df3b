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

#include "fault.h"

Fault::Fault(Kind kind, const std::string &message)
	: std::runtime_error(message), kind(kind), located(false), address(0), opCode(0)
{
}

void Fault::SetLocation(uint16_t address, uint16_t opCode)
{
	this->address = address;
	this->opCode = opCode;
	located = true;
}

std::string Fault::Describe() const
{
	if(!located) return what();

	char location[48];
	snprintf(location, sizeof(location), " (opcode 0x%04X at 0x%03X)", opCode, address);

	return std::string(what()) + location;
}
