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

#include "instruction.h"

struct Machine;

// Reads the big-endian instruction word at PC and advances PC past it.
uint16_t Fetch(Machine &machine);

// Runs a decoded instruction against the machine.
void Execute(Machine &machine, const Instruction &ins);

// Fetches, decodes and executes the instruction at PC and returns it.
// A Fault raised on the way gets the address and opcode attached before it
// is rethrown. Must not be called while the machine waits for a key.
Instruction Step(Machine &machine);
