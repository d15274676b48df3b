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
#include <algorithm>
#include <iostream>
#include <limits>
#include <sstream>
#include <unordered_map>
#include <tclap/CmdLine.h>

#include "emulator.h"

// Accepts values in [low, high].
template<typename T>
class RangeConstraint : public TCLAP::Constraint<T>
{
public:
	RangeConstraint(T low, T high, const std::string &id) : low(low), high(high), id(id) {}

	virtual std::string description() const
	{
		std::ostringstream text;
		if(high == std::numeric_limits<T>::max())
			text << "Cannot be lower than " << low << ".";
		else
			text << "Must be between " << low << "-" << high << ".";
		return text.str();
	}
	virtual std::string shortID() const
	{
		return id;
	}
	virtual bool check(const T &value) const
	{
		return value >= low && value <= high;
	}

private:
	T low;
	T high;
	std::string id;
};

static bool ParseColor(const std::string &value, uint32_t &color)
{
	try
	{
		size_t used = 0;
		unsigned long result = std::stoul(value, &used, 16);
		if(used != value.length() || result > 0xFFFFFF) return false;

		color = result;
	}catch(std::exception&)
	{
		return false;
	}

	return true;
}

class ColorConstraint : public TCLAP::Constraint<std::string>
{
public:
	virtual std::string description() const
	{
		return "Must be a hexadecimal number between 0-FFFFFF.";
	}
	virtual std::string shortID() const
	{
		return "RRGGBB";
	}
	virtual bool check(const std::string &value) const
	{
		uint32_t color;
		return ParseColor(value, color);
	}
};

struct ColorScheme
{
	uint32_t bg;
	uint32_t fg;
};

static std::unordered_map<std::string, ColorScheme> schemes = {
	{"autumn", ColorScheme{0x996600, 0xFFCC00}},
	{"deep blue", ColorScheme{0x000080, 0xFFFFFF}},
	{"amber", ColorScheme{0x1A0F00, 0xFFB000}},
};

static std::string Lowercase(std::string text)
{
	std::transform(text.begin(), text.end(), text.begin(), ::tolower);
	return text;
}

std::string GetColorSchemeList()
{
	std::string list = "Available color schemes: ";
	for(auto it = schemes.begin(); it != schemes.end(); it++)
	{
		if(it != schemes.begin()) list += ", ";
		list += it->first;
	}

	return list;
}

class ColorSchemeConstraint : public TCLAP::Constraint<std::string>
{
public:
	virtual std::string description() const
	{
		return GetColorSchemeList();
	}
	virtual std::string shortID() const
	{
		return "color scheme";
	}
	virtual bool check(const std::string &value) const
	{
		return schemes.find(Lowercase(value)) != schemes.end();
	}
};

int main(int argc, char** argv)
{
	try{
		TCLAP::CmdLine cmd("A CHIP-8 virtual machine written in C++.", ' ', "0.2");

		TCLAP::UnlabeledValueArg<std::string> filePath("run", "Provide a relative or absolute path.", true, "", "Path to CHIP-8 program", cmd, false);
		RangeConstraint<unsigned int> pc(1, 1000, "amount");
		TCLAP::ValueArg<unsigned int> pixelScale("p", "pixel-scale", "Amount to scale each pixel in the 64x32 display. Default: 16", false, 16, &pc, cmd);
		RangeConstraint<uint32_t> ic(60, std::numeric_limits<uint32_t>::max(), "ips");
		TCLAP::ValueArg<uint32_t> ips("i", "ips", "Number of instructions to execute per second. Default: 600", false, 600, &ic, cmd);
		TCLAP::SwitchArg debugMode("d", "debug", "Enable debugging mode with an instruction trace.", cmd, false);
		TCLAP::SwitchArg xorSprites("x", "xor-sprites", "Draw sprites by toggling pixels and report pixels turned off in VF.", cmd, false);
		ColorConstraint cc;
		TCLAP::ValueArg<std::string> background("b", "background", "Background color in RRGGBB hexadecimal format.", false, "", &cc, cmd);
		TCLAP::ValueArg<std::string> foreground("f", "foreground", "Foreground color in RRGGBB hexadecimal format.", false, "", &cc, cmd);
		ColorSchemeConstraint csc;
		TCLAP::ValueArg<std::string> colorScheme("c", "color-scheme", GetColorSchemeList(), false, "", &csc, cmd);

		cmd.parse(argc, argv);

		Emulator emulator;

		emulator.SetIPS(ips.getValue());
		emulator.EnableDebug(debugMode.getValue());
		emulator.SetPixelScale(pixelScale.getValue());
		emulator.SetSpriteMode(xorSprites.getValue() ? SpriteMode::Xor : SpriteMode::TurnOnOnly);

		if(colorScheme.isSet())
		{
			const ColorScheme &scheme = schemes.at(Lowercase(colorScheme.getValue()));
			emulator.SetBackgroundColor(scheme.bg);
			emulator.SetForegroundColor(scheme.fg);
		}

		// Explicit colors override the scheme.
		uint32_t color;
		if(background.isSet() && ParseColor(background.getValue(), color)) emulator.SetBackgroundColor(color);
		if(foreground.isSet() && ParseColor(foreground.getValue(), color)) emulator.SetForegroundColor(color);

		if(!emulator.LoadProgram(filePath.getValue())) return 1;

		emulator.Run();
	}catch(TCLAP::ArgException &e)
	{
		std::cerr << "Error: " << e.error() << " for " << e.argId() << std::endl;
		return 1;
	}

	return 0;
}
