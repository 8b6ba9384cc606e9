/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
	Copyright (C) 2026 The Serbridge developers

	Serbridge is free software; you can redistribute it and/or
	modify it under the terms of the GNU Lesser General Public
	License as published by the Free Software Foundation; either
	version 3 of the License, or (at your option) any later version.

	Serbridge is distributed in the hope that it will be useful,
	but WITHOUT ANY WARRANTY; without even the implied warranty of
	MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
	Lesser General Public License for more details.

	You should have received a copy of the GNU Lesser General Public
	License along with this library; if not, write to the Free Software
	Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301  USA
*/
#include "serbridge/pch.h"
#include "SimulatorCallbacks.h"
#include "Clocked.h"

#include <iostream>

namespace sbr::sim {

void SimulatorConsoleOutput::onPowerOn()
{
	m_simTime = 0;
	std::cout << "Simulation powered on" << std::endl;
}

void SimulatorConsoleOutput::onNewTick(std::uint64_t tick, const ClockRational &simulationTime)
{
	m_simTime = simulationTime;
	if (m_reportTicks) {
		std::cout << "New simulation tick " << tick << " at ";
		formatTime(std::cout, simulationTime);
		std::cout << std::endl;
	}
}

void SimulatorConsoleOutput::onReset()
{
	std::cout << "System reset at ";
	formatTime(std::cout, m_simTime);
	std::cout << std::endl;
	m_simTime = 0;
}

void SimulatorConsoleOutput::printSource(const Clocked *src)
{
	formatTime(std::cout, m_simTime);
	if (src)
		std::cout << " [" << src->name() << "]";
	std::cout << ' ';
}

void SimulatorConsoleOutput::onDebugMessage(const Clocked *src, std::string msg)
{
	printSource(src);
	std::cout << msg << std::endl;
}

void SimulatorConsoleOutput::onWarning(const Clocked *src, std::string msg)
{
	printSource(src);
	std::cout << "WARNING: " << msg << std::endl;
}

void SimulatorConsoleOutput::onAssert(const Clocked *src, std::string msg)
{
	printSource(src);
	std::cout << "ASSERT: " << msg << std::endl;
}

}
