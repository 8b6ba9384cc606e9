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
#include "UartLineModel.h"

#include "../../simulation/Simulator.h"
#include "../../utils/Preprocessor.h"
#include "../../utils/Range.h"

#include <boost/format.hpp>

namespace sbr::sim {

UartLineDriver::UartLineDriver(std::function<void(bool)> line, std::uint64_t bitPeriod) :
	m_line(std::move(line)),
	m_bitPeriod(bitPeriod)
{
	SBR_DESIGNCHECK_HINT(m_bitPeriod >= 2, "A bit must last at least two ticks.");
	m_line(true);
}

SimProcess UartLineDriver::send(std::uint8_t byte, bool validStopBit)
{
	m_line(false);
	co_await WaitFor(m_bitPeriod);

	for (auto i : utils::Range(8)) {
		m_line((byte >> i) & 1);
		co_await WaitFor(m_bitPeriod);
	}

	m_line(validStopBit);
	co_await WaitFor(m_bitPeriod);
	m_line(true);
}

SimProcess UartLineDriver::send(std::vector<std::uint8_t> bytes)
{
	for (auto byte : bytes)
		co_await send(byte);
}

SimProcess UartLineDriver::glitch(std::uint64_t ticks)
{
	m_line(false);
	co_await WaitFor(ticks);
	m_line(true);
}

SimProcess UartLineDriver::lineBreak(std::uint64_t bitPeriods)
{
	m_line(false);
	co_await WaitFor(bitPeriods * m_bitPeriod);
	m_line(true);
}


UartLineMonitor::UartLineMonitor(std::function<bool()> line, std::uint64_t bitPeriod) :
	m_line(std::move(line)),
	m_bitPeriod(bitPeriod)
{
	SBR_DESIGNCHECK_HINT(m_bitPeriod >= 2, "A bit must last at least two ticks.");
}

SimProcess UartLineMonitor::run()
{
	while (true) {
		while (m_line())
			co_await OnClk();

		co_await WaitFor(m_bitPeriod / 2);
		if (m_line())
			continue;

		std::uint8_t data = 0;
		for (auto i : utils::Range(8)) {
			co_await WaitFor(m_bitPeriod);
			if (m_line())
				data |= std::uint8_t(1u << i);
		}

		co_await WaitFor(m_bitPeriod);
		bool stopBit = m_line();
		m_frames.push_back({ data, stopBit });

		if (!stopBit) {
			Simulator::current().callbacks().onWarning(nullptr, (boost::format("Uart frame with invalid stop bit, payload 0x%02x") % unsigned(data)).str());
			while (!m_line())
				co_await OnClk();
		}
	}
}

SimulationFunction<std::uint8_t> UartLineMonitor::receive()
{
	while (m_framesReturned == m_frames.size())
		co_await OnClk();
	co_return m_frames[m_framesReturned++].data;
}

std::vector<std::uint8_t> UartLineMonitor::bytes() const
{
	std::vector<std::uint8_t> res;
	for (const auto &frame : m_frames)
		res.push_back(frame.data);
	return res;
}

}
