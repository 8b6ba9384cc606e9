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
#pragma once

#include "../../simulation/simProc/SimulationProcess.h"

#include <cstdint>
#include <functional>
#include <vector>

namespace sbr::sim {

	/**
	 * @brief Drives 8N1 frames onto a uart line from simulation processes.
	 * @details The line is held for exactly one bit period per bit and returned to idle (high) after the stop bit.
	 */
	class UartLineDriver
	{
	public:
		UartLineDriver(std::function<void(bool)> line, std::uint64_t bitPeriod);

		/// Sends a frame, with a low stop bit if @p validStopBit is false.
		SimProcess send(std::uint8_t byte, bool validStopBit = true);
		SimProcess send(std::vector<std::uint8_t> bytes);
		/// Pulls the line low for the given number of ticks, e.g. to provoke a false start.
		SimProcess glitch(std::uint64_t ticks);
		/// Holds the line low for a whole frame and beyond.
		SimProcess lineBreak(std::uint64_t bitPeriods);

		std::uint64_t bitPeriod() const { return m_bitPeriod; }
	protected:
		std::function<void(bool)> m_line;
		std::uint64_t m_bitPeriod;
	};

	struct DecodedFrame
	{
		std::uint8_t data;
		bool stopBitValid;
	};

	/**
	 * @brief Decodes 8N1 frames from a uart line.
	 * @details Samples the line in the middle of every bit period after a falling edge. Frames with a low stop bit are
	 * recorded and reported as a simulation warning.
	 */
	class UartLineMonitor
	{
	public:
		UartLineMonitor(std::function<bool()> line, std::uint64_t bitPeriod);

		/// Decodes frames forever, to be added as a simulation process.
		SimProcess run();
		/// Waits until the next frame has been decoded and returns its payload.
		SimulationFunction<std::uint8_t> receive();

		const std::vector<DecodedFrame> &frames() const { return m_frames; }
		std::vector<std::uint8_t> bytes() const;
	protected:
		std::function<bool()> m_line;
		std::uint64_t m_bitPeriod;
		std::vector<DecodedFrame> m_frames;
		size_t m_framesReturned = 0;
	};

}
