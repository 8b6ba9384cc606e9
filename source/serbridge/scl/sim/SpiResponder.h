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

#include "../io/SpiMaster.h"

#include "../../simulation/simProc/SimulationProcess.h"

#include <cstdint>
#include <deque>
#include <vector>

namespace sbr::sim {

	/**
	 * @brief Model of an external SPI slave device that is attached to an SpiMaster.
	 * @details The responder watches chip select and serial clock of the master between ticks. It shifts its response
	 * MSB first onto miso and records mosi at the edges that the mode prescribes:
	 * with CPHA=0 the first bit is driven when chip select asserts, further bits after each trailing edge and mosi is
	 * recorded on leading edges. With CPHA=1 bits are driven on leading edges and mosi is recorded on trailing edges.
	 */
	class SpiResponder
	{
	public:
		SpiResponder(scl::SpiMaster &master, size_t width, scl::SpiMode mode);

		/// Queues the value to send in a future transfer. Without queued values, the default response is sent.
		void respondWith(std::uint64_t value) { m_responses.push_back(value); }
		void defaultResponse(std::uint64_t value) { m_defaultResponse = value; }

		/// Serves transfers forever, to be added as a simulation process.
		SimProcess run();

		/// Values received on mosi, one per completed transfer.
		const std::vector<std::uint64_t> &received() const { return m_received; }
		/// Number of bits recorded in each completed transfer.
		const std::vector<size_t> &receivedBits() const { return m_receivedBits; }
	protected:
		scl::SpiMaster &m_master;
		size_t m_width;
		bool m_cpol;
		bool m_cpha;

		std::deque<std::uint64_t> m_responses;
		std::uint64_t m_defaultResponse = 0;

		std::vector<std::uint64_t> m_received;
		std::vector<size_t> m_receivedBits;

		void drive(std::uint64_t response, size_t bitIdx);
	};

}
