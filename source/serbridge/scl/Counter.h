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

#include "../simulation/Reg.h"

#include <cstdint>

namespace sbr::scl
{
	/**
	 * @brief Counts ticks (or events) from 0 to end-1 and wraps around.
	 * @details The counter is part of the state of its owner. The owner calls inc(), dec(), reset(), or load() from its
	 * evaluate() to determine the value of the next tick, the last call of a tick wins. Without a call, the counter keeps its value.
	 */
	class Counter
	{
	public:
		Counter(sim::Clocked &owner, std::uint64_t end, std::uint64_t startupValue = 0);

		Counter& inc();
		Counter& dec();
		void reset();
		void load(std::uint64_t value);

		inline std::uint64_t value() const { return m_value.current(); }
		inline std::uint64_t end() const { return m_end; }
		inline bool isLast() const { return m_value.current() == m_end - 1; }
		inline bool isFirst() const { return m_value.current() == 0; }
		/// Whether the counter will be at zero in the next tick according to the calls made so far in this tick.
		inline bool becomesFirst() const { return m_value.next() == 0; }
	private:
		std::uint64_t m_end;
		std::uint64_t m_resetValue;
		sim::Reg<std::uint64_t> m_value;
	};
}
