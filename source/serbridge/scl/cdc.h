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

#include <cstddef>
#include <cstdint>

namespace sbr::scl
{
	/**
	 * @brief Chain of registers that samples an asynchronous input to prevent metastability from propagating.
	 * @details The raw input is shifted into the first stage and every stage into the next one on each tick. 
	 * The output is the last stage, so the input appears on the output after exactly `stages` ticks.
	 * Call sample() exactly once per tick from the owner's evaluate().
	 */
	class Synchronizer
	{
	public:
		Synchronizer(sim::Clocked &owner, size_t stages = 2, bool resetValue = false);

		/// Shifts the raw input into the chain and returns the current output of the last stage.
		bool sample(bool raw);
		/// The current output of the last stage.
		bool value() const { return (m_stages.current() >> (m_numStages-1)) & 1; }

		size_t numStages() const { return m_numStages; }
	private:
		size_t m_numStages;
		std::uint64_t m_mask;
		sim::Reg<std::uint64_t> m_stages;
	};
}
