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
#include "Counter.h"

#include "../utils/Preprocessor.h"

namespace sbr::scl
{
	Counter::Counter(sim::Clocked &owner, std::uint64_t end, std::uint64_t startupValue) :
		m_end(end),
		m_resetValue(startupValue),
		m_value(owner, startupValue)
	{
		SBR_DESIGNCHECK_HINT(end > 0, "A counter must count to at least one.");
		SBR_DESIGNCHECK_HINT(startupValue < end, "The startup value of a counter must be smaller than its end.");
	}

	Counter& Counter::inc() 
	{
		m_value = isLast() ? 0 : m_value.current() + 1;
		return *this;
	}

	Counter& Counter::dec() 
	{
		m_value = isFirst() ? m_end - 1 : m_value.current() - 1;
		return *this;
	}

	void Counter::reset() { load(m_resetValue); }

	void Counter::load(std::uint64_t value) 
	{ 
		SBR_ASSERT_HINT(value < m_end, "Loading a counter with a value beyond its end.");
		m_value = value; 
	}
}
