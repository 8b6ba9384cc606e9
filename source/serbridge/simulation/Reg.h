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

#include "Clocked.h"

#include <string>
#include <utility>

namespace sbr::sim
{
/**
 * @addtogroup sbr_simulation
 * @{
 */

	/**
	 * @brief A register that holds a value across ticks.
	 * @details Assigning to a register sets the value it will take on after the current tick (the next value).
	 * Reading a register yields the value it has during the current tick. Unless assigned, a register keeps its value.
	 *
	 * Every register must have exactly one writer. Components write their own registers during @ref Clocked::evaluate,
	 * caller facing functions (like pushing into a fifo) write registers that belong to the caller's side of an interface.
	 * @code
	 * Reg<State> state{ *this, State::idle };
	 * if (state.current() == State::idle && request)
	 *     state = State::busy; // visible from the next tick on
	 * @endcode
	 */
	template<typename T>
	class Reg : public RegisterBase
	{
	public:
		Reg(Clocked &owner, T resetValue = T{}) :
			RegisterBase(owner),
			m_resetValue(resetValue),
			m_current(resetValue),
			m_next(std::move(resetValue))
		{
		}

		Reg &operator = (const T &val) {
			m_next = val;
			return *this;
		}

		operator const T&() const { return m_current; }

		const T &current() const { return m_current; }
		const T &next() const { return m_next; }
		const T &resetValue() const { return m_resetValue; }

		void commit() override { m_current = m_next; }
		void reset() override { m_current = m_resetValue; m_next = m_resetValue; }
	private:
		T m_resetValue;
		T m_current;
		T m_next;
	};

/**@}*/
}
