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

#include <string>
#include <vector>

namespace sbr::sim {

class Clocked;

/**
 * @brief Type erased interface of a register so that its owner can commit and reset it.
 * @details Registers register themselves with their owner on construction and therefore can neither be copied nor moved.
 */
class RegisterBase
{
	public:
		RegisterBase(Clocked &owner);
		virtual ~RegisterBase() = default;

		RegisterBase(const RegisterBase &) = delete;
		RegisterBase &operator=(const RegisterBase &) = delete;

		/// Makes the next value the current one.
		virtual void commit() = 0;
		/// Sets current and next value to the reset value.
		virtual void reset() = 0;
};

/**
 * @brief Base class of everything that holds state which advances with the tick.
 * @details A tick is processed in two phases. First, all components @ref evaluate their next state from the current state
 * of all components (including themselves) and their input pins. Second, all registers of all components commit their next state.
 * Since no register changes its current value during the evaluation phase, the order in which components are evaluated
 * does not matter.
 *
 * Components can be nested. Children are evaluated, committed, and reset together with their parent.
 */
class Clocked
{
	public:
		Clocked(std::string name, Clocked *parent = nullptr);
		virtual ~Clocked() = default;

		Clocked(const Clocked &) = delete;
		Clocked &operator=(const Clocked &) = delete;

		const std::string &name() const { return m_name; }
		const std::vector<Clocked*> &children() const { return m_children; }

		/// Computes the next state of all registers. Must only read current values of registers, never next values of foreign registers.
		virtual void evaluate() { }

		void evaluateAll();
		void commitAll();
		void resetAll();
	protected:
		friend class RegisterBase;

		std::string m_name;
		std::vector<RegisterBase*> m_registers;
		std::vector<Clocked*> m_children;
};

}
