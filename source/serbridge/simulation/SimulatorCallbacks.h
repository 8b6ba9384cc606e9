/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
	Copyright (C) 2021 Michael Offel, Andreas Ley
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

#include "ClockRational.h"

#include <string>

namespace sbr::sim {

class Clocked;

/**
 * @brief Interface for classes that want to be informed of simulator events.
 */
class SimulatorCallbacks
{
	public:
		virtual ~SimulatorCallbacks() = default;

		/**
		 * @brief Called when the simulation is powered on, after all registers attained their reset values but before simulation processes have started.
		 */
		virtual void onPowerOn() { }

		/**
		 * @brief Called whenever all components committed their next state.
		 * @details This is where checks can be performed on the state of the tick that just ended.
		 */
		virtual void onCommitState() { }

		/**
		 * @brief Called whenever the simulation time advances.
		 * @param tick The new tick count.
		 * @param simulationTime The new simulator time in seconds.
		 */
		virtual void onNewTick(std::uint64_t tick, const ClockRational &simulationTime) { }

		/**
		 * @brief Called on a system reset after all registers returned to their reset values.
		 */
		virtual void onReset() { }

		virtual void onDebugMessage(const Clocked *src, std::string msg) { }
		virtual void onWarning(const Clocked *src, std::string msg) { }
		virtual void onAssert(const Clocked *src, std::string msg) { }
};


/**
 * @brief Simple SimulatorCallbacks implementation that writes the most important events to the console.
 */
class SimulatorConsoleOutput : public SimulatorCallbacks
{
	public:
		SimulatorConsoleOutput(bool reportTicks = false) : m_reportTicks(reportTicks) { }

		virtual void onPowerOn() override;
		virtual void onNewTick(std::uint64_t tick, const ClockRational &simulationTime) override;
		virtual void onReset() override;
		virtual void onDebugMessage(const Clocked *src, std::string msg) override;
		virtual void onWarning(const Clocked *src, std::string msg) override;
		virtual void onAssert(const Clocked *src, std::string msg) override;
	protected:
		bool m_reportTicks;
		ClockRational m_simTime;

		void printSource(const Clocked *src);
};

}
