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

#include "ClockRational.h"
#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <coroutine>
#include <cstdint>
#include <functional>
#include <map>
#include <vector>

namespace sbr::sim {

class Clocked;

/**
 * @brief Drives a set of components through ticks.
 * @details Each tick consists of the following steps:
 * - Simulation processes that wait for this tick are resumed. They drive input pins and call the byte level interfaces of the components.
 * - All components compute their next state from the current state (@ref Clocked::evaluate).
 * - All components commit their next state.
 * - The tick count is incremented and callbacks are informed.
 *
 * The tick frequency only serves to translate ticks into simulation time for reporting.
 */
class Simulator
{
	public:
		Simulator(ClockRational tickFrequency = 1);
		~Simulator();

		Simulator(const Simulator &) = delete;
		Simulator &operator=(const Simulator &) = delete;

		/// Returns the simulator that is currently running simulation processes.
		static Simulator &current();

		/// Adds a simulator callback hook to inform recorders and test fixtures about simulation events.
		void addCallbacks(SimulatorCallbacks *simCallbacks) { m_callbackDispatcher.m_callbacks.push_back(simCallbacks); }

		/// Adds a top level component. Children of the component are handled through it.
		void addComponent(Clocked &component) { m_components.push_back(&component); }

		/// Adds a simulation process that is started on power on (or immediately, if already powered on).
		void addSimulationProcess(std::function<SimulationFunction<>()> simProc);

		/** 
			@name Simulator control
		 	@{
		*/

		/// Reset all components and restarts all simulation processes.
		void powerOn();

		/// Performs exactly one tick.
		void advance();

		/// Performs the given number of ticks or until aborted.
		void advance(std::uint64_t ticks);

		/**
		 * @brief System reset.
		 * @details All registers return to their reset values and the tick count returns to zero.
		 * Simulation processes keep running, waiting processes wait for the same number of remaining ticks.
		 */
		void reset();

		/**
		 * @brief Stops a running call to advance(ticks) after the current tick.
		 */
		void abort() { m_abortCalled = true; }

		/**
		 * @return returns whether abort() has been called
		*/
		bool abortCalled() const { return m_abortCalled; }

		/// @}

		std::uint64_t getCurrentTick() const { return m_tick; }
		ClockRational getTickFrequency() const { return m_tickFrequency; }
		ClockRational getCurrentSimulationTime() const { return ClockRational(m_tick) / m_tickFrequency; }
		bool poweredOn() const { return m_poweredOn; }

		/// Gives access to the callbacks, e.g. to report warnings from simulation models.
		SimulatorCallbacks &callbacks() { return m_callbackDispatcher; }

		void simulationProcessSuspending(std::coroutine_handle<> handle, std::uint64_t wakeupTick);

		class CallbackDispatcher : public SimulatorCallbacks {
			public:
				std::vector<SimulatorCallbacks*> m_callbacks;

				virtual void onPowerOn() override;
				virtual void onCommitState() override;
				virtual void onNewTick(std::uint64_t tick, const ClockRational &simulationTime) override;
				virtual void onReset() override;
				virtual void onDebugMessage(const Clocked *src, std::string msg) override;
				virtual void onWarning(const Clocked *src, std::string msg) override;
				virtual void onAssert(const Clocked *src, std::string msg) override;
		};
	protected:
		static thread_local Simulator *s_current;

		ClockRational m_tickFrequency;
		std::uint64_t m_tick = 0;
		bool m_poweredOn = false;
		bool m_abortCalled = false;

		CallbackDispatcher m_callbackDispatcher;
		std::vector<Clocked*> m_components;

		std::vector<std::function<SimulationFunction<>()>> m_processFunctors;
		std::vector<SimulationFunction<>> m_processes;
		std::multimap<std::uint64_t, std::coroutine_handle<>> m_waitingProcesses;

		void startProcess(const std::function<SimulationFunction<>()> &simProc);
		void resumeProcesses();
};

}
