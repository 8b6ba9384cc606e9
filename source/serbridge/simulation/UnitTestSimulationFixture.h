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

#include "SimulatorCallbacks.h"
#include "simProc/SimulationProcess.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sbr::sim {

	class Simulator;
	class Clocked;

	/**
	 * @brief Helper class to facilitate writing unit tests
	 * @details Owns a simulator and collects all warnings and asserts reported through the simulator callbacks.
	 */
	class UnitTestSimulationFixture : public SimulatorCallbacks
	{
	public:
		UnitTestSimulationFixture(ClockRational tickFrequency = 1);
		~UnitTestSimulationFixture();

		void addComponent(Clocked &component);
		void addSimulationProcess(std::function<SimulationFunction<>()> simProc);

		/// Powers on and runs the simulation for the specified amount of ticks.
		void runTicks(std::uint64_t numTicks);

		/// Stops an ongoing simulation (to be used during runHitsTimeout)
		void stopTest();

		/// Powers on and runs the simulation until the timeout (in ticks) is reached or stopTest is called
		/// @return returns true if the timeout was reached.
		bool runHitsTimeout(std::uint64_t timeoutTicks);

		virtual void onDebugMessage(const Clocked *src, std::string msg) override;
		virtual void onWarning(const Clocked *src, std::string msg) override;
		virtual void onAssert(const Clocked *src, std::string msg) override;

		Simulator &getSimulator() { return *m_simulator; }
	protected:
		std::unique_ptr<Simulator> m_simulator;
		bool m_stopTestCalled = false;

		std::vector<std::string> m_warnings;
		std::vector<std::string> m_errors;

		virtual void checkMessages() { }
	};

	/**
	 * @brief Reports collected warnings and asserts as Boost.Test errors and failures.
	 */
	class BoostUnitTestSimulationFixture : public UnitTestSimulationFixture
	{
	public:
		using UnitTestSimulationFixture::UnitTestSimulationFixture;

		void runFixedLengthTest(std::uint64_t numTicks);
		void runTest(std::uint64_t timeoutTicks);

		virtual void onDebugMessage(const Clocked *src, std::string msg) override;
	protected:
		virtual void checkMessages() override;
	};

}
