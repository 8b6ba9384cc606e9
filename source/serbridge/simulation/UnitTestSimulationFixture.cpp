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
#include "serbridge/pch.h"
#include "UnitTestSimulationFixture.h"

#include "Simulator.h"
#include "Clocked.h"

#include <boost/test/unit_test.hpp>

namespace sbr::sim {

UnitTestSimulationFixture::UnitTestSimulationFixture(ClockRational tickFrequency)
{
	m_simulator.reset(new Simulator(tickFrequency));
	m_simulator->addCallbacks(this);
}

UnitTestSimulationFixture::~UnitTestSimulationFixture()
{
}

void UnitTestSimulationFixture::addComponent(Clocked &component)
{
	m_simulator->addComponent(component);
}

void UnitTestSimulationFixture::addSimulationProcess(std::function<SimulationFunction<>()> simProc)
{
	m_simulator->addSimulationProcess(std::move(simProc));
}

void UnitTestSimulationFixture::runTicks(std::uint64_t numTicks)
{
	m_simulator->powerOn();
	m_simulator->advance(numTicks);
	checkMessages();
}

void UnitTestSimulationFixture::stopTest()
{
	m_simulator->abort();
	m_stopTestCalled = true;
}

bool UnitTestSimulationFixture::runHitsTimeout(std::uint64_t timeoutTicks)
{
	m_stopTestCalled = false;
	m_simulator->powerOn();
	m_simulator->advance(timeoutTicks);
	checkMessages();

	return !m_stopTestCalled;
}

void UnitTestSimulationFixture::onDebugMessage(const Clocked *src, std::string msg)
{
}

void UnitTestSimulationFixture::onWarning(const Clocked *src, std::string msg)
{
	m_warnings.push_back(msg);
}

void UnitTestSimulationFixture::onAssert(const Clocked *src, std::string msg)
{
	m_errors.push_back(msg);
}


void BoostUnitTestSimulationFixture::runFixedLengthTest(std::uint64_t numTicks)
{
	runHitsTimeout(numTicks);
}

void BoostUnitTestSimulationFixture::runTest(std::uint64_t timeoutTicks)
{
	BOOST_CHECK_MESSAGE(!runHitsTimeout(timeoutTicks), "Simulation timed out without being called to a stop by any simulation process!");
}

void BoostUnitTestSimulationFixture::onDebugMessage(const Clocked *src, std::string msg)
{
	BOOST_TEST_MESSAGE(msg);
}

void BoostUnitTestSimulationFixture::checkMessages()
{
	if (!m_errors.empty())
		BOOST_FAIL(m_errors.front());
	if (!m_warnings.empty())
		BOOST_ERROR(m_warnings.front());
}

}
