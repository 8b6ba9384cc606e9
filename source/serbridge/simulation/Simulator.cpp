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
#include "Simulator.h"
#include "Clocked.h"

#include "../debug/DebugInterface.h"
#include "../utils/Preprocessor.h"

#include <algorithm>

namespace sbr::sim {

thread_local Simulator *Simulator::s_current = nullptr;

Simulator::Simulator(ClockRational tickFrequency) : m_tickFrequency(tickFrequency)
{
	SBR_DESIGNCHECK_HINT(m_tickFrequency.numerator() != 0, "The tick frequency must be positive.");
}

Simulator::~Simulator()
{
	m_waitingProcesses.clear();
	m_processes.clear();
}

Simulator &Simulator::current()
{
	SBR_ASSERT_HINT(s_current != nullptr, "Simulation awaiters can only be used from within simulation processes.");
	return *s_current;
}

void Simulator::addSimulationProcess(std::function<SimulationFunction<>()> simProc)
{
	m_processFunctors.push_back(std::move(simProc));
	if (m_poweredOn)
		startProcess(m_processFunctors.back());
}

void Simulator::startProcess(const std::function<SimulationFunction<>()> &simProc)
{
	m_processes.push_back(instantiate(simProc));

	auto *lastSimulator = s_current;
	s_current = this;
	try {
		m_processes.back().start();
	} catch (...) {
		s_current = lastSimulator;
		throw;
	}
	s_current = lastSimulator;
}

void Simulator::powerOn()
{
	m_waitingProcesses.clear();
	m_processes.clear();

	m_tick = 0;
	m_abortCalled = false;
	for (Clocked *component : m_components)
		component->resetAll();
	m_poweredOn = true;

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
			<< "Powering on simulation with " << m_components.size() << " components and " << m_processFunctors.size() << " simulation processes");

	m_callbackDispatcher.onPowerOn();

	for (const auto &simProc : m_processFunctors)
		startProcess(simProc);
}

void Simulator::resumeProcesses()
{
	auto *lastSimulator = s_current;
	s_current = this;
	try {
		while (!m_waitingProcesses.empty() && m_waitingProcesses.begin()->first <= m_tick) {
			auto handle = m_waitingProcesses.begin()->second;
			m_waitingProcesses.erase(m_waitingProcesses.begin());
			handle.resume();
		}
	} catch (...) {
		s_current = lastSimulator;
		throw;
	}
	s_current = lastSimulator;
}

void Simulator::advance()
{
	SBR_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before advancing it.");

	resumeProcesses();

	for (Clocked *component : m_components)
		component->evaluateAll();
	for (Clocked *component : m_components)
		component->commitAll();

	m_tick++;
	m_callbackDispatcher.onNewTick(m_tick, getCurrentSimulationTime());
	m_callbackDispatcher.onCommitState();
}

void Simulator::advance(std::uint64_t ticks)
{
	m_abortCalled = false;
	for (std::uint64_t i = 0; i < ticks && !m_abortCalled; i++)
		advance();
}

void Simulator::reset()
{
	SBR_DESIGNCHECK_HINT(m_poweredOn, "The simulation must be powered on before it can be reset.");

	for (Clocked *component : m_components)
		component->resetAll();

	std::multimap<std::uint64_t, std::coroutine_handle<>> rebased;
	for (const auto &[wakeupTick, handle] : m_waitingProcesses)
		rebased.emplace(wakeupTick - std::min(wakeupTick, m_tick), handle);
	m_waitingProcesses = std::move(rebased);

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SIMULATION
			<< "System reset at tick " << m_tick);

	m_tick = 0;
	m_callbackDispatcher.onReset();
}

void Simulator::simulationProcessSuspending(std::coroutine_handle<> handle, std::uint64_t wakeupTick)
{
	m_waitingProcesses.emplace(wakeupTick, handle);
}


void Simulator::CallbackDispatcher::onPowerOn()
{
	for (auto *c : m_callbacks) c->onPowerOn();
}

void Simulator::CallbackDispatcher::onCommitState()
{
	for (auto *c : m_callbacks) c->onCommitState();
}

void Simulator::CallbackDispatcher::onNewTick(std::uint64_t tick, const ClockRational &simulationTime)
{
	for (auto *c : m_callbacks) c->onNewTick(tick, simulationTime);
}

void Simulator::CallbackDispatcher::onReset()
{
	for (auto *c : m_callbacks) c->onReset();
}

void Simulator::CallbackDispatcher::onDebugMessage(const Clocked *src, std::string msg)
{
	for (auto *c : m_callbacks) c->onDebugMessage(src, msg);
}

void Simulator::CallbackDispatcher::onWarning(const Clocked *src, std::string msg)
{
	for (auto *c : m_callbacks) c->onWarning(src, msg);
}

void Simulator::CallbackDispatcher::onAssert(const Clocked *src, std::string msg)
{
	for (auto *c : m_callbacks) c->onAssert(src, msg);
}

}
