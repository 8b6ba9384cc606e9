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
#include "simulation/pch.h"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

using namespace sbr;
using namespace sbr::sim;
using namespace boost::unit_test;

namespace {

struct Incrementer : public Clocked
{
	Incrementer(std::string name, Clocked *parent = nullptr) : Clocked(std::move(name), parent), value(*this, 0) { }
	void evaluate() override { value = value.current() + 1; }
	Reg<int> value;
};

struct Follower : public Clocked
{
	Follower(std::string name, int resetValue) : Clocked(std::move(name)), value(*this, resetValue) { }
	void evaluate() override { value = other->value.current(); }
	Follower *other = nullptr;
	Reg<int> value;
};

struct EventRecorder : public SimulatorCallbacks
{
	void onPowerOn() override { powerOns++; }
	void onNewTick(std::uint64_t tick, const ClockRational &simulationTime) override { lastTick = tick; lastTime = simulationTime; }
	void onCommitState() override { commits++; }
	void onReset() override { resets++; }

	size_t powerOns = 0;
	size_t commits = 0;
	size_t resets = 0;
	std::uint64_t lastTick = 0;
	ClockRational lastTime;
};

}

BOOST_AUTO_TEST_CASE(RegisterKeepsValueUntilAssigned)
{
	Clocked owner("owner");
	Reg<int> reg(owner, 3);

	BOOST_TEST(reg.current() == 3);
	reg = 5;
	BOOST_TEST(reg.current() == 3);
	BOOST_TEST(reg.next() == 5);

	owner.commitAll();
	BOOST_TEST(reg.current() == 5);
	owner.commitAll();
	BOOST_TEST(reg.current() == 5);

	owner.resetAll();
	BOOST_TEST(reg.current() == 3);
	BOOST_TEST(reg.next() == 3);
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, TwoPhaseSwapIndependentOfOrder, data::make({false, true}), reversed)
{
	Follower a("a", 1);
	Follower b("b", 2);
	a.other = &b;
	b.other = &a;

	if (reversed) {
		addComponent(b);
		addComponent(a);
	} else {
		addComponent(a);
		addComponent(b);
	}

	runTicks(1);
	BOOST_TEST(a.value.current() == 2);
	BOOST_TEST(b.value.current() == 1);

	getSimulator().advance();
	BOOST_TEST(a.value.current() == 1);
	BOOST_TEST(b.value.current() == 2);
}

BOOST_FIXTURE_TEST_CASE(ChildrenAdvanceWithParent, BoostUnitTestSimulationFixture)
{
	Incrementer parent("parent");
	Incrementer child("child", &parent);
	addComponent(parent);
	BOOST_TEST(parent.children().size() == 1);
	BOOST_TEST(child.children().empty());

	runTicks(7);
	BOOST_TEST(parent.value.current() == 7);
	BOOST_TEST(child.value.current() == 7);
	BOOST_TEST(getSimulator().getCurrentTick() == 7);
}

BOOST_FIXTURE_TEST_CASE(ProcessSeesCommittedState, BoostUnitTestSimulationFixture)
{
	Incrementer counter("counter");
	addComponent(counter);

	addSimulationProcess([&]()->SimProcess {
		BOOST_TEST(counter.value.current() == 0);
		co_await OnClk();
		BOOST_TEST(counter.value.current() == 1);
		co_await WaitFor(5);
		BOOST_TEST(counter.value.current() == 6);
		BOOST_TEST(getSimulator().getCurrentTick() == 6);
		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(SubProcessReturnsValue, BoostUnitTestSimulationFixture)
{
	Incrementer counter("counter");
	addComponent(counter);

	auto valueAfter = [&](std::uint64_t ticks)->SimulationFunction<std::uint8_t> {
		co_await WaitFor(ticks);
		co_return std::uint8_t(counter.value.current());
	};

	addSimulationProcess([&]()->SimProcess {
		std::uint8_t v = co_await valueAfter(10);
		BOOST_TEST(v == 10);
		v = co_await valueAfter(3);
		BOOST_TEST(v == 13);
		stopTest();
	});

	runTest(100);
}

BOOST_FIXTURE_TEST_CASE(ProcessExceptionLeavesAdvance, BoostUnitTestSimulationFixture)
{
	addSimulationProcess([&]()->SimProcess {
		co_await WaitFor(3);
		SBR_DESIGNCHECK_HINT(false, "Deliberate failure in simulation process");
	});

	getSimulator().powerOn();
	getSimulator().advance(3);
	BOOST_CHECK_THROW(getSimulator().advance(), sbr::utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(SystemResetRebasesWaitingProcesses, BoostUnitTestSimulationFixture)
{
	Incrementer counter("counter");
	addComponent(counter);

	std::uint64_t resumedAt = 0;
	addSimulationProcess([&]()->SimProcess {
		co_await WaitFor(10);
		resumedAt = getSimulator().getCurrentTick();
	});

	getSimulator().powerOn();
	getSimulator().advance(4);
	BOOST_TEST(counter.value.current() == 4);

	getSimulator().reset();
	BOOST_TEST(getSimulator().getCurrentTick() == 0);
	BOOST_TEST(counter.value.current() == 0);

	getSimulator().advance(6);
	BOOST_TEST(resumedAt == 0);
	getSimulator().advance();
	BOOST_TEST(resumedAt == 6);
	BOOST_TEST(counter.value.current() == 7);
}

BOOST_AUTO_TEST_CASE(CallbacksReportTicksAndTime)
{
	Simulator simulator(1000);
	EventRecorder recorder;
	simulator.addCallbacks(&recorder);

	Incrementer counter("counter");
	simulator.addComponent(counter);

	simulator.powerOn();
	simulator.advance(250);
	BOOST_TEST(recorder.powerOns == 1);
	BOOST_TEST(recorder.commits == 250);
	BOOST_TEST(recorder.lastTick == 250);
	BOOST_TEST((recorder.lastTime == ClockRational(1, 4)));

	std::ostringstream time;
	formatTime(time, recorder.lastTime);
	BOOST_TEST(time.str() == "250 ms");

	simulator.reset();
	BOOST_TEST(recorder.resets == 1);
}

BOOST_AUTO_TEST_CASE(AdvanceRequiresPowerOn)
{
	Simulator simulator;
	BOOST_CHECK_THROW(simulator.advance(), sbr::utils::DesignError);
}

BOOST_AUTO_TEST_CASE(AwaitersRequireRunningSimulator)
{
	BOOST_CHECK_THROW(Simulator::current(), sbr::utils::InternalError);
}

BOOST_FIXTURE_TEST_CASE(StopTestEndsRunEarly, BoostUnitTestSimulationFixture)
{
	Incrementer counter("counter");
	addComponent(counter);

	addSimulationProcess([&]()->SimProcess {
		co_await WaitFor(20);
		stopTest();
	});

	BOOST_TEST(!runHitsTimeout(1000));
	BOOST_TEST(counter.value.current() == 21);
	BOOST_TEST(runHitsTimeout(10));
}
