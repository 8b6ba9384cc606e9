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
#include "scl/pch.h"
#include <boost/test/unit_test.hpp>
#include <boost/test/data/dataset.hpp>
#include <boost/test/data/test_case.hpp>
#include <boost/test/data/monomorphic.hpp>

using namespace boost::unit_test;
using namespace sbr;
using namespace sbr::sim;
using namespace sbr::scl;

namespace {

struct SynchronizerHarness : public Clocked
{
	SynchronizerHarness(size_t stages) : Clocked("sync"), sync(*this, stages) { }
	void evaluate() override { sync.sample(input); }

	bool input = false;
	Synchronizer sync;
};

struct CountingHarness : public Clocked
{
	CountingHarness(std::uint64_t end, std::uint64_t startupValue = 0) : Clocked("counting"), counter(*this, end, startupValue) { }
	void evaluate() override { if (enabled) counter.inc(); }

	bool enabled = true;
	Counter counter;
};

struct BaudHarness : public Clocked
{
	BaudHarness(std::uint64_t divisor) : Clocked("baud"), generator(*this, divisor) { }
	void evaluate() override { if (generator.tick()) pulses++; }

	size_t pulses = 0;
	BaudRateGenerator generator;
};

}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, synchronizer_latency, data::make({ 2, 3, 5 }), stages)
{
	SynchronizerHarness harness(stages);
	addComponent(harness);
	getSimulator().powerOn();

	BOOST_TEST(harness.sync.numStages() == stages);
	BOOST_TEST(!harness.sync.value());
	harness.input = true;
	for (auto i : sbr::utils::Range(1, stages)) {
		getSimulator().advance();
		BOOST_TEST(!harness.sync.value(), "input visible after " << i << " ticks");
	}
	getSimulator().advance();
	BOOST_TEST(harness.sync.value());

	// a single tick pulse passes through unchanged
	harness.input = false;
	getSimulator().advance();
	harness.input = true;
	getSimulator().advance(stages - 1);
	BOOST_TEST(!harness.sync.value());
	getSimulator().advance();
	BOOST_TEST(harness.sync.value());
}

BOOST_AUTO_TEST_CASE(synchronizer_stage_limits)
{
	Clocked owner("owner");
	BOOST_CHECK_THROW(Synchronizer(owner, 1), sbr::utils::DesignError);
	BOOST_CHECK_THROW(Synchronizer(owner, 65), sbr::utils::DesignError);
	BOOST_CHECK_NO_THROW(Synchronizer(owner, 64));

	Synchronizer resetHigh(owner, 3, true);
	BOOST_TEST(resetHigh.value());
}

BOOST_FIXTURE_TEST_CASE(counter_wraps_around, BoostUnitTestSimulationFixture)
{
	CountingHarness harness(5);
	addComponent(harness);
	getSimulator().powerOn();

	std::vector<std::uint64_t> values;
	for ([[maybe_unused]] auto i : sbr::utils::Range(7)) {
		values.push_back(harness.counter.value());
		getSimulator().advance();
	}
	BOOST_TEST(values == std::vector<std::uint64_t>({ 0, 1, 2, 3, 4, 0, 1 }), boost::test_tools::per_element());

	harness.enabled = false;
	getSimulator().advance(3);
	BOOST_TEST(harness.counter.value() == 2);
}

BOOST_FIXTURE_TEST_CASE(counter_load_and_reset, BoostUnitTestSimulationFixture)
{
	CountingHarness harness(8, 3);
	harness.enabled = false;
	addComponent(harness);
	getSimulator().powerOn();

	BOOST_TEST(harness.counter.value() == 3);
	harness.counter.load(7);
	BOOST_TEST(harness.counter.value() == 3);
	getSimulator().advance();
	BOOST_TEST(harness.counter.isLast());

	harness.counter.inc();
	BOOST_TEST(harness.counter.becomesFirst());
	getSimulator().advance();
	BOOST_TEST(harness.counter.isFirst());

	harness.counter.dec();
	getSimulator().advance();
	BOOST_TEST(harness.counter.value() == 7);

	harness.counter.reset();
	getSimulator().advance();
	BOOST_TEST(harness.counter.value() == 3);

	BOOST_CHECK_THROW(harness.counter.load(8), sbr::utils::InternalError);
}

BOOST_AUTO_TEST_CASE(counter_limits)
{
	Clocked owner("owner");
	BOOST_CHECK_THROW(Counter(owner, 0), sbr::utils::DesignError);
	BOOST_CHECK_THROW(Counter(owner, 4, 4), sbr::utils::DesignError);
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, baud_rate_generator_period, data::make({ 1, 4, 7 }), divisor)
{
	BaudHarness harness(divisor);
	addComponent(harness);
	runFixedLengthTest(100);

	BOOST_TEST(harness.pulses == 100 / divisor);
}
