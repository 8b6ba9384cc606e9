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

// 4 ticks per oversampling tick, 64 ticks per bit
UartConfig testConfig()
{
	UartConfig cfg;
	cfg.clockFrequency = 640'000;
	cfg.baudRate = 10'000;
	cfg.oversampling = 16;
	return cfg;
}

}

BOOST_AUTO_TEST_CASE(uart_config_timing)
{
	UartConfig cfg = testConfig();
	BOOST_TEST(cfg.oversamplingDivisor() == 4);
	BOOST_TEST(cfg.bitPeriod() == 64);
	BOOST_TEST(cfg.effectiveBaudRate() == ClockRational(10'000));

	cfg.baudRate = 9'600;
	BOOST_TEST(cfg.oversamplingDivisor() == 4);
	BOOST_TEST(cfg.effectiveBaudRate() == ClockRational(10'000));

	cfg = UartConfig{};
	BOOST_TEST(cfg.oversamplingDivisor() == 27);
}

BOOST_AUTO_TEST_CASE(uart_invalid_config)
{
	UartConfig cfg = testConfig();
	cfg.oversampling = 1;
	BOOST_CHECK_THROW(UartRx{cfg}, sbr::utils::DesignError);

	cfg = testConfig();
	cfg.baudRate = 100'000;
	BOOST_CHECK_THROW(UartTx{cfg}, sbr::utils::DesignError);

	cfg = testConfig();
	cfg.baudRate = 0;
	BOOST_CHECK_THROW(cfg.bitPeriod(), sbr::utils::DesignError);

	cfg = testConfig();
	cfg.fifoDepth = 0;
	BOOST_CHECK_THROW(UartRx{cfg}, sbr::utils::DesignError);
	BOOST_CHECK_THROW(UartTx{cfg}, sbr::utils::DesignError);
}

BOOST_FIXTURE_TEST_CASE(uart_loopback, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	UartTx tx(cfg);
	UartRx rx(cfg);
	addComponent(tx);
	addComponent(rx);

	addSimulationProcess([&]()->SimProcess {
		while (true) {
			rx.rx(tx.tx());
			co_await OnClk();
		}
	});

	addSimulationProcess([&]()->SimProcess {
		BOOST_TEST(tx.tx());
		BOOST_TEST(tx.submit(0x55));

		std::optional<RxByte> byte;
		while (!(byte = rx.pollByte()))
			co_await OnClk();

		BOOST_TEST(byte->data == 0x55);
		BOOST_TEST(!byte->frameError);
		BOOST_TEST(getSimulator().getCurrentTick() < 10 * cfg.bitPeriod());
		BOOST_TEST(rx.statistics().framesReceived == 1);

		co_await WaitFor(cfg.bitPeriod());
		BOOST_TEST(!tx.busy());
		BOOST_TEST(tx.tx());
		BOOST_TEST(tx.statistics().framesSent == 1);
		BOOST_TEST(!rx.pollByte());
		stopTest();
	});

	runTest(20 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_transmit_frames, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	cfg.fifoDepth = 2;
	UartTx tx(cfg);
	addComponent(tx);

	UartLineMonitor monitor([&] { return tx.tx(); }, cfg.bitPeriod());
	addSimulationProcess([&] { return monitor.run(); });

	size_t donePulses = 0;
	addSimulationProcess([&]()->SimProcess {
		while (true) {
			co_await OnClk();
			if (tx.txDone())
				donePulses++;
		}
	});

	addSimulationProcess([&]()->SimProcess {
		BOOST_TEST(tx.submit(0x00));
		BOOST_TEST(tx.submit(0xFF));
		BOOST_TEST(!tx.submit(0x12));
		co_await OnClk();
		BOOST_TEST(tx.fifo().full());

		while (!tx.submit(0xA5))
			co_await OnClk();

		while (monitor.frames().size() < 3)
			co_await OnClk();
		co_await WaitFor(cfg.bitPeriod());

		BOOST_TEST(monitor.bytes() == std::vector<std::uint8_t>({ 0x00, 0xFF, 0xA5 }), boost::test_tools::per_element());
		BOOST_TEST(donePulses == 3);
		BOOST_TEST(tx.statistics().framesSent == 3);
		BOOST_TEST(!tx.busy());
		stopTest();
	});

	runTest(40 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_frame_error, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	size_t errorPulses = 0;
	addSimulationProcess([&]()->SimProcess {
		while (true) {
			co_await OnClk();
			if (rx.frameError())
				errorPulses++;
		}
	});

	addSimulationProcess([&]()->SimProcess {
		co_await driver.send(0xA3, false);
		co_await WaitFor(2 * cfg.bitPeriod());

		BOOST_TEST(errorPulses == 1);
		BOOST_TEST(rx.statistics().frameErrors == 1);
		BOOST_TEST(rx.statistics().framesReceived == 0);
		BOOST_TEST(rx.fifo().empty());
		BOOST_TEST(!rx.pollByte());

		co_await driver.send({ 0x42, 0x43 });
		co_await WaitFor(cfg.bitPeriod());

		// the discarded frame preceded 0x42
		auto first = rx.pollByte();
		BOOST_REQUIRE(first);
		BOOST_TEST(first->data == 0x42);
		BOOST_TEST(first->frameError);
		co_await OnClk();

		auto second = rx.pollByte();
		BOOST_REQUIRE(second);
		BOOST_TEST(second->data == 0x43);
		BOOST_TEST(!second->frameError);

		BOOST_TEST(errorPulses == 1);
		stopTest();
	});

	runTest(40 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_frame_error_does_not_taint_queued_bytes, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	addSimulationProcess([&]()->SimProcess {
		co_await driver.send(0x55);
		co_await driver.send(0x33, false);
		co_await WaitFor(2 * cfg.bitPeriod());

		BOOST_TEST(rx.statistics().frameErrors == 1);
		BOOST_TEST(rx.fifo().size() == 1);

		co_await driver.send(0x66);
		co_await WaitFor(cfg.bitPeriod());
		BOOST_TEST(rx.fifo().size() == 2);

		auto valid = rx.pollByte();
		BOOST_REQUIRE(valid);
		BOOST_TEST(valid->data == 0x55);
		BOOST_TEST(!valid->frameError);
		co_await OnClk();

		auto afterError = rx.pollByte();
		BOOST_REQUIRE(afterError);
		BOOST_TEST(afterError->data == 0x66);
		BOOST_TEST(afterError->frameError);
		co_await OnClk();

		BOOST_TEST(!rx.pollByte());
		stopTest();
	});

	runTest(60 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_line_break, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	addSimulationProcess([&]()->SimProcess {
		co_await driver.lineBreak(20);

		// a held low line reads as a sequence of all zero frames without stop bits
		BOOST_TEST(rx.statistics().frameErrors == 2);
		BOOST_TEST(rx.statistics().framesReceived == 0);
		BOOST_TEST(rx.fifo().empty());
		stopTest();
	});

	runTest(40 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_false_start, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	addSimulationProcess([&]()->SimProcess {
		co_await WaitFor(10);
		co_await driver.glitch(cfg.bitPeriod() / 4);
		co_await WaitFor(cfg.bitPeriod());

		BOOST_TEST(rx.statistics().falseStarts == 1);
		BOOST_TEST(rx.state() == UartRx::State::idle);

		co_await driver.send(0x3C);
		co_await OnClk();

		auto byte = rx.pollByte();
		BOOST_REQUIRE(byte);
		BOOST_TEST(byte->data == 0x3C);
		BOOST_TEST(!byte->frameError);
		BOOST_TEST(rx.statistics().frameErrors == 0);
		stopTest();
	});

	runTest(20 * cfg.bitPeriod());
}

BOOST_FIXTURE_TEST_CASE(uart_overflow_drops_newest, BoostUnitTestSimulationFixture)
{
	UartConfig cfg = testConfig();
	cfg.fifoDepth = 2;
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	addSimulationProcess([&]()->SimProcess {
		co_await driver.send({ 1, 2, 3 });
		co_await WaitFor(cfg.bitPeriod());

		BOOST_TEST(rx.fifo().full());
		BOOST_TEST(rx.statistics().framesReceived == 3);
		BOOST_TEST(rx.statistics().overflowDrops == 1);

		for (std::uint8_t expected : { 1, 2 }) {
			auto byte = rx.pollByte();
			BOOST_REQUIRE(byte);
			BOOST_TEST(byte->data == expected);
			co_await OnClk();
		}
		BOOST_TEST(!rx.pollByte());
		stopTest();
	});

	runTest(40 * cfg.bitPeriod());
}

BOOST_DATA_TEST_CASE_F(BoostUnitTestSimulationFixture, uart_receive_all_values, data::make({ 0x00, 0x01, 0x80, 0xFF, 0x5A }), value)
{
	UartConfig cfg = testConfig();
	cfg.synchronizerStages = 3;
	UartRx rx(cfg);
	addComponent(rx);

	UartLineDriver driver([&](bool level) { rx.rx(level); }, cfg.bitPeriod());

	addSimulationProcess([&]()->SimProcess {
		co_await WaitFor(value + 1);
		co_await driver.send(std::uint8_t(value));
		co_await OnClk();

		auto byte = rx.pollByte();
		BOOST_REQUIRE(byte);
		BOOST_TEST(byte->data == value);
		stopTest();
	});

	runTest(20 * cfg.bitPeriod());
}
