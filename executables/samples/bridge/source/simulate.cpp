#include <serbridge/scl/SerialBridge.h>
#include <serbridge/scl/BridgeConfig.h>
#include <serbridge/scl/sim/UartLineModel.h>
#include <serbridge/simulation/SimulatorCallbacks.h>
#include <serbridge/simulation/Simulator.h>
#include <serbridge/utils/ConfigTree.h>
#include <serbridge/utils/Enumerate.h>

#include <boost/format.hpp>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

using namespace sbr;

namespace {

struct ScriptStep
{
	std::string name;
	std::vector<std::uint8_t> command;
};

}

int main(int argc, char *argv[])
{
	utils::ConfigTree config;
	for (int i = 1; i < argc; i++)
		config.loadFromFile(argv[i]);

	scl::BridgeConfig cfg = scl::BridgeConfig::load(config);
	cfg.dispatcherEnabled = true;
	cfg.applyLogging();

	scl::SerialBridge bridge(cfg);

	sim::SimulatorConsoleOutput console;
	bridge.simulator().addCallbacks(&console);

	std::uint64_t bitPeriod = bridge.config().uart.bitPeriod();
	sim::UartLineDriver host([&](bool level) { bridge.rx(level); }, bitPeriod);
	sim::UartLineMonitor monitor([&] { return bridge.tx(); }, bitPeriod);

	// miso is looped back to mosi, so reads return their operand
	std::vector<ScriptStep> script = {
		{ "echo 0x5a", { 0x04, 0x5A } },
		{ "configure mode3", { 0x05, 0x03 } },
		{ "write 0xa5", { 0x01, 0xA5 } },
		{ "read 0x3c", { 0x02, 0x3C } },
		{ "configure mode0", { 0x05, 0x00 } },
		{ "read 0xc3", { 0x02, 0xC3 } },
		{ "status", { 0x03 } },
		{ "opcode 0x7e", { 0x7E } },
	};

	std::vector<std::uint8_t> responses;
	bool finished = false;

	bridge.simulator().addSimulationProcess([&] { return monitor.run(); });
	bridge.simulator().addSimulationProcess([&]()->SimProcess {
		for (const auto &step : script) {
			co_await host.send(step.command);
			std::uint8_t response = co_await monitor.receive();
			responses.push_back(response);
		}
		finished = true;
	});

	// two frames per command, one response, and plenty of slack for the spi transfer
	std::uint64_t timeout = script.size() * 4 * 10 * bitPeriod;
	for (std::uint64_t i = 0; i < timeout && !finished; i++) {
		bridge.miso(bridge.mosi());
		bridge.tick();
	}

	if (!finished) {
		std::cerr << "Command script did not finish within " << timeout << " ticks" << std::endl;
		return EXIT_FAILURE;
	}

	for (auto [idx, step] : utils::Enumerate(script))
		std::cout << boost::format("%-16s -> 0x%02x") % step.name % unsigned(responses[idx]) << std::endl;

	std::cout << "Simulated ";
	sim::formatTime(std::cout, bridge.simulator().getCurrentSimulationTime());
	std::cout << " in " << bridge.simulator().getCurrentTick() << " ticks" << std::endl;

	return EXIT_SUCCESS;
}
