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

#include "BridgeConfig.h"
#include "BridgeStatus.h"
#include "Dispatcher.h"
#include "io/uart.h"
#include "io/SpiMaster.h"

#include "../simulation/Simulator.h"

#include <cstdint>
#include <memory>
#include <optional>

namespace sbr::scl 
{
	/**
	 * @brief Top level of the bridge: a uart, an spi master, and optionally the command dispatcher, driven by one simulator.
	 * @details The bridge is powered on when constructed. Pins are set and read between ticks, the byte level functions
	 * may be called between ticks or from simulation processes. While the dispatcher is enabled, it owns the byte level
	 * interfaces and calling them from the outside is a design error.
	 */
	class SerialBridge : public sim::Clocked
	{
	public:
		SerialBridge(const BridgeConfig &cfg);

		/// Advances all engines by one tick.
		void tick() { m_simulator.advance(); }
		void tick(std::uint64_t ticks) { m_simulator.advance(ticks); }
		/// Returns all engines to idle and empties all fifos, in-flight frames and transfers are discarded.
		void reset() { m_simulator.reset(); }

		std::optional<RxByte> pollByte();
		bool submit(std::uint8_t byte);
		bool spiStart(std::uint64_t value, bool cpol, bool cpha);
		bool spiStart(std::uint64_t value) { return spiStart(value, m_cfg.spi.cpol, m_cfg.spi.cpha); }
		std::optional<std::uint64_t> spiPoll();

		BridgeStatus status() const { return sampleStatus(m_uartRx, m_uartTx, m_spiMaster); }

		// pins
		void rx(bool level) { m_uartRx.rx(level); }
		bool tx() const { return m_uartTx.tx(); }
		bool sclk() const { return m_spiMaster.sclk(); }
		bool mosi() const { return m_spiMaster.mosi(); }
		bool chipSelect() const { return m_spiMaster.chipSelect(); }
		void miso(bool level) { m_spiMaster.miso(level); }

		sim::Simulator &simulator() { return m_simulator; }
		UartRx &uartRx() { return m_uartRx; }
		UartTx &uartTx() { return m_uartTx; }
		SpiMaster &spiMaster() { return m_spiMaster; }
		Dispatcher *dispatcher() { return m_dispatcher.get(); }
		const BridgeConfig &config() const { return m_cfg; }
	protected:
		BridgeConfig m_cfg;
		sim::Simulator m_simulator;

		UartRx m_uartRx;
		UartTx m_uartTx;
		SpiMaster m_spiMaster;
		std::unique_ptr<Dispatcher> m_dispatcher;

		void checkByteInterfaceAccess() const;
	};
}
