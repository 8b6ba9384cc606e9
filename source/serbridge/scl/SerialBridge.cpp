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
#include "SerialBridge.h"

#include "../utils/Preprocessor.h"

namespace sbr::scl {

namespace {
	// the uart runs from the tick of the bridge
	BridgeConfig withUartClock(BridgeConfig cfg)
	{
		cfg.uart.clockFrequency = cfg.clockFrequency;
		return cfg;
	}
}

SerialBridge::SerialBridge(const BridgeConfig &cfg) :
	sim::Clocked("serial_bridge"),
	m_cfg(withUartClock(cfg)),
	m_simulator(m_cfg.clockFrequency),
	m_uartRx(m_cfg.uart, this),
	m_uartTx(m_cfg.uart, this),
	m_spiMaster(m_cfg.spi, this)
{
	if (m_cfg.dispatcherEnabled)
		m_dispatcher = std::make_unique<Dispatcher>(m_uartRx, m_uartTx, m_spiMaster, this);

	m_simulator.addComponent(*this);
	m_simulator.powerOn();
}

void SerialBridge::checkByteInterfaceAccess() const
{
	SBR_DESIGNCHECK_HINT(m_dispatcher == nullptr, "The byte level interfaces belong to the dispatcher while it is enabled.");
}

std::optional<RxByte> SerialBridge::pollByte()
{
	checkByteInterfaceAccess();
	return m_uartRx.pollByte();
}

bool SerialBridge::submit(std::uint8_t byte)
{
	checkByteInterfaceAccess();
	return m_uartTx.submit(byte);
}

bool SerialBridge::spiStart(std::uint64_t value, bool cpol, bool cpha)
{
	checkByteInterfaceAccess();
	return m_spiMaster.start(value, cpol, cpha);
}

std::optional<std::uint64_t> SerialBridge::spiPoll()
{
	checkByteInterfaceAccess();
	return m_spiMaster.poll();
}

}
