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

#include "BridgeStatus.h"

#include "../simulation/Clocked.h"
#include "../simulation/Reg.h"

#include <cstdint>
#include <string>

namespace sbr::scl 
{
	class UartRx;
	class UartTx;
	class SpiMaster;

	/// Command opcodes understood by the Dispatcher
	enum class Command : std::uint8_t {
		write = 0x01,		///< operand is sent via SPI, answered with ACK
		read = 0x02,		///< operand is sent via SPI, answered with the received byte
		status = 0x03,		///< answered with the packed bridge status
		echo = 0x04,		///< operand is answered unchanged
		configure = 0x05	///< operand selects the SPI mode (bit 0: CPHA, bit 1: CPOL), answered with ACK
	};

	constexpr std::uint8_t DISPATCH_ACK = 0x06;
	constexpr std::uint8_t DISPATCH_NAK = 0x15;

	struct DispatcherStatistics
	{
		std::uint64_t commandsProcessed = 0;
		std::uint64_t unknownCommands = 0;
	};

	/**
	 * @brief Sequencer that executes byte commands received by the uart on the spi master and sends back the responses.
	 * @details Takes exclusive ownership of the byte level interfaces of all three engines: 
	 * it pops from the rx fifo, starts and polls spi transfers, and pushes responses into the tx fifo.
	 * A full tx fifo or a busy spi master stalls the dispatcher until they become available again.
	 */
	class Dispatcher : public sim::Clocked
	{
	public:
		enum class State {
			idle,
			commandReceived,
			awaitingSpiDataByte,
			spiExecuting,
			awaitingSpiResult,
			resultReady
		};

		Dispatcher(UartRx &rx, UartTx &tx, SpiMaster &spi, sim::Clocked *parent = nullptr, std::string name = "dispatcher");

		void evaluate() override;

		State state() const { return m_state.current(); }
		bool spiCpol() const { return m_cpol.current(); }
		bool spiCpha() const { return m_cpha.current(); }
		DispatcherStatistics statistics() const { return { m_commandsProcessed.current(), m_unknownCommands.current() }; }
	protected:
		UartRx &m_rx;
		UartTx &m_tx;
		SpiMaster &m_spi;

		sim::Reg<State> m_state;
		sim::Reg<std::uint8_t> m_opcode;
		sim::Reg<std::uint8_t> m_operand;
		sim::Reg<std::uint8_t> m_response;
		sim::Reg<bool> m_cpol;
		sim::Reg<bool> m_cpha;

		sim::Reg<std::uint64_t> m_commandsProcessed;
		sim::Reg<std::uint64_t> m_unknownCommands;

		void decodeCommand();
		void operandReceived(std::uint8_t operand);
		void respond(std::uint8_t response);
	};
}
