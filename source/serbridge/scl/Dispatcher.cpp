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
#include "Dispatcher.h"

#include "io/uart.h"
#include "io/SpiMaster.h"

#include "../debug/DebugInterface.h"

namespace sbr::scl {

Dispatcher::Dispatcher(UartRx &rx, UartTx &tx, SpiMaster &spi, sim::Clocked *parent, std::string name) :
	sim::Clocked(std::move(name), parent),
	m_rx(rx),
	m_tx(tx),
	m_spi(spi),
	m_state(*this, State::idle),
	m_opcode(*this, 0),
	m_operand(*this, 0),
	m_response(*this, 0),
	m_cpol(*this, spi.config().cpol),
	m_cpha(*this, spi.config().cpha),
	m_commandsProcessed(*this, 0),
	m_unknownCommands(*this, 0)
{
}

void Dispatcher::evaluate()
{
	switch (m_state.current()) {
		case State::idle:
			if (auto byte = m_rx.pollByte()) {
				if (byte->frameError)
					dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DISPATCH
						<< m_name << ": frame errors occurred before opcode " << byte->data);
				m_opcode = byte->data;
				m_state = State::commandReceived;
			}
		break;
		case State::commandReceived:
			decodeCommand();
		break;
		case State::awaitingSpiDataByte:
			if (auto byte = m_rx.pollByte())
				operandReceived(byte->data);
		break;
		case State::spiExecuting:
			if (!m_spi.busy() && m_spi.start(m_operand.current(), m_cpol.current(), m_cpha.current()))
				m_state = State::awaitingSpiResult;
		break;
		case State::awaitingSpiResult:
			if (auto result = m_spi.poll()) {
				if (Command(m_opcode.current()) == Command::read)
					m_response = std::uint8_t(*result);
				else
					m_response = DISPATCH_ACK;
				m_state = State::resultReady;
			}
		break;
		case State::resultReady:
			if (m_tx.submit(m_response.current())) {
				m_commandsProcessed = m_commandsProcessed.current() + 1;
				m_state = State::idle;
			}
		break;
	}
}

void Dispatcher::decodeCommand()
{
	switch (Command(m_opcode.current())) {
		case Command::write:
		case Command::read:
		case Command::echo:
		case Command::configure:
			m_state = State::awaitingSpiDataByte;
		break;
		case Command::status:
			respond(packStatus(sampleStatus(m_rx, m_tx, m_spi)));
		break;
		default:
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_DISPATCH
				<< m_name << ": unknown opcode " << m_opcode.current());
			m_unknownCommands = m_unknownCommands.current() + 1;
			respond(DISPATCH_NAK);
	}
}

void Dispatcher::operandReceived(std::uint8_t operand)
{
	m_operand = operand;
	switch (Command(m_opcode.current())) {
		case Command::echo:
			respond(operand);
		break;
		case Command::configure:
			m_cpha = (operand & 1) != 0;
			m_cpol = (operand & 2) != 0;
			dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_DISPATCH
				<< m_name << ": switching spi to " << spiMode(operand & 2, operand & 1));
			respond(DISPATCH_ACK);
		break;
		default:
			m_state = State::spiExecuting;
	}
}

void Dispatcher::respond(std::uint8_t response)
{
	m_response = response;
	m_state = State::resultReady;
}

}
