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
#include "uart.h"

#include "../../debug/DebugInterface.h"
#include "../../utils/Preprocessor.h"

namespace sbr::scl {

std::uint64_t UartConfig::oversamplingDivisor() const
{
	SBR_DESIGNCHECK_HINT(baudRate > 0, "The baud rate must be positive.");
	SBR_DESIGNCHECK_HINT(oversampling >= 2, "The oversampling factor must be at least two to sample in the middle of a bit.");

	std::uint64_t divisor = sim::floor(clockFrequency / (baudRate * oversampling));
	SBR_DESIGNCHECK_HINT(divisor >= 1, "The clock frequency is too low for the requested baud rate and oversampling.");
	return divisor;
}


BaudRateGenerator::BaudRateGenerator(sim::Clocked &owner, std::uint64_t divisor) :
	m_counter(owner, divisor)
{
}

bool BaudRateGenerator::tick()
{
	bool pulse = m_counter.isLast();
	m_counter.inc();
	return pulse;
}


UartRx::UartRx(const UartConfig &cfg, sim::Clocked *parent, std::string name) :
	sim::Clocked(std::move(name), parent),
	m_cfg(cfg),
	m_fifo(m_name + "_fifo", this, cfg.fifoDepth),
	m_synchronizer(*this, cfg.synchronizerStages, true),
	m_oversamplingTick(*this, cfg.oversamplingDivisor()),
	m_state(*this, State::idle),
	m_subTick(*this, 0),
	m_bitIndex(*this, 0),
	m_shift(*this, 0),
	m_frameError(*this, false),
	m_framesReceived(*this, 0),
	m_frameErrors(*this, 0),
	m_falseStarts(*this, 0),
	m_overflowDrops(*this, 0),
	m_frameErrorsQueued(*this, 0)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_UART
		<< m_name << ": " << cfg.baudRate << " baud, " << cfg.oversampling << "x oversampling every "
		<< cfg.oversamplingDivisor() << " ticks, fifo depth " << cfg.fifoDepth);
}

void UartRx::evaluate()
{
	bool line = m_synchronizer.sample(m_rxPin);
	m_frameError = false;

	if (!m_oversamplingTick.tick())
		return;

	switch (m_state.current()) {
		case State::idle:
			if (!line) {
				m_state = State::startConfirm;
				m_subTick = 0;
			}
		break;
		case State::startConfirm:
			if (m_subTick.current() == m_cfg.oversampling / 2 - 1) {
				if (!line) {
					m_state = State::dataBits;
					m_bitIndex = 0;
					m_shift = 0;
				} else {
					m_state = State::idle;
					m_falseStarts = m_falseStarts.current() + 1;
				}
				m_subTick = 0;
			} else
				m_subTick = m_subTick.current() + 1;
		break;
		case State::dataBits:
			if (m_subTick.current() == m_cfg.oversampling - 1) {
				m_shift = std::uint8_t(m_shift.current() | ((line ? 1 : 0) << m_bitIndex.current()));
				if (m_bitIndex.current() == 7)
					m_state = State::stopCheck;
				else
					m_bitIndex = m_bitIndex.current() + 1;
				m_subTick = 0;
			} else
				m_subTick = m_subTick.current() + 1;
		break;
		case State::stopCheck:
			if (m_subTick.current() == m_cfg.oversampling - 1) {
				stopBitSampled(line);
				m_state = State::idle;
				m_subTick = 0;
			} else
				m_subTick = m_subTick.current() + 1;
		break;
	}
}

void UartRx::stopBitSampled(bool line)
{
	if (!line) {
		m_frameError = true;
		m_frameErrors = m_frameErrors.current() + 1;
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_UART
			<< m_name << ": frame error, discarding byte " << m_shift.current());
		return;
	}

	m_framesReceived = m_framesReceived.current() + 1;
	RxByte byte{ m_shift.current(), m_frameErrors.current() != m_frameErrorsQueued.current() };
	if (m_fifo.tryPush(byte))
		m_frameErrorsQueued = m_frameErrors.current();
	else {
		m_overflowDrops = m_overflowDrops.current() + 1;
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_WARNING << dbg::LogMessage::LOG_UART
			<< m_name << ": fifo full, dropping byte " << m_shift.current());
	}
}

std::optional<RxByte> UartRx::pollByte()
{
	return m_fifo.tryPop();
}

UartRxStatistics UartRx::statistics() const
{
	return {
		.framesReceived = m_framesReceived.current(),
		.frameErrors = m_frameErrors.current(),
		.falseStarts = m_falseStarts.current(),
		.overflowDrops = m_overflowDrops.current(),
	};
}


UartTx::UartTx(const UartConfig &cfg, sim::Clocked *parent, std::string name) :
	sim::Clocked(std::move(name), parent),
	m_cfg(cfg),
	m_fifo(m_name + "_fifo", this, cfg.fifoDepth),
	m_bitTimer(*this, cfg.bitPeriod()),
	m_state(*this, State::idle),
	m_bitIndex(*this, 0),
	m_shift(*this, 0),
	m_framesSent(*this, 0)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_UART
		<< m_name << ": " << cfg.baudRate << " baud, " << cfg.bitPeriod() << " ticks per bit, fifo depth " << cfg.fifoDepth);
}

void UartTx::evaluate()
{
	switch (m_state.current()) {
		case State::idle:
			if (auto byte = m_fifo.tryPop()) {
				m_shift = *byte;
				m_state = State::start;
				m_bitTimer.reset();
			}
		break;
		case State::start:
			m_bitTimer.inc();
			if (m_bitTimer.isLast()) {
				m_state = State::dataBits;
				m_bitIndex = 0;
			}
		break;
		case State::dataBits:
			m_bitTimer.inc();
			if (m_bitTimer.isLast()) {
				if (m_bitIndex.current() == 7)
					m_state = State::stop;
				else
					m_bitIndex = m_bitIndex.current() + 1;
			}
		break;
		case State::stop:
			m_bitTimer.inc();
			if (m_bitTimer.isLast())
				m_state = State::done;
		break;
		case State::done:
			m_framesSent = m_framesSent.current() + 1;
			m_state = State::idle;
		break;
	}
}

bool UartTx::tx() const
{
	switch (m_state.current()) {
		case State::start: return false;
		case State::dataBits: return (m_shift.current() >> m_bitIndex.current()) & 1;
		default: return true;
	}
}

}
