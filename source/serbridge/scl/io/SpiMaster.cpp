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
#include "SpiMaster.h"

#include "../../debug/DebugInterface.h"
#include "../../utils/BitManipulation.h"
#include "../../utils/Preprocessor.h"

namespace sbr::scl {

void SpiConfig::validate() const
{
	SBR_DESIGNCHECK_HINT(width >= 1 && width <= 64, "The SPI transfer width must be between 1 and 64 bits.");
	SBR_DESIGNCHECK_HINT(clockDivisor >= 1, "The SPI clock divisor must be at least one.");
	SBR_DESIGNCHECK_HINT(clockDivisor > synchronizerStages, "The SPI clock divisor must exceed the number of miso synchronizer stages, otherwise miso is sampled before the slave had a chance to drive it.");
}

SpiMaster::SpiMaster(const SpiConfig &cfg, sim::Clocked *parent, std::string name) :
	sim::Clocked(std::move(name), parent),
	m_cfg((cfg.validate(), cfg)),
	m_valueMask(utils::bitMaskRange(0, cfg.width)),
	m_misoSynchronizer(*this, cfg.synchronizerStages),
	m_divider(*this, cfg.clockDivisor),
	m_requested(*this, 0),
	m_requestValue(*this, 0),
	m_requestCpol(*this, cfg.cpol),
	m_requestCpha(*this, cfg.cpha),
	m_polled(*this, 0),
	m_rejectedStarts(*this, 0),
	m_accepted(*this, 0),
	m_completed(*this, 0),
	m_state(*this, State::idle),
	m_cpol(*this, cfg.cpol),
	m_cpha(*this, cfg.cpha),
	m_txValue(*this, 0),
	m_rxShift(*this, 0),
	m_bitCount(*this, 0),
	m_result(*this, 0),
	m_done(*this, false),
	m_sclk(*this, cfg.cpol),
	m_mosi(*this, cfg.outIdle),
	m_chipSelect(*this, true)
{
	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SPI
		<< m_name << ": " << cfg.width << " bit transfers in " << cfg.mode() << ", serial clock period " << 2 * cfg.clockDivisor << " ticks");
}

bool SpiMaster::busy() const
{
	if (m_state.current() != State::idle || m_requested.next() != m_accepted.current())
		return true;
	// a completed result blocks the next transfer until it is polled
	return m_completed.current() != m_polled.next();
}

bool SpiMaster::start(std::uint64_t value, bool cpol, bool cpha)
{
	if (busy()) {
		m_rejectedStarts = m_rejectedStarts.next() + 1;
		dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_SPI
			<< m_name << ": rejecting transfer start while busy");
		return false;
	}

	m_requestValue = value & m_valueMask;
	m_requestCpol = cpol;
	m_requestCpha = cpha;
	m_requested = m_requested.next() + 1;
	return true;
}

std::optional<std::uint64_t> SpiMaster::poll()
{
	if (m_completed.current() == m_polled.next())
		return std::nullopt;

	m_polled = m_completed.current();
	return m_result.current();
}

bool SpiMaster::txBit(size_t bitsDone) const
{
	if (bitsDone >= m_cfg.width)
		return m_cfg.outIdle;
	return utils::bitExtract(m_txValue.current(), m_cfg.width - 1 - bitsDone);
}

void SpiMaster::evaluate()
{
	bool miso = m_misoSynchronizer.sample(m_misoPin);
	m_done = false;

	switch (m_state.current()) {
		case State::idle:
			if (m_requested.current() != m_accepted.current()) {
				m_accepted = m_requested.current();
				m_cpol = m_requestCpol.current();
				m_cpha = m_requestCpha.current();
				m_txValue = m_requestValue.current();
				m_rxShift = 0;
				m_bitCount = 0;
				m_divider.reset();

				m_chipSelect = false;
				m_sclk = m_requestCpol.current();
				if (!m_requestCpha.current())
					m_mosi = utils::bitExtract(m_requestValue.current(), m_cfg.width - 1);

				m_state = State::transfer;
			}
		break;
		case State::transfer:
			m_divider.inc();
			if (m_divider.isLast())
				clockEdge(miso);
		break;
		case State::finish:
			m_chipSelect = true;
			m_mosi = m_cfg.outIdle;
			m_result = m_rxShift.current();
			m_completed = m_completed.current() + 1;
			m_done = true;
			m_state = State::idle;
		break;
	}
}

void SpiMaster::clockEdge(bool miso)
{
	bool leading = m_sclk.current() == m_cpol.current();
	m_sclk = !m_sclk.current();

	size_t bitsDone = m_bitCount.current();
	bool sampleEdge = leading != m_cpha.current();
	if (sampleEdge) {
		m_rxShift = ((m_rxShift.current() << 1) | (miso ? 1 : 0)) & m_valueMask;
		bitsDone++;
		m_bitCount = bitsDone;
	} else {
		// cpha=0 drives the following bit after the trailing edge, cpha=1 drives the current bit on the leading edge
		m_mosi = txBit(bitsDone);
	}

	if (!leading && bitsDone == m_cfg.width)
		m_state = State::finish;
}

}
