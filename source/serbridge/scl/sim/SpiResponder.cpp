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
#include "SpiResponder.h"

#include "../../utils/BitManipulation.h"
#include "../../utils/Preprocessor.h"

namespace sbr::sim {

SpiResponder::SpiResponder(scl::SpiMaster &master, size_t width, scl::SpiMode mode) :
	m_master(master),
	m_width(width),
	m_cpol(scl::spiModeCpol(mode)),
	m_cpha(scl::spiModeCpha(mode))
{
	SBR_DESIGNCHECK_HINT(width >= 1 && width <= 64, "The SPI transfer width must be between 1 and 64 bits.");
}

void SpiResponder::drive(std::uint64_t response, size_t bitIdx)
{
	if (bitIdx < m_width)
		m_master.miso(utils::bitExtract(response, m_width - 1 - bitIdx));
}

SimProcess SpiResponder::run()
{
	bool prevChipSelect = m_master.chipSelect();
	bool prevSclk = m_master.sclk();

	std::uint64_t response = 0;
	std::uint64_t mosiWord = 0;
	size_t bitsSampled = 0;

	while (true) {
		co_await OnClk();

		bool chipSelect = m_master.chipSelect();
		bool sclk = m_master.sclk();

		if (prevChipSelect && !chipSelect) {
			if (m_responses.empty())
				response = m_defaultResponse;
			else {
				response = m_responses.front();
				m_responses.pop_front();
			}
			mosiWord = 0;
			bitsSampled = 0;
			if (!m_cpha)
				drive(response, 0);
		} else if (!chipSelect && sclk != prevSclk) {
			bool leading = sclk != m_cpol;
			if (leading != m_cpha) {
				mosiWord = (mosiWord << 1) | (m_master.mosi() ? 1 : 0);
				bitsSampled++;
			} else
				drive(response, bitsSampled);
		} else if (!prevChipSelect && chipSelect) {
			m_received.push_back(mosiWord);
			m_receivedBits.push_back(bitsSampled);
		}

		prevChipSelect = chipSelect;
		prevSclk = sclk;
	}
}

}
