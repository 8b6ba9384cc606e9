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

#include "../Counter.h"
#include "../cdc.h"

#include "../../simulation/Clocked.h"
#include "../../simulation/Reg.h"

#include <cstdint>
#include <optional>
#include <string>

namespace sbr::scl 
{
	/// The four combinations of clock polarity (CPOL) and clock phase (CPHA).
	enum class SpiMode {
		mode0, ///< CPOL=0, CPHA=0
		mode1, ///< CPOL=0, CPHA=1
		mode2, ///< CPOL=1, CPHA=0
		mode3  ///< CPOL=1, CPHA=1
	};

	inline bool spiModeCpol(SpiMode mode) { return mode == SpiMode::mode2 || mode == SpiMode::mode3; }
	inline bool spiModeCpha(SpiMode mode) { return mode == SpiMode::mode1 || mode == SpiMode::mode3; }
	inline SpiMode spiMode(bool cpol, bool cpha) { return SpiMode((cpol ? 2 : 0) | (cpha ? 1 : 0)); }

	struct SpiConfig
	{
		/// Bits per transfer, 1 to 64
		size_t width = 8;
		/// Idle level of the serial clock
		bool cpol = false;
		/// false: sample on the leading edge, shift on the trailing edge. true: shift on the leading edge, sample on the trailing edge.
		bool cpha = false;
		/// Number of ticks between two serial clock edges, must exceed the synchronizer latency of miso.
		std::uint64_t clockDivisor = 4;
		size_t synchronizerStages = 2;
		/// Level of mosi while no transfer is active
		bool outIdle = false;

		SpiConfig &mode(SpiMode m) { cpol = spiModeCpol(m); cpha = spiModeCpha(m); return *this; }
		SpiMode mode() const { return spiMode(cpol, cpha); }

		/// Throws a DesignError if the configuration can not be built.
		void validate() const;
	};

	struct SpiMasterStatistics
	{
		std::uint64_t transfersCompleted = 0;
		std::uint64_t rejectedStarts = 0;
	};

	/**
	 * @brief Full duplex SPI master with a single chip select for all four clock modes.
	 * @details A transfer shifts out `width` bits MSB first on mosi while shifting in the same number of bits from miso.
	 * The serial clock toggles every `clockDivisor` ticks, so one serial clock period is twice the divisor.
	 * Miso passes through a synchronizer before it is sampled.
	 *
	 * The caller requests a transfer with start() and collects the result with poll(). 
	 * A request is accepted in the tick following the start() call which asserts the chip select (active low).
	 * After the last trailing edge, the chip select is deasserted for one tick in which done() pulses and the result becomes available.
	 */
	class SpiMaster : public sim::Clocked
	{
	public:
		enum class State {
			idle,
			transfer,
			finish
		};

		SpiMaster(const SpiConfig &cfg, sim::Clocked *parent = nullptr, std::string name = "spi_master");

		/// Starts a transfer in the configured mode.
		bool start(std::uint64_t value) { return start(value, m_cfg.cpol, m_cfg.cpha); }
		/// Starts a transfer in the given mode, returns false (and does nothing) while busy().
		bool start(std::uint64_t value, bool cpol, bool cpha);
		/// Returns the received value of the last completed transfer, once.
		std::optional<std::uint64_t> poll();

		void evaluate() override;

		/// True from a successful start() until the result of that transfer was polled.
		bool busy() const;
		bool done() const { return m_done.current(); }
		State state() const { return m_state.current(); }

		bool sclk() const { return m_sclk.current(); }
		bool mosi() const { return m_mosi.current(); }
		/// Chip select pin level, low while selected
		bool chipSelect() const { return m_chipSelect.current(); }
		void miso(bool level) { m_misoPin = level; }
		bool miso() const { return m_misoPin; }

		const SpiConfig &config() const { return m_cfg; }
		SpiMasterStatistics statistics() const { return { m_completed.current(), m_rejectedStarts.current() }; }
	protected:
		SpiConfig m_cfg;
		std::uint64_t m_valueMask;
		bool m_misoPin = false;

		Synchronizer m_misoSynchronizer;
		Counter m_divider;

		// written by the caller
		sim::Reg<std::uint64_t> m_requested;
		sim::Reg<std::uint64_t> m_requestValue;
		sim::Reg<bool> m_requestCpol;
		sim::Reg<bool> m_requestCpha;
		sim::Reg<std::uint64_t> m_polled;
		sim::Reg<std::uint64_t> m_rejectedStarts;

		// written by the engine
		sim::Reg<std::uint64_t> m_accepted;
		sim::Reg<std::uint64_t> m_completed;
		sim::Reg<State> m_state;
		sim::Reg<bool> m_cpol;
		sim::Reg<bool> m_cpha;
		sim::Reg<std::uint64_t> m_txValue;
		sim::Reg<std::uint64_t> m_rxShift;
		sim::Reg<size_t> m_bitCount;
		sim::Reg<std::uint64_t> m_result;
		sim::Reg<bool> m_done;

		sim::Reg<bool> m_sclk;
		sim::Reg<bool> m_mosi;
		sim::Reg<bool> m_chipSelect;

		bool txBit(size_t bitsDone) const;
		void clockEdge(bool miso);
	};
}
