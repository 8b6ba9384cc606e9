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
#include "../Fifo.h"
#include "../cdc.h"

#include "../../simulation/ClockRational.h"
#include "../../simulation/Clocked.h"
#include "../../simulation/Reg.h"

#include <cstdint>
#include <optional>
#include <string>

namespace sbr::scl 
{
	struct UartConfig
	{
		/// Frequency of the reference tick in ticks per second
		sim::ClockRational clockFrequency = 50'000'000;
		std::uint64_t baudRate = 115200;
		/// Number of sub bit samples per bit on the receiving side, the transmitter uses the same bit period
		size_t oversampling = 16;
		size_t fifoDepth = 16;
		size_t synchronizerStages = 2;

		/// Number of ticks between two oversampling ticks, throws a DesignError if the configuration can not be met.
		std::uint64_t oversamplingDivisor() const;
		/// Number of ticks per bit
		std::uint64_t bitPeriod() const { return oversamplingDivisor() * oversampling; }
		/// The baud rate that actually results from rounding the divisor
		sim::ClockRational effectiveBaudRate() const { return clockFrequency / bitPeriod(); }
	};

	/// Emits a single tick pulse every `divisor` ticks.
	class BaudRateGenerator
	{
	public:
		BaudRateGenerator(sim::Clocked &owner, std::uint64_t divisor);

		/// To be called exactly once per tick, returns whether this is a tick of the generated rate.
		bool tick();
	private:
		Counter m_counter;
	};

	struct RxByte
	{
		std::uint8_t data;
		/// At least one frame was discarded with a frame error between the previously queued byte and this one
		bool frameError;
	};

	struct UartRxStatistics
	{
		std::uint64_t framesReceived = 0;
		std::uint64_t frameErrors = 0;
		std::uint64_t falseStarts = 0;
		std::uint64_t overflowDrops = 0;
	};

	/**
	 * @brief Receives 8N1 frames from the rx pin and queues the payload bytes.
	 * @details The rx line is synchronized and sampled at `oversampling` times the baud rate. A falling edge
	 * is confirmed in the middle of the start bit, data bits and the stop bit are sampled in the middle of their bit period.
	 * Frames with a low stop bit are discarded and signaled through a one tick frameError() pulse.
	 * Frames that arrive while the fifo is full are dropped.
	 */
	class UartRx : public sim::Clocked
	{
	public:
		enum class State {
			idle,
			startConfirm,
			dataBits,
			stopCheck
		};

		UartRx(const UartConfig &cfg, sim::Clocked *parent = nullptr, std::string name = "uart_rx");

		/// Sets the level of the rx pin for the following ticks.
		void rx(bool level) { m_rxPin = level; }
		bool rx() const { return m_rxPin; }

		void evaluate() override;

		/// Removes the oldest received byte from the fifo.
		std::optional<RxByte> pollByte();

		bool frameError() const { return m_frameError.current(); }
		State state() const { return m_state.current(); }
		const Fifo<RxByte> &fifo() const { return m_fifo; }
		const UartConfig &config() const { return m_cfg; }
		UartRxStatistics statistics() const;
	protected:
		UartConfig m_cfg;
		bool m_rxPin = true;

		Fifo<RxByte> m_fifo;
		Synchronizer m_synchronizer;
		BaudRateGenerator m_oversamplingTick;

		sim::Reg<State> m_state;
		sim::Reg<size_t> m_subTick;
		sim::Reg<size_t> m_bitIndex;
		sim::Reg<std::uint8_t> m_shift;
		sim::Reg<bool> m_frameError;

		sim::Reg<std::uint64_t> m_framesReceived;
		sim::Reg<std::uint64_t> m_frameErrors;
		sim::Reg<std::uint64_t> m_falseStarts;
		sim::Reg<std::uint64_t> m_overflowDrops;

		/// Number of frame errors already attached to a queued byte
		sim::Reg<std::uint64_t> m_frameErrorsQueued;

		void stopBitSampled(bool line);
	};

	struct UartTxStatistics
	{
		std::uint64_t framesSent = 0;
	};

	/**
	 * @brief Sends bytes from its fifo as 8N1 frames on the tx pin.
	 * @details Every state lasts one bit period, except for done which pulses txDone() for one tick.
	 * The tx pin is derived from the current state only and idles high.
	 */
	class UartTx : public sim::Clocked
	{
	public:
		enum class State {
			idle,
			start,
			dataBits,
			stop,
			done
		};

		UartTx(const UartConfig &cfg, sim::Clocked *parent = nullptr, std::string name = "uart_tx");

		/// Queues a byte for transmission, returns false if the fifo is full.
		bool submit(std::uint8_t byte) { return m_fifo.tryPush(byte); }

		void evaluate() override;

		bool tx() const;
		bool busy() const { return m_state.current() != State::idle; }
		bool txDone() const { return m_state.current() == State::done; }

		State state() const { return m_state.current(); }
		const Fifo<std::uint8_t> &fifo() const { return m_fifo; }
		const UartConfig &config() const { return m_cfg; }
		UartTxStatistics statistics() const { return { m_framesSent.current() }; }
	protected:
		UartConfig m_cfg;

		Fifo<std::uint8_t> m_fifo;
		Counter m_bitTimer;

		sim::Reg<State> m_state;
		sim::Reg<size_t> m_bitIndex;
		sim::Reg<std::uint8_t> m_shift;
		sim::Reg<std::uint64_t> m_framesSent;
	};
}
