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

#include "../utils/BitFlags.h"

#include <cstdint>

namespace sbr::scl 
{
	class UartRx;
	class UartTx;
	class SpiMaster;

	/// Status bits in the order in which they are packed into a status byte, starting at the least significant bit.
	enum class BridgeStatusFlag {
		frameError,
		rxFifoFull,
		spiBusy,
		spiDone,
		txBusy,
		txDone,
		rxReady
	};

	using BridgeStatus = utils::BitFlags<BridgeStatusFlag>;

	/// Samples the status of the engines as visible in the current tick.
	BridgeStatus sampleStatus(const UartRx &rx, const UartTx &tx, const SpiMaster &spi);

	inline std::uint8_t packStatus(const BridgeStatus &status) { return std::uint8_t(status.raw()); }
}
