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
#include "BridgeStatus.h"

#include "io/uart.h"
#include "io/SpiMaster.h"

namespace sbr::scl {

BridgeStatus sampleStatus(const UartRx &rx, const UartTx &tx, const SpiMaster &spi)
{
	BridgeStatus status;
	status.set(BridgeStatusFlag::frameError, rx.frameError());
	status.set(BridgeStatusFlag::rxFifoFull, rx.fifo().full());
	status.set(BridgeStatusFlag::spiBusy, spi.busy());
	status.set(BridgeStatusFlag::spiDone, spi.done());
	status.set(BridgeStatusFlag::txBusy, tx.busy());
	status.set(BridgeStatusFlag::txDone, tx.txDone());
	status.set(BridgeStatusFlag::rxReady, !rx.fifo().empty());
	return status;
}

}
