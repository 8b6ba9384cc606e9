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
#include "BridgeConfig.h"

namespace sbr::scl {

BridgeConfig BridgeConfig::load(const utils::ConfigTree &config)
{
	BridgeConfig ret;

	ret.clockFrequency = config["clock/frequency"].as<std::uint64_t>(ret.clockFrequency.numerator());

	ret.uart.clockFrequency = ret.clockFrequency;
	ret.uart.baudRate = config["uart/baudRate"].as(ret.uart.baudRate);
	ret.uart.oversampling = config["uart/oversampling"].as(ret.uart.oversampling);
	ret.uart.fifoDepth = config["uart/fifoDepth"].as(ret.uart.fifoDepth);
	ret.uart.synchronizerStages = config["uart/synchronizerStages"].as(ret.uart.synchronizerStages);

	ret.spi.width = config["spi/width"].as(ret.spi.width);
	ret.spi.mode(config["spi/mode"].as(ret.spi.mode()));
	ret.spi.cpol = config["spi/cpol"].as(ret.spi.cpol);
	ret.spi.cpha = config["spi/cpha"].as(ret.spi.cpha);
	ret.spi.clockDivisor = config["spi/clockDivisor"].as(ret.spi.clockDivisor);
	ret.spi.synchronizerStages = config["spi/synchronizerStages"].as(ret.spi.synchronizerStages);
	ret.spi.outIdle = config["spi/outIdle"].as(ret.spi.outIdle);

	ret.dispatcherEnabled = config["dispatcher/enabled"].as(ret.dispatcherEnabled);

	ret.logToConsole = config["log/console"].as(ret.logToConsole);
	ret.logSeverity = config["log/severity"].as(ret.logSeverity);

	return ret;
}

void BridgeConfig::applyLogging() const
{
	if (logToConsole)
		dbg::logConsole(logSeverity);
	else
		dbg::logNone();

	dbg::log(dbg::LogMessage() << dbg::LogMessage::LOG_INFO << dbg::LogMessage::LOG_CONFIG
		<< "Clock at " << clockFrequency.numerator() / clockFrequency.denominator() << " Hz, uart at " << uart.baudRate 
		<< " baud, spi in " << spi.mode() << (dispatcherEnabled ? " with" : " without") << " dispatcher");
}

}
