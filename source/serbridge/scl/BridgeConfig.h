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

#include "io/uart.h"
#include "io/SpiMaster.h"

#include "../debug/DebugInterface.h"
#include "../utils/ConfigTree.h"

namespace sbr::scl 
{
	/// Everything needed to build a SerialBridge, usually loaded from a layered yaml configuration.
	struct BridgeConfig
	{
		/// Ticks per second
		sim::ClockRational clockFrequency = 50'000'000;
		UartConfig uart;
		SpiConfig spi;
		bool dispatcherEnabled = true;

		bool logToConsole = true;
		dbg::LogMessage::Severity logSeverity = dbg::LogMessage::LOG_INFO;

		/**
		 * @brief Reads all settings from the config tree, missing keys keep their defaults.
		 * @details The spi mode can be given either as `spi/mode` (mode0 to mode3) or as `spi/cpol` and `spi/cpha`, where the latter take precedence.
		 */
		static BridgeConfig load(const utils::ConfigTree &config);

		/// Installs the configured logging backend.
		void applyLogging() const;
	};
}
