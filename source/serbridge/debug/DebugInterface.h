/*  This file is part of Serbridge, a library for cycle-accurate serial protocol engines.
	Copyright (C) 2021 Michael Offel, Andreas Ley
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

#include <magic_enum.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace sbr {

/**
 * @addtogroup sbr_logging
 * @{
 */

namespace dbg {

/**
 * @brief Helper class for composing logging messages.
 * @details Similarly to std::ostream, it uses the << operator to concatenate message parts.
 * Severity and source are set by streaming the respective enum values, all other enums are rendered by name.
 * 
 * A common use case is `log(LogMessage() << LogMessage::LOG_WARNING << LogMessage::LOG_UART << "Frame error in " << name);`
 */
class LogMessage
{
	public:
		enum Severity {
			LOG_INFO,
			LOG_WARNING,
			LOG_ERROR
		};

		enum Source {
			LOG_CONFIG,
			LOG_SIMULATION,
			LOG_UART,
			LOG_SPI,
			LOG_DISPATCH
		};

		/// Creates an empty log message
		LogMessage();
		/// Same as `LogMessage() << c`
		LogMessage(const char *c);

		/// Sets the severity of the log message
		LogMessage &operator<<(Severity s) { m_severity = s; return *this; }
		/// Sets the origin of the log message
		LogMessage &operator<<(Source s) { m_source = s; return *this; }

		/// Adds a string message part 
		LogMessage &operator<<(const char *c) { m_messageParts.push_back(c); return *this; }
		/// Adds a string message part 
		LogMessage &operator<<(std::string s) { m_messageParts.push_back(std::move(s)); return *this; }
		/// Adds a string message part
		LogMessage &operator<<(std::string_view s) { m_messageParts.push_back(std::string(s)); return *this; }
		/// Adds a boolean as 0 or 1
		LogMessage &operator<<(bool v) { m_messageParts.push_back(v ? "1" : "0"); return *this; }

		/// Adds an integer number to the message
		template<std::integral T> requires (!std::same_as<T, bool> && !std::same_as<T, char>)
		LogMessage &operator<<(T v) { m_messageParts.push_back(std::to_string(v)); return *this; }

		/// Adds the name of an enum value (e.g. a state) to the message
		template<typename T> requires (std::is_enum_v<T>)
		LogMessage &operator<<(T v) { m_messageParts.push_back(std::string(magic_enum::enum_name(v))); return *this; }

		Severity severity() const { return m_severity; }
		Source source() const { return m_source; }

		const std::vector<std::string> &parts() const { return m_messageParts; }
		/// Concatenation of all message parts
		std::string text() const;
	protected:
		Severity m_severity = LOG_INFO;
		Source m_source = LOG_SIMULATION;

		std::vector<std::string> m_messageParts;
};

/**
 * @brief Common interface that all logging backends must implement.
 * @details Also serves as the default implementation that silently ignores all log messages.
 */
class DebugInterface 
{
	public:
		virtual ~DebugInterface() = default;

		thread_local static std::unique_ptr<DebugInterface> instance;

		virtual void log(LogMessage msg) { }
		virtual std::string howToReachLog() { return "Logging disabled! Rerun with a call to e.g. sbr::dbg::logConsole."; }
};

/**
 * @brief Backend that writes every message with at least the given severity to a stream.
 */
class ConsoleInterface : public DebugInterface
{
	public:
		ConsoleInterface(std::ostream &stream, LogMessage::Severity minSeverity);

		void log(LogMessage msg) override;
		std::string howToReachLog() override { return "Log messages are written to the console."; }
	protected:
		std::ostream &m_stream;
		LogMessage::Severity m_minSeverity;
};

/**
 * @brief Backend that keeps all messages in memory, mostly for inspection in unit tests.
 */
class MemoryInterface : public DebugInterface
{
	public:
		void log(LogMessage msg) override { m_messages.push_back(std::move(msg)); }
		std::string howToReachLog() override { return "Log messages are kept in memory."; }

		const std::vector<LogMessage> &messages() const { return m_messages; }
		size_t count(LogMessage::Severity severity) const;
	protected:
		std::vector<LogMessage> m_messages;
};

/// Initialize logging to write to std::clog
void logConsole(LogMessage::Severity minSeverity = LogMessage::LOG_INFO);
/// Initialize logging to record into memory and return the recorder
MemoryInterface &logMemory();
/// Disable logging
void logNone();

/// Log a message to whatever backend has been initialized.
void log(const LogMessage &msg);
/// Print a short, human readable description of how the log can be accessed.
std::string howToReachLog();

}

}

/**@}*/
