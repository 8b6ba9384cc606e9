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
#include "serbridge/pch.h"
#include "DebugInterface.h"

#include <boost/format.hpp>

#include <iostream>

namespace sbr::dbg {

LogMessage::LogMessage()
{
}

LogMessage::LogMessage(const char *c)
{
	(*this) << c;
}

std::string LogMessage::text() const
{
	std::string res;
	for (const std::string &part : m_messageParts)
		res += part;
	return res;
}


thread_local std::unique_ptr<DebugInterface> DebugInterface::instance = std::make_unique<DebugInterface>();


ConsoleInterface::ConsoleInterface(std::ostream &stream, LogMessage::Severity minSeverity) :
	m_stream(stream), m_minSeverity(minSeverity)
{
}

void ConsoleInterface::log(LogMessage msg)
{
	if (msg.severity() < m_minSeverity)
		return;

	std::string_view severity = magic_enum::enum_name(msg.severity());
	std::string_view source = magic_enum::enum_name(msg.source());
	// strip the LOG_ prefix
	severity.remove_prefix(4);
	source.remove_prefix(4);

	m_stream << boost::format("[%-7s][%-10s] %s") % severity % source % msg.text() << std::endl;
}

size_t MemoryInterface::count(LogMessage::Severity severity) const
{
	size_t res = 0;
	for (const LogMessage &msg : m_messages)
		if (msg.severity() == severity)
			res++;
	return res;
}

void logConsole(LogMessage::Severity minSeverity)
{
	DebugInterface::instance = std::make_unique<ConsoleInterface>(std::clog, minSeverity);
}

MemoryInterface &logMemory()
{
	auto memory = std::make_unique<MemoryInterface>();
	MemoryInterface &res = *memory;
	DebugInterface::instance = std::move(memory);
	return res;
}

void logNone()
{
	DebugInterface::instance = std::make_unique<DebugInterface>();
}

void log(const LogMessage &msg)
{
	DebugInterface::instance->log(msg);
}

std::string howToReachLog()
{
	return DebugInterface::instance->howToReachLog();
}

}
