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
#include "StackTrace.h"

#include "Range.h"

#include <boost/format.hpp>

#include <algorithm>


template class std::vector<boost::stacktrace::frame>;

namespace sbr::utils 
{

	void StackTrace::record(size_t size, size_t skipTop) 
	{ 
		boost::stacktrace::stacktrace trace;

		size_t traceSize = trace.size();
		if (traceSize > skipTop) {
			size_t count = std::min(size, traceSize - skipTop);
			m_trace.resize(count);
			for (auto i : Range(count))
				m_trace[i] = trace[i + skipTop];
		} else
			m_trace.clear();
	}

	std::ostream &operator<<(std::ostream &stream, const StackTrace &trace)
	{
		const auto &frames = trace.frames();
		for (auto i : Range(frames.size())) {
			const auto &frame = frames[i];
			stream << "	" << i << ": ";
			if (frame.source_file().empty())
				stream << frame.name();
			else
				stream << boost::format("%s at %s:%d") % frame.name() % frame.source_file() % frame.source_line();
			stream << std::endl;
		}
		return stream;
	}
}
