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
#include "Exceptions.h"

namespace sbr::utils {

template class TracedError<std::logic_error>;
template class TracedError<std::runtime_error>;

std::string composeErrorString(const char *file, size_t line, const std::string &what)
{
	return what + " Location: " + file + '('+boost::lexical_cast<std::string>(line)+')';
}

InternalError::InternalError(const char *file, size_t line, const std::string &what) : TracedError<std::logic_error>(file, line, what) { }
InternalError::~InternalError() { }

DesignError::DesignError(const char *file, size_t line, const std::string &what) : TracedError<std::runtime_error>(file, line, what) { }
DesignError::~DesignError() { }

}
