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

#include "StackTrace.h"
#include "Preprocessor.h"

#include <boost/lexical_cast.hpp>

#include <stdexcept>
#include <ostream>
#include <string>


namespace sbr::utils {

std::string composeErrorString(const char *file, size_t line, const std::string &what);

/**
 * @brief Base of all exceptions thrown by serbridge.
 * @details Records the source location of the throw and a stack trace of the call site.
 */
template<class BaseError>
class TracedError : public BaseError
{
	public:
		TracedError(const char *file, size_t line, const std::string &what) : 
				BaseError(composeErrorString(file, line, what)) {
					
			m_trace.record(20, 1);
		}		
		const StackTrace &getStackTrace() const { return m_trace; }
	protected:
		StackTrace m_trace;
};

extern template class TracedError<std::logic_error>;
extern template class TracedError<std::runtime_error>;

/// Thrown when an internal invariant of the library is violated.
class InternalError : public TracedError<std::logic_error>
{
	public:
		InternalError(const char *file, size_t line, const std::string &what);
		~InternalError();
};


/// Thrown when an engine is configured or used in a way that can not work, e.g. a zero bit width.
class DesignError : public TracedError<std::runtime_error>
{
	public:
		DesignError(const char *file, size_t line, const std::string &what);
		~DesignError();
};


template<class BaseError>
std::ostream &operator<<(std::ostream &stream, const TracedError<BaseError> &exception) {
	stream 
		<< exception.what() << std::endl
		<< "Stack trace: " << std::endl
		<< exception.getStackTrace();
		
	return stream;
}

}
