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

#include "Exceptions.h"

#include <string>


#define SBR_ASSERT(x) { if (!(x)) { throw sbr::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x); }}
#define SBR_ASSERT_HINT(x, message) { if (!(x)) { throw sbr::utils::InternalError(__FILE__, __LINE__, std::string("Assertion failed: ") + #x + " Hint: " + message); }}


#define SBR_DESIGNCHECK(x) { if (!(x)) { throw sbr::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x); }}
#define SBR_DESIGNCHECK_HINT(x, message) { if (!(x)) { throw sbr::utils::DesignError(__FILE__, __LINE__, std::string("Design failed: ") + #x + " Hint: " + message); }}
