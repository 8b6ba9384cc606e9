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
#ifndef SBR_NO_PCH

#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/rational.hpp>
#include <boost/stacktrace.hpp>
#include <boost/spirit/home/x3.hpp>

#include <magic_enum.hpp>

#include <yaml-cpp/yaml.h>

#include <bit>
#include <coroutine>
#include <csignal>
#include <cstdint>
#include <concepts>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <iterator>
#include <list>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace boost {
	extern template class rational<std::uint64_t>;
	extern template class basic_format<char>;
}

namespace std {
	extern template class std::vector<std::uint64_t>;
}

#endif
