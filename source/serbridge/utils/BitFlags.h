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

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace sbr::utils {

/// Small set of flags indexed by the values of an enum.
template<typename EnumType>
class BitFlags {
	public:
		typedef BitFlags<EnumType> Self;

		BitFlags() = default;
		explicit BitFlags(std::uint64_t raw) : m_flags(raw) { }

		Self &insert(EnumType e) { m_flags = m_flags | (1ull << std::size_t(e)); return *this; }
		Self &set(EnumType e, bool value) { return value ? insert(e) : clear(e); }
		Self &clear(EnumType e) { m_flags = m_flags & ~(1ull << std::size_t(e)); return *this; }
		bool contains(EnumType e) const { return m_flags & (1ull << std::size_t(e)); }

		std::uint64_t raw() const { return m_flags; }

		bool operator==(const Self &rhs) const { return m_flags == rhs.m_flags; }
		bool operator!=(const Self &rhs) const { return m_flags != rhs.m_flags; }
	protected:
		std::uint64_t m_flags = 0;
};

}
