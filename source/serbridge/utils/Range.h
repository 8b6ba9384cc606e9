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

namespace sbr::utils {

/// Half open integer range [beg, end) for use in range based for loops.
template<typename Integral = size_t>
class Range
{
	public:
		Range(Integral beg, Integral end) : m_beg(beg), m_end(end) { }
		Range(Integral end) : m_end(end) { }

		class iterator {
			public:
				iterator(Integral val) : m_value(val) { }

				iterator &operator++() { ++m_value; return *this; }
				bool operator!=(const iterator &rhs) const { return m_value != rhs.m_value; }
				Integral operator*() const { return m_value; }
			protected:
				Integral m_value;
		};

		iterator begin() const { return iterator(m_beg); }
		iterator end() const { return iterator(m_end); }
	protected:
		Integral m_beg = 0;
		Integral m_end = 0;
};

}
