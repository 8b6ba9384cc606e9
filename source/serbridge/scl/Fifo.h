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

#include "../simulation/Clocked.h"
#include "../simulation/Reg.h"
#include "../utils/Preprocessor.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sbr::scl
{
	/**
	 * @brief Bounded single producer, single consumer queue that is updated atomically with the tick.
	 * @details The push side only ever writes the write position, the pop side only ever writes the read position.
	 * Each side sees the committed operations of the other side and its own operations of the current tick.
	 * A push and a pop in the same tick thus neither interfere nor depend on their order, and size(), full(), and empty()
	 * report the state at the beginning of the tick.
	 *
	 * Pushing into a full fifo and popping from an empty fifo have no effect.
	 */
	template<typename TData>
	class Fifo : public sim::Clocked
	{
	public:
		Fifo(std::string name, sim::Clocked *parent, size_t capacity = 16);

		// push side
		bool tryPush(const TData &data);
		bool full() const { return size() >= m_storage.size(); }

		// pop side
		std::optional<TData> tryPop();
		bool empty() const { return size() == 0; }

		size_t size() const { return m_writePos.current() - m_readPos.current(); }
		size_t capacity() const { return m_storage.size(); }
	protected:
		std::vector<TData> m_storage;
		sim::Reg<std::uint64_t> m_writePos;
		sim::Reg<std::uint64_t> m_readPos;
	};

	template<typename TData>
	Fifo<TData>::Fifo(std::string name, sim::Clocked *parent, size_t capacity) :
		sim::Clocked(std::move(name), parent),
		m_storage(capacity),
		m_writePos(*this, 0),
		m_readPos(*this, 0)
	{
		SBR_DESIGNCHECK_HINT(capacity > 0, "A fifo must be able to hold at least one element.");
	}

	template<typename TData>
	bool Fifo<TData>::tryPush(const TData &data)
	{
		if (m_writePos.next() - m_readPos.current() >= m_storage.size())
			return false;

		m_storage[m_writePos.next() % m_storage.size()] = data;
		m_writePos = m_writePos.next() + 1;
		return true;
	}

	template<typename TData>
	std::optional<TData> Fifo<TData>::tryPop()
	{
		if (m_writePos.current() == m_readPos.next())
			return std::nullopt;

		TData data = m_storage[m_readPos.next() % m_storage.size()];
		m_readPos = m_readPos.next() + 1;
		return data;
	}
}
