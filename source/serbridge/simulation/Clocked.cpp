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
#include "serbridge/pch.h"
#include "Clocked.h"

namespace sbr::sim {

RegisterBase::RegisterBase(Clocked &owner)
{
	owner.m_registers.push_back(this);
}

Clocked::Clocked(std::string name, Clocked *parent) : m_name(std::move(name))
{
	if (parent)
		parent->m_children.push_back(this);
}

void Clocked::evaluateAll()
{
	evaluate();
	for (Clocked *child : m_children)
		child->evaluateAll();
}

void Clocked::commitAll()
{
	for (RegisterBase *reg : m_registers)
		reg->commit();
	for (Clocked *child : m_children)
		child->commitAll();
}

void Clocked::resetAll()
{
	for (RegisterBase *reg : m_registers)
		reg->reset();
	for (Clocked *child : m_children)
		child->resetAll();
}

}
