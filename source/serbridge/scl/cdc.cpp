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
#include "cdc.h"

#include "../utils/Preprocessor.h"
#include "../utils/BitManipulation.h"

namespace sbr::scl
{
	Synchronizer::Synchronizer(sim::Clocked &owner, size_t stages, bool resetValue) :
		m_numStages(stages),
		m_mask(utils::bitMaskRange(0, stages)),
		m_stages(owner, resetValue ? utils::bitMaskRange(0, stages) : 0)
	{
		SBR_DESIGNCHECK_HINT(stages > 1, "Building a synchronizer chain with less than two synchronization registers is probably a mistake!");
		SBR_DESIGNCHECK_HINT(stages <= 64, "Synchronizer chains are limited to 64 stages.");
	}

	bool Synchronizer::sample(bool raw)
	{
		m_stages = ((m_stages.current() << 1) | (raw ? 1 : 0)) & m_mask;
		return value();
	}
}
