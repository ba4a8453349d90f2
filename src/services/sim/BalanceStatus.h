/******************************************************************************
 *
 *    This file is part of Tightrope
 *    Copyright (C) 2024-2026 Tightrope contributors
 *
 *    This program is free software; you can redistribute it and/or modify
 *    it under the terms of the GNU General Public License as published by
 *    the Free Software Foundation; either version 2 of the License, or
 *    (at your option) any later version.
 *
 *    This program is distributed in the hope that it will be useful,
 *    but WITHOUT ANY WARRANTY; without even the implied warranty of
 *    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *    GNU General Public License for more details.
 *
 *    You should have received a copy of the GNU General Public License
 *    along with this program; if not, write to the Free Software
 *    Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA  02111-1307  USA
 *
 *****************************************************************************/

#ifndef __BALANCESTATUS_H
#define __BALANCESTATUS_H

#include <string>

#include "haptics/BalanceHaptics.h"
#include "sim/RiderSimulation.h"

namespace Tightrope {

/// "Left down" / "Right down" / "Centered"
const char *balanceSideLabel(BalanceSide side);

/// Highest-priority correction for the rider (orientation, then spread,
/// then level, then encouragement)
std::string riderInstruction(const RiderSimulation &sim);

/// Multi-line score breakdown: percentages, side, difficulty and grace
std::string formatBalanceSummary(const RiderSimulation &sim);

/// One-line state for per-tick traces
std::string formatTickLine(const RiderSimulation &sim);

} // namespace Tightrope

#endif // __BALANCESTATUS_H
