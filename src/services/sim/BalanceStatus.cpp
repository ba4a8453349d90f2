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

#include "BalanceStatus.h"

#include <cstdio>

namespace Tightrope {

const char *balanceSideLabel(BalanceSide side) {
    switch (side) {
    case BalanceSide::LeftDown:
        return "Left down";
    case BalanceSide::RightDown:
        return "Right down";
    case BalanceSide::Centered:
        return "Centered";
    }
    return "Centered";
}

std::string riderInstruction(const RiderSimulation &sim) {
    const BalanceScorer &scorer = sim.getScorer();

    if (scorer.isTrackingLost())
        return "Tracking lost - hold controllers in view";

    if (!scorer.hasGoodOrientation())
        return "Point controllers forward and horizontal!";

    if (!scorer.hasGoodDistance()) {
        char buf[64];
        snprintf(buf, sizeof(buf), "Spread arms wider (%.1fm apart)!",
                 scorer.getParams().minControllerDistance);
        return buf;
    }

    if (!scorer.isBalanced()) {
        switch (balanceSideFor(scorer.getBalanceOffset(), BalanceScorer::CENTRE_DEADBAND)) {
        case BalanceSide::LeftDown:
            return "Raise your LEFT arm!";
        case BalanceSide::RightDown:
            return "Raise your RIGHT arm!";
        case BalanceSide::Centered:
            break;
        }
        return "Keep controllers level!";
    }

    if (scorer.getFinalScore() > sim.getConfig().movement.balancedFinalScore) {
        if (sim.isMoving())
            return "Moving! Maintain horizontal pointers!";
        return "Perfect pose - Ready to move!";
    }

    return "Good pose! Keep position steady...";
}

std::string formatBalanceSummary(const RiderSimulation &sim) {
    char buf[256];
    BalanceSide side = balanceSideFor(sim.getBalanceOffset(), BalanceScorer::CENTRE_DEADBAND);

    snprintf(buf, sizeof(buf),
             "Orientation: %.0f%%\n"
             "Distance: %.0f%%\n"
             "Balance: %.0f%%\n"
             "Side: %s",
             sim.getOrientationScore() * 100.0f,
             sim.getDistanceScore() * 100.0f,
             sim.getBalanceScore() * 100.0f,
             balanceSideLabel(side));

    std::string out(buf);

    if (sim.getConfig().difficulty.enabled) {
        snprintf(buf, sizeof(buf), "\nDifficulty: %.1fx", sim.getDifficultyMultiplier());
        out += buf;
        if (sim.isInGracePeriod()) {
            snprintf(buf, sizeof(buf), "\nGrace Period: %.1fs", sim.getGraceRemaining());
            out += buf;
        }
    }

    return out;
}

std::string formatTickLine(const RiderSimulation &sim) {
    const DisruptionGenerator &gen = sim.getDisruptor();
    char buf[192];

    snprintf(buf, sizeof(buf),
             "t=%7.2fs path=%.3f final=%.2f offset=%+.2f speed=%.2f diff=%.2fx %s",
             sim.getSimTime(), sim.getPathPosition(), sim.getFinalScore(),
             sim.getBalanceOffset(), sim.getMovement().getCurrentSpeed(),
             sim.getDifficultyMultiplier(), disruptionPhaseName(gen.getPhase()));

    return buf;
}

} // namespace Tightrope
