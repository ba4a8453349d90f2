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

// tightropeHeadless: drives one rider along the rope with a scripted pose
// stream and reports balance, disruptions and haptics on the console.

#include <cstdio>
#include <iostream>
#include <stdexcept>
#include <string>

#include "TightropeMath.h"
#include "config/SimConfig.h"
#include "haptics/BalanceHaptics.h"
#include "logger.h"
#include "pose/ScriptedPoseSource.h"
#include "sim/BalanceStatus.h"
#include "sim/RiderSimulation.h"
#include "stdlog.h"

using namespace Tightrope;

// ---------- Console haptics ----------

class ConsoleHaptics : public IHapticSink {
public:
    bool sendHapticImpulse(Hand hand, float amplitude, float duration) override {
        if (hand == Hand::Left)
            ++mLeftPulses;
        else
            ++mRightPulses;
        LOG_VERBOSE("haptic %s amp=%.2f dur=%.2fs",
                    hand == Hand::Left ? "left" : "right", amplitude, duration);
        return true;
    }

    int leftPulses() const { return mLeftPulses; }
    int rightPulses() const { return mRightPulses; }

private:
    int mLeftPulses = 0;
    int mRightPulses = 0;
};

// ---------- Usage ----------

static void printUsage(const char *prog) {
    std::cerr << "Tightrope Headless Rider" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Usage: " << prog << " [options]" << std::endl;
    std::cerr << std::endl;
    std::cerr << "Options:" << std::endl;
    std::cerr << "  --config <path>    YAML config file (default: ./tightrope.yaml)" << std::endl;
    std::cerr << "  --scenario <name>  Pose script: level, tilt, wobble, dropout, slump (default: level)" << std::endl;
    std::cerr << "  --duration <s>     Simulated seconds to run (default: 30)" << std::endl;
    std::cerr << "  --rate <hz>        Ticks per simulated second (default: 90)" << std::endl;
    std::cerr << "  --seed <n>         RNG seed for disruptions (default: 1)" << std::endl;
    std::cerr << "  --speed <m/s>      Base plank speed" << std::endl;
    std::cerr << "  --chance <0..1>    Disruption chance (ramp base and fixed)" << std::endl;
    std::cerr << "  --no-disruptions   Disable balance disruptions" << std::endl;
    std::cerr << "  --no-difficulty    Disable difficulty progression" << std::endl;
    std::cerr << "  --no-warning       Start disruptions without the warning pulse" << std::endl;
    std::cerr << "  --verbose, -v      Per-tick trace and debug logging" << std::endl;
    std::cerr << "  --help, -h         Show this help" << std::endl;
}

// ---------- Ride ----------

struct RideStats {
    int disruptions = 0;
    int interrupted = 0;
    int warnings = 0;
    int endpoints = 0;
    int balanceLost = 0;
};

static void wireListeners(RiderSimulation &sim, RideStats &stats) {
    sim.getDisruptor().addWarningListener([&sim, &stats](DisruptionType type) {
        ++stats.warnings;
        std::printf("[%7.2fs] warning: %s incoming\n", sim.getSimTime(), disruptionTypeName(type));
    });

    sim.getDisruptor().addStartedListener([&sim, &stats](const DisruptionEvent &ev) {
        ++stats.disruptions;
        std::printf("[%7.2fs] %s started: strength %.2f towards %s for %.1fs\n",
                    sim.getSimTime(), disruptionTypeName(ev.type), ev.strength,
                    ev.direction < 0.0f ? "left" : "right", ev.duration);
    });

    sim.getDisruptor().addEndedListener([&sim, &stats](const DisruptionEvent &ev, bool interrupted) {
        if (interrupted)
            ++stats.interrupted;
        std::printf("[%7.2fs] %s %s\n", sim.getSimTime(), disruptionTypeName(ev.type),
                    interrupted ? "interrupted" : "ended");
    });

    sim.getScorer().addBalanceLostListener([&stats](bool) {
        ++stats.balanceLost;
    });

    sim.addAttachmentListener([&sim](bool attached) {
        std::printf("[%7.2fs] rider %s at t=%.3f\n", sim.getSimTime(),
                    attached ? "attached" : "detached", sim.getPathPosition());
    });

    sim.addEndpointListener([&sim, &stats](bool atEnd) {
        ++stats.endpoints;
        std::printf("[%7.2fs] reached %s anchor\n", sim.getSimTime(), atEnd ? "end" : "start");
    });
}

static void runRide(const SimConfig &cfg, const CliResult &cli, PoseScenario scenario) {
    ConsoleHaptics haptics;
    RiderSimulation sim(cfg, &haptics);
    ScriptedPoseSource poses(scenario);
    RideStats stats;

    wireListeners(sim, stats);

    const float dt = 1.0f / cfg.tickRate;
    const int ticks = static_cast<int>(cli.duration * cfg.tickRate);
    const int reportEvery = static_cast<int>(cfg.tickRate);

    Vector3 riderPos = sim.getMovement().getRiderAnchor();
    if (!sim.tryAttach(riderPos))
        throw std::runtime_error("rider could not board the plank");

    for (int i = 0; i < ticks; ++i) {
        // the rider stands on the plank, so the tracked space rides along
        poses.setOrigin(sim.getMovement().getRiderAnchor());
        PoseSample sample = poses.sample(sim.getSimTime());

        sim.step(sample, dt);

        // board again for the return trip
        if (!sim.isAttached()) {
            riderPos = sim.getMovement().getRiderAnchor();
            if (!sim.tryAttach(riderPos))
                throw std::runtime_error("rider could not re-board at the anchor");
        }

        if (cli.verbose && reportEvery > 0 && (i % reportEvery) == 0)
            std::printf("%s | %s\n", formatTickLine(sim).c_str(), riderInstruction(sim).c_str());
    }

    std::printf("\n---- Ride summary (%.1fs, seed %u) ----\n", sim.getSimTime(), cfg.seed);
    std::printf("%s\n", formatBalanceSummary(sim).c_str());
    std::printf("Path position: %.3f (%s)\n", sim.getPathPosition(),
                sim.getMovement().isMovingForward() ? "forward" : "backward");
    std::printf("Endpoints reached: %d\n", stats.endpoints);
    std::printf("Disruptions: %d (%d interrupted), warnings: %d\n",
                stats.disruptions, stats.interrupted, stats.warnings);
    std::printf("Balance lost ticks: %d\n", stats.balanceLost);
    std::printf("Haptic pulses: left %d, right %d\n", haptics.leftPulses(), haptics.rightPulses());
    std::printf("Rider: %s\n", riderInstruction(sim).c_str());
}

// ---------- Main ----------

int main(int argc, char *argv[]) {
    // defaults -> YAML file -> CLI overrides
    SimConfig cfg;

    // First CLI pass: extract --config path (and detect --help early)
    CliResult cli = applyCliOverrides(argc, argv, cfg);

    if (cli.helpRequested) {
        printUsage(argv[0]);
        return 0;
    }

    Logger logger;
    StdLog stdlog;
    logger.registerLogListener(&stdlog);
    logger.setLogLevel(cli.verbose ? Logger::LOG_LEVEL_DEBUG : Logger::LOG_LEVEL_INFO);

    std::string configPath = cli.configPath.empty() ? "tightrope.yaml" : cli.configPath;
    if (!loadConfigFromYAML(configPath, cfg) && !cli.configPath.empty()) {
        std::cerr << "Error: could not load config " << configPath << std::endl;
        logger.unregisterLogListener(&stdlog);
        return 1;
    }

    // Re-apply CLI so flags always win over YAML values
    cli = applyCliOverrides(argc, argv, cfg);

    PoseScenario scenario;
    if (!parsePoseScenario(cli.scenario, scenario)) {
        std::cerr << "Unknown scenario: " << cli.scenario << std::endl;
        printUsage(argv[0]);
        logger.unregisterLogListener(&stdlog);
        return 1;
    }

    int rc = 0;
    try {
        runRide(cfg, cli, scenario);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }

    logger.unregisterLogListener(&stdlog);
    return rc;
}
