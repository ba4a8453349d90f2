// SimConfig.h: YAML + CLI configuration for the Tightrope simulation
// Config precedence: CLI flags > YAML config file > hardcoded defaults
#pragma once

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "balance/BalanceScorer.h"
#include "difficulty/DifficultyRamp.h"
#include "disruption/DisruptionGenerator.h"
#include "haptics/BalanceHaptics.h"
#include "logger.h"
#include "movement/MovementDriver.h"

namespace Tightrope {

// All configurable settings for one rider simulation.
// Defaults match the shipped experience.
struct SimConfig {
    BalanceParams    balance;
    DisruptionParams disruption;
    DifficultyParams difficulty;
    MovementParams   movement;
    HapticParams     haptics;

    unsigned int seed = 1;        // RNG seed (same seed + same poses = same ride)
    float tickRate = 90.0f;       // headless driver ticks per second
};

// Result of CLI parsing: values that are CLI-only (not in YAML).
struct CliResult {
    std::string configPath;         // --config <path>
    std::string scenario = "level"; // --scenario <name>
    float duration = 30.0f;         // --duration <seconds>
    bool verbose = false;           // --verbose
    bool helpRequested = false;     // --help / -h
};

namespace detail {

// NaN maps to lo
inline float clampf(float v, float lo, float hi) {
    if (std::isnan(v)) return lo;
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

// Reads a float into dst if the key exists, clamped to [lo, hi].
// Non-finite values (.nan, .inf) are rejected.
inline void readFloat(const YAML::Node &node, const char *key, float &dst,
                      float lo, float hi) {
    YAML::Node v = node[key];
    if (!v)
        return;
    float f = v.as<float>();
    if (!std::isfinite(f))
        throw YAML::Exception(v.Mark(), std::string(key) + ": expected a finite number");
    dst = clampf(f, lo, hi);
}

inline void readBool(const YAML::Node &node, const char *key, bool &dst) {
    if (node[key])
        dst = node[key].as<bool>();
}

// [x, y, z]
inline void readVector(const YAML::Node &node, const char *key, Vector3 &dst) {
    YAML::Node v = node[key];
    if (!v)
        return;
    if (!v.IsSequence() || v.size() != 3)
        throw YAML::Exception(v.Mark(), std::string(key) + ": expected [x, y, z]");
    dst = Vector3(v[0].as<float>(), v[1].as<float>(), v[2].as<float>());
}

// Either a preset name or a list of [t, value] keys.
inline void readCurve(const YAML::Node &node, const char *key, ResponseCurve &dst) {
    YAML::Node c = node[key];
    if (!c)
        return;

    if (c.IsScalar()) {
        std::string name = c.as<std::string>();
        if (!ResponseCurve::fromPreset(name, dst))
            throw YAML::Exception(c.Mark(), std::string(key) + ": unknown curve preset '" + name + "'");
        return;
    }

    if (!c.IsSequence() || c.size() == 0)
        throw YAML::Exception(c.Mark(), std::string(key) + ": expected preset name or [[t, v], ...]");

    std::vector<ResponseCurve::Key> keys;
    for (const auto &k : c) {
        if (!k.IsSequence() || k.size() != 2)
            throw YAML::Exception(k.Mark(), std::string(key) + ": each key must be [t, v]");
        keys.emplace_back(k[0].as<float>(), k[1].as<float>());
    }
    dst = ResponseCurve(std::move(keys));
}

// Keep the min/max gap pair ordered
inline void orderGaps(DisruptionParams &p) {
    if (p.minTimeBetween > p.maxTimeBetween)
        std::swap(p.minTimeBetween, p.maxTimeBetween);
}

} // namespace detail

// Load settings from a YAML config file into cfg.
// Returns true if the file was loaded successfully.
// Returns false (silently) if the file doesn't exist; this is the normal case.
// Logs and returns false on parse errors; cfg is left untouched in that case.
inline bool loadConfigFromYAML(const std::string &path, SimConfig &cfg) {
    FILE *f = std::fopen(path.c_str(), "r");
    if (!f) return false;
    std::fclose(f);

    // parse into a copy so a bad file never half-applies
    SimConfig out = cfg;

    try {
        YAML::Node root = YAML::LoadFile(path);
        using namespace detail;

        if (YAML::Node bal = root["balance"]) {
            readFloat(bal, "threshold", out.balance.balanceThreshold, 0.0f, 1.0f);
            readFloat(bal, "smoothing", out.balance.smoothingRate, 0.0f, 100.0f);
            readFloat(bal, "offset_sensitivity", out.balance.offsetSensitivity, 0.0f, 50.0f);
            readFloat(bal, "score_sensitivity", out.balance.scoreSensitivity, 0.0f, 50.0f);
            readFloat(bal, "min_controller_distance", out.balance.minControllerDistance, 0.01f, 5.0f);
            readBool(bal, "symmetry_penalty", out.balance.useSymmetryPenalty);
            readFloat(bal, "symmetry_tolerance", out.balance.symmetryTolerance, 0.01f, 5.0f);
        }

        if (YAML::Node ori = root["orientation"]) {
            readFloat(ori, "max_angle", out.balance.maxPointerAngleDeviation, 0.1f, 90.0f);
            readBool(ori, "require_both", out.balance.requireBothPointers);
        }

        if (YAML::Node dis = root["disruption"]) {
            DisruptionParams &d = out.disruption;
            readBool(dis, "enabled", d.enabled);
            readFloat(dis, "min_gap", d.minTimeBetween, 0.1f, 120.0f);
            readFloat(dis, "max_gap", d.maxTimeBetween, 0.1f, 120.0f);
            readFloat(dis, "chance", d.disruptionChance, 0.0f, 1.0f);

            if (YAML::Node g = dis["gust"]) {
                readBool(g, "enabled", d.enableGusts);
                readFloat(g, "min_strength", d.gustMinStrength, 0.0f, 5.0f);
                readFloat(g, "max_strength", d.gustMaxStrength, 0.0f, 5.0f);
                readFloat(g, "duration", d.gustDuration, 0.01f, 10.0f);
            }
            if (YAML::Node dr = dis["drift"]) {
                readBool(dr, "enabled", d.enableDrift);
                readFloat(dr, "min_strength", d.driftMinStrength, 0.0f, 5.0f);
                readFloat(dr, "max_strength", d.driftMaxStrength, 0.0f, 5.0f);
                readFloat(dr, "duration", d.driftDuration, 0.01f, 30.0f);
            }
            if (YAML::Node o = dis["oscillation"]) {
                readBool(o, "enabled", d.enableOscillations);
                readFloat(o, "amplitude", d.oscillationAmplitude, 0.0f, 5.0f);
                readFloat(o, "frequency", d.oscillationFrequency, 0.01f, 20.0f);
                readFloat(o, "duration", d.oscillationDuration, 0.01f, 30.0f);
            }
            if (YAML::Node w = dis["warning"]) {
                readBool(w, "enabled", d.provideWarning);
                readFloat(w, "time", d.warningTime, 0.0f, 5.0f);
                readFloat(w, "haptic_strength", d.warningHapticStrength, 0.0f, 1.0f);
                readFloat(w, "haptic_duration", d.warningHapticDuration, 0.0f, 2.0f);
            }
            orderGaps(d);
        }

        if (YAML::Node dif = root["difficulty"]) {
            DifficultyParams &p = out.difficulty;
            readBool(dif, "enabled", p.enabled);
            readFloat(dif, "increase_rate", p.increaseRate, 0.0f, 5.0f);
            readFloat(dif, "increase_interval", p.increaseInterval, 0.1f, 600.0f);
            readFloat(dif, "max_multiplier", p.maxMultiplier, 1.0f, 10.0f);
            readFloat(dif, "grace_period", p.gracePeriodAfterBalance, 0.0f, 60.0f);
            readFloat(dif, "base_chance", p.baseDisruptionChance, 0.0f, 1.0f);
            readFloat(dif, "chance_multiplier", p.disruptionChanceMultiplier, 0.0f, 10.0f);
        }

        if (YAML::Node mov = root["movement"]) {
            MovementParams &m = out.movement;
            readVector(mov, "start", m.startPoint);
            readVector(mov, "end", m.endPoint);
            readFloat(mov, "max_sag", m.maxSag, 0.0f, 50.0f);
            readCurve(mov, "sag_curve", m.sagCurve);
            readFloat(mov, "base_speed", m.baseSpeed, 0.0f, 50.0f);
            readBool(mov, "use_balance", m.useBalanceSystem);
            readFloat(mov, "balanced_score", m.balancedFinalScore, 0.0f, 1.0f);
            readFloat(mov, "balance_speed_multiplier", m.balanceSpeedMultiplier, 0.0f, 1.0f);
            readFloat(mov, "min_speed_unbalanced", m.minSpeedWhenUnbalanced, 0.0f, 1.0f);
            readFloat(mov, "min_speed_balanced", m.minSpeedWhenBalanced, 0.0f, 1.0f);
            readCurve(mov, "speed_curve", m.speedCurve);
            readFloat(mov, "detection_range", m.detectionRange, 0.0f, 100.0f);
            readFloat(mov, "attachment_height", m.attachmentHeight, 0.0f, 5.0f);
        }

        if (YAML::Node hap = root["haptics"]) {
            readFloat(hap, "min_strength", out.haptics.minStrength, 0.0f, 1.0f);
            readFloat(hap, "max_strength", out.haptics.maxStrength, 0.0f, 1.0f);
            readFloat(hap, "duration", out.haptics.duration, 0.0f, 2.0f);
            readFloat(hap, "repeat_interval", out.haptics.repeatInterval, 0.05f, 10.0f);
        }

        if (YAML::Node sim = root["simulation"]) {
            if (sim["seed"]) out.seed = sim["seed"].as<unsigned int>();
            readFloat(sim, "tick_rate", out.tickRate, 10.0f, 1000.0f);
        }
    } catch (const YAML::Exception &e) {
        LOG_ERROR("SimConfig: failed to parse config %s: %s", path.c_str(), e.what());
        return false;
    }

    cfg = out;
    LOG_INFO("SimConfig: loaded config from %s", path.c_str());
    return true;
}

// Parse CLI arguments into the config struct and extract CLI-only values.
// Processes all flags in a single pass using else-if chain.
inline CliResult applyCliOverrides(int argc, char *argv[], SimConfig &cfg) {
    CliResult cli;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            cli.helpRequested = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            cli.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--scenario") == 0 && i + 1 < argc) {
            cli.scenario = argv[++i];
        } else if (std::strcmp(argv[i], "--duration") == 0 && i + 1 < argc) {
            cli.duration = detail::clampf(static_cast<float>(std::atof(argv[++i])), 0.0f, 3600.0f);
        } else if (std::strcmp(argv[i], "--rate") == 0 && i + 1 < argc) {
            cfg.tickRate = detail::clampf(static_cast<float>(std::atof(argv[++i])), 10.0f, 1000.0f);
        } else if (std::strcmp(argv[i], "--seed") == 0 && i + 1 < argc) {
            cfg.seed = static_cast<unsigned int>(std::strtoul(argv[++i], nullptr, 10));
        } else if (std::strcmp(argv[i], "--speed") == 0 && i + 1 < argc) {
            cfg.movement.baseSpeed = detail::clampf(static_cast<float>(std::atof(argv[++i])), 0.0f, 50.0f);
        } else if (std::strcmp(argv[i], "--chance") == 0 && i + 1 < argc) {
            // ramped base chance, and the fixed chance used without difficulty
            float chance = detail::clampf(static_cast<float>(std::atof(argv[++i])), 0.0f, 1.0f);
            cfg.difficulty.baseDisruptionChance = chance;
            cfg.disruption.disruptionChance = chance;
        } else if (std::strcmp(argv[i], "--no-disruptions") == 0) {
            cfg.disruption.enabled = false;
        } else if (std::strcmp(argv[i], "--no-difficulty") == 0) {
            cfg.difficulty.enabled = false;
        } else if (std::strcmp(argv[i], "--no-warning") == 0) {
            cfg.disruption.provideWarning = false;
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            cli.verbose = true;
        }
    }

    return cli;
}

} // namespace Tightrope
