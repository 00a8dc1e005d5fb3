/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_MISSION_HPP
#define __MISSIONPLAN_MISSION_HPP

#include <missionplan/orbit.hpp>
#include <missionplan/transfer.hpp>

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace missionplan {

using time_point = std::chrono::system_clock::time_point;

/**
 * Spacecraft state on an orbit at a given time since periapsis passage.
 */
struct TelemetrySnapshot {
    double time;                  ///< Seconds since periapsis passage
    double meanAnomaly;           ///< Mean anomaly in [0, 2π)
    Vec2 position;                ///< Position in the orbital plane (km)
    double range;                 ///< Distance from the central body (km)
    double speed;                 ///< Orbital speed from vis-viva (km/s)
};

TelemetrySnapshot snapshotAt(const Orbit& orbit, double secondsSinceEpoch);

/**
 * A single entry in the mission timeline.
 */
struct MissionEvent {
    time_point time;
    std::string title;
    std::string description;
};

/**
 * Builds the timeline of a Hohmann transfer mission launched at the given
 * time: launch, parking orbit insertion (+30 min), transfer burn (+2 h),
 * apogee arrival (launch + time of flight) and start of operations
 * (arrival + 1 h).
 */
std::vector<MissionEvent> buildTimeline(const TransferResult& transfer, time_point launchTime);

void printTimeline(std::ostream& os, const std::vector<MissionEvent>& timeline);

/**
 * Everything the mission report needs.
 */
struct MissionSummary {
    Orbit orbit;
    TransferResult transfer;
    TelemetrySnapshot telemetry;
    std::vector<MissionEvent> timeline;
};

MissionSummary buildSummary(const Orbit& orbit, const TransferResult& transfer,
                            double secondsSinceEpoch, time_point launchTime);

/**
 * Write the plain-text mission report.
 */
void writeReport(std::ostream& os, const MissionSummary& summary);

/**
 * Serialize the mission summary as a JSON document.
 */
std::string toJSON(const MissionSummary& summary);

}

#endif
