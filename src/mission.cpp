/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan/mission.hpp>

#include <chrono>
#include <cmath>
#include <format>
#include <string>

#include <date/date.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace missionplan {

constexpr const char* TIMELINE_TIME_FORMAT = "%F %H:%M";

TelemetrySnapshot snapshotAt(const Orbit& orbit, double secondsSinceEpoch) {
    double M = orbit.meanAnomalyAtTime(secondsSinceEpoch);
    double r = orbit.radiusFromMeanAnomaly(M);
    return TelemetrySnapshot{
        .time = secondsSinceEpoch,
        .meanAnomaly = M,
        .position = orbit.positionFromMeanAnomaly(M),
        .range = r,
        .speed = orbit.velocityAtRadius(r)
    };
}

std::vector<MissionEvent> buildTimeline(const TransferResult& transfer, time_point launchTime) {
    using namespace std::chrono;

    // Whole seconds only, the arrival is reported to the minute
    auto tof = seconds(static_cast<long>(transfer.timeOfFlight));
    auto arrival = launchTime + tof;

    return {
        {launchTime, "Launch (T+0)", "Ground launch to parking orbit"},
        {launchTime + minutes(30), "Parking orbit insertion", "Circularize to parking orbit"},
        {launchTime + hours(2), "Transfer burn (Δv1)",
            std::format("First burn to enter transfer ellipse: Δv ≈ {:.5f} km/s", transfer.dv1)},
        {arrival, "Apogee arrival / Circularize (Δv2)",
            std::format("Second burn to circularize: Δv ≈ {:.5f} km/s", transfer.dv2)},
        {arrival + hours(1), "Mission ops begin", "Begin mission operations and telemetry"}
    };
}

void printTimeline(std::ostream& os, const std::vector<MissionEvent>& timeline) {
    os << "Mission Timeline:" << std::endl;
    for (const auto& event : timeline) {
        auto t = std::chrono::floor<std::chrono::minutes>(event.time);
        os << "  " << date::format(TIMELINE_TIME_FORMAT, t) << "  " << event.title << std::endl;
        os << "                    " << event.description << std::endl;
    }
    os << std::endl;
}

MissionSummary buildSummary(const Orbit& orbit, const TransferResult& transfer,
                            double secondsSinceEpoch, time_point launchTime) {
    return MissionSummary{
        .orbit = orbit,
        .transfer = transfer,
        .telemetry = snapshotAt(orbit, secondsSinceEpoch),
        .timeline = buildTimeline(transfer, launchTime)
    };
}

void writeReport(std::ostream& os, const MissionSummary& summary) {
    const auto& orbit = summary.orbit;
    const auto& transfer = summary.transfer;
    os << "MISSION REPORT" << std::endl;
    os << "Mission: Orbital Transfer" << std::endl;
    os << std::format("Semi-major axis (a): {:.2f} km", orbit.getSemiMajorAxis()) << std::endl;
    os << std::format("Eccentricity: {:.6f}", orbit.getEccentricity()) << std::endl;
    os << std::format("Orbital period: {:.6f} hours", orbit.period() / 3600.0) << std::endl;
    os << std::format("Hohmann transfer to r={:.2f} km -> Δv_total={:.6f} km/s, TOF={:.6f} hours",
        transfer.r2, transfer.dvTotal, transfer.timeOfFlight / 3600.0) << std::endl;
    os << std::format("Range from central body at t={:.1f} s: {:.3f} km",
        summary.telemetry.time, summary.telemetry.range) << std::endl;
    os << std::format("Velocity magnitude: {:.5f} km/s", summary.telemetry.speed) << std::endl;
}

namespace {

template <typename Writer>
void writeVec2(Writer& writer, const char* key, const Vec2& v) {
    writer.Key(key);
    writer.StartObject();
    writer.Key("x");
    writer.Double(v.x);
    writer.Key("y");
    writer.Double(v.y);
    writer.EndObject();
}

}

std::string toJSON(const MissionSummary& summary) {
    const auto& orbit = summary.orbit;
    const auto& transfer = summary.transfer;
    const auto& telemetry = summary.telemetry;

    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);

    writer.StartObject();

    writer.Key("orbit");
    writer.StartObject();
    writer.Key("mu");
    writer.Double(orbit.getMu());
    writer.Key("semiMajorAxis");
    writer.Double(orbit.getSemiMajorAxis());
    writer.Key("eccentricity");
    writer.Double(orbit.getEccentricity());
    writer.Key("inclination");
    writer.Double(orbit.getInclination());
    writer.Key("raan");
    writer.Double(orbit.getRightAscensionOfAscendingNode());
    writer.Key("argumentOfPerigee");
    writer.Double(orbit.getArgumentOfPerigee());
    writer.Key("period");
    writer.Double(orbit.period());
    writer.Key("meanMotion");
    writer.Double(orbit.meanMotion());
    writer.EndObject();

    writer.Key("transfer");
    writer.StartObject();
    writer.Key("r1");
    writer.Double(transfer.r1);
    writer.Key("r2");
    writer.Double(transfer.r2);
    writer.Key("dv1");
    writer.Double(transfer.dv1);
    writer.Key("dv2");
    writer.Double(transfer.dv2);
    writer.Key("dvTotal");
    writer.Double(transfer.dvTotal);
    writer.Key("timeOfFlight");
    writer.Double(transfer.timeOfFlight);
    writer.Key("transferSemiMajorAxis");
    writer.Double(transfer.transferSemiMajorAxis);
    writer.EndObject();

    writer.Key("telemetry");
    writer.StartObject();
    writer.Key("time");
    writer.Double(telemetry.time);
    writer.Key("meanAnomaly");
    writer.Double(telemetry.meanAnomaly);
    writeVec2(writer, "position", telemetry.position);
    writer.Key("range");
    writer.Double(telemetry.range);
    writer.Key("speed");
    writer.Double(telemetry.speed);
    writer.EndObject();

    writer.Key("timeline");
    writer.StartArray();
    for (const auto& event : summary.timeline) {
        auto t = std::chrono::floor<std::chrono::seconds>(event.time);
        writer.StartObject();
        writer.Key("time");
        writer.String(date::format("%FT%TZ", t).c_str());
        writer.Key("unix");
        writer.Int64(t.time_since_epoch().count());
        writer.Key("title");
        writer.String(event.title.c_str());
        writer.Key("description");
        writer.String(event.description.c_str());
        writer.EndObject();
    }
    writer.EndArray();

    writer.EndObject();

    return buffer.GetString();
}

}
