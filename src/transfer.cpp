/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan/transfer.hpp>

#include <cmath>
#include <format>

namespace missionplan {

TransferResult computeTransfer(double mu, double r1, double r2) {
    TransferResult result;
    result.r1 = r1;
    result.r2 = r2;

    // Circular speeds
    result.v1 = std::sqrt(mu / r1);
    result.v2 = std::sqrt(mu / r2);

    // Transfer ellipse touches both circles at its apses
    result.transferSemiMajorAxis = 0.5 * (r1 + r2);
    double aT = result.transferSemiMajorAxis;
    result.vPerigee = std::sqrt(mu * (2.0 / r1 - 1.0 / aT));
    result.vApogee = std::sqrt(mu * (2.0 / r2 - 1.0 / aT));

    result.dv1 = std::abs(result.vPerigee - result.v1);
    result.dv2 = std::abs(result.v2 - result.vApogee);
    result.dvTotal = result.dv1 + result.dv2;

    result.timeOfFlight = M_PI * std::sqrt(std::pow(aT, 3) / mu);

    return result;
}

void printTransfer(std::ostream &os, const TransferResult &transfer) {
    os << "Hohmann Transfer" << std::endl;
    os << "  From Radius: " << std::format("{:.2f}", transfer.r1) << " km" << std::endl;
    os << "  Target Radius: " << std::format("{:.2f}", transfer.r2) << " km" << std::endl;
    os << "  Transfer Semi-Major Axis: " << std::format("{:.2f}", transfer.transferSemiMajorAxis) << " km" << std::endl;
    os << "  Δv1 (kick): " << std::format("{:.5f}", transfer.dv1) << " km/s" << std::endl;
    os << "  Δv2 (circularize): " << std::format("{:.5f}", transfer.dv2) << " km/s" << std::endl;
    os << "  Total Δv: " << std::format("{:.5f}", transfer.dvTotal) << " km/s" << std::endl;
    os << "  Time of Flight (half period): " << std::format("{:.5f}", transfer.timeOfFlight / 3600.0) << " hours" << std::endl;
    os << std::endl;
}

}
