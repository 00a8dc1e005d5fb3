/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_TRANSFER_HPP
#define __MISSIONPLAN_TRANSFER_HPP

#include <iostream>

namespace missionplan {

/**
 * Result of a coplanar circular-to-circular Hohmann transfer.
 */
struct TransferResult {
    double r1;                      ///< Initial circular orbit radius (km)
    double r2;                      ///< Target circular orbit radius (km)
    double v1;                      ///< Circular speed at r1 (km/s)
    double v2;                      ///< Circular speed at r2 (km/s)
    double vPerigee;                ///< Transfer ellipse speed at r1 (km/s)
    double vApogee;                 ///< Transfer ellipse speed at r2 (km/s)
    double dv1;                     ///< First burn magnitude, entering the transfer ellipse (km/s)
    double dv2;                     ///< Second burn magnitude, circularizing at r2 (km/s)
    double dvTotal;                 ///< dv1 + dv2 (km/s)
    double timeOfFlight;            ///< Half the transfer ellipse period (s)
    double transferSemiMajorAxis;   ///< (r1 + r2) / 2 (km)
};

/**
 * Computes a Hohmann transfer from radius r1 to radius r2.
 *
 * Works for raising (r2 > r1) and lowering (r2 < r1) transfers; burn
 * magnitudes are always non-negative. Inputs are not checked: mu, r1 and
 * r2 must all be positive.
 *
 * @param mu Gravitational parameter (km³/s²)
 * @param r1 Initial orbit radius (km)
 * @param r2 Target orbit radius (km)
 */
TransferResult computeTransfer(double mu, double r1, double r2);

/**
 * Print transfer information to a stream.
 */
void printTransfer(std::ostream &os, const TransferResult &transfer);

}

#endif
