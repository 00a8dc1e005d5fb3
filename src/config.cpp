/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan/config.hpp>
#include <spdlog/spdlog.h>

using spdlog::warn;

namespace missionplan {

double Config::getMu() const {
    return mu;
}

void Config::setMu(const double m) {
    mu = m;
}

double Config::getSemiMajorAxis() const {
    return semiMajorAxis;
}

void Config::setSemiMajorAxis(const double a) {
    if (a >= MIN_SEMI_MAJOR_AXIS_KM) {
        semiMajorAxis = a;
    } else {
        warn("Semi-major axis {} km is below {} km, clamping.", a, MIN_SEMI_MAJOR_AXIS_KM);
        semiMajorAxis = MIN_SEMI_MAJOR_AXIS_KM;
    }
}

double Config::getEccentricity() const {
    return eccentricity;
}

void Config::setEccentricity(const double e) {
    if (e >= 0.0 && e <= MAX_ECCENTRICITY) {
        eccentricity = e;
    } else if (e > MAX_ECCENTRICITY) {
        warn("Eccentricity {} is not a bound orbit, clamping to {}.", e, MAX_ECCENTRICITY);
        eccentricity = MAX_ECCENTRICITY;
    } else {
        warn("Eccentricity {} is negative, clamping to 0.", e);
        eccentricity = 0.0;
    }
}

double Config::getInclination() const {
    return inclination;
}

void Config::setInclination(const double i) {
    inclination = i;
}

double Config::getRAAN() const {
    return raan;
}

void Config::setRAAN(const double r) {
    raan = r;
}

double Config::getArgumentOfPerigee() const {
    return argumentOfPerigee;
}

void Config::setArgumentOfPerigee(const double argp) {
    argumentOfPerigee = argp;
}

double Config::getTargetRadius() const {
    return targetRadius;
}

void Config::setTargetRadius(const double r) {
    targetRadius = r;
}

double Config::getTime() const {
    return time;
}

void Config::setTime(const double seconds) {
    time = seconds;
}

time_point Config::getLaunchTime() const {
    return launchTime;
}

void Config::setLaunchTime(const time_point tp) {
    launchTime = tp;
}

bool Config::getVerbose() const {
    return verbose;
}

void Config::setVerbose(bool v) {
    verbose = v;
}

std::vector<std::string> Config::validate() const {
    std::vector<std::string> errors;
    if (!(mu > 0.0)) {
        errors.emplace_back("Gravitational parameter mu must be positive.");
    }
    if (semiMajorAxis <= RADIUS_EARTH_KM) {
        errors.emplace_back("Semi-major axis a must be larger than Earth radius (6371 km).");
    }
    if (eccentricity < 0.0 || eccentricity >= 1.0) {
        errors.emplace_back("Eccentricity must satisfy 0 <= e < 1 for bound orbit.");
    }
    if (!(targetRadius > 0.0)) {
        errors.emplace_back("Target radius must be positive.");
    }
    return errors;
}

void Config::check() const {
    validateOrbitElements(mu, semiMajorAxis, eccentricity);
    if (semiMajorAxis <= RADIUS_EARTH_KM) {
        throw InvalidOrbitException("Semi-major axis a must be larger than Earth radius (6371 km).");
    }
    if (!(targetRadius > 0.0)) {
        throw InvalidTransferException("Target radius must be positive.");
    }
}

Orbit Config::toOrbit() const {
    return Orbit(mu, semiMajorAxis, eccentricity, inclination, raan, argumentOfPerigee);
}

TransferResult Config::toTransfer() const {
    return computeTransfer(mu, semiMajorAxis, targetRadius);
}

}
