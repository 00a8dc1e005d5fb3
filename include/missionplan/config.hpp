/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_CONFIG_HPP
#define __MISSIONPLAN_CONFIG_HPP

#include <missionplan/orbit.hpp>
#include <missionplan/transfer.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace missionplan {

using time_point = std::chrono::system_clock::time_point;

// Input limits applied before anything reaches the engine
constexpr double MIN_SEMI_MAJOR_AXIS_KM = 1600.0;
constexpr double MAX_ECCENTRICITY = 0.9999;

// Defaults: ~400 km LEO parking orbit, transfer to GEO
constexpr double DEFAULT_SEMI_MAJOR_AXIS_KM = 6771.0;
constexpr double DEFAULT_ECCENTRICITY = 0.001;
constexpr double DEFAULT_INCLINATION_DEG = 28.5;
constexpr double DEFAULT_TARGET_RADIUS_KM = 42164.0;

class Config {
public:
    // Empty constructor
    Config() = default;
    ~Config() = default;

    double getMu() const;
    void setMu(const double mu);

    double getSemiMajorAxis() const;
    void setSemiMajorAxis(const double a);

    double getEccentricity() const;
    void setEccentricity(const double e);

    double getInclination() const;
    void setInclination(const double i);

    double getRAAN() const;
    void setRAAN(const double raan);

    double getArgumentOfPerigee() const;
    void setArgumentOfPerigee(const double argp);

    double getTargetRadius() const;
    void setTargetRadius(const double r);

    double getTime() const;
    void setTime(const double seconds);

    time_point getLaunchTime() const;
    void setLaunchTime(const time_point tp);

    bool getVerbose() const;
    void setVerbose(bool);

    /**
     * Returns a message for each problem with the current inputs, or an
     * empty vector if they can be handed to the engine.
     */
    std::vector<std::string> validate() const;

    /**
     * @throws InvalidOrbitException if the elements are not a bound orbit
     *         outside the central body
     * @throws InvalidTransferException if the target radius is not positive
     */
    void check() const;

    Orbit toOrbit() const;
    TransferResult toTransfer() const;

private:
    double mu = MU_EARTH;
    double semiMajorAxis = DEFAULT_SEMI_MAJOR_AXIS_KM;
    double eccentricity = DEFAULT_ECCENTRICITY;
    double inclination = DEFAULT_INCLINATION_DEG;
    double raan = 0.0;
    double argumentOfPerigee = 0.0;
    double targetRadius = DEFAULT_TARGET_RADIUS_KM;
    double time = 0.0;
    time_point launchTime = std::chrono::floor<std::chrono::seconds>(
        std::chrono::system_clock::now()) + std::chrono::days(3);
    bool verbose = false;
};

}

#endif
