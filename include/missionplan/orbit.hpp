/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_ORBIT_HPP
#define __MISSIONPLAN_ORBIT_HPP

#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace missionplan {

// ============================================================================
// Constants
// ============================================================================

constexpr double MU_EARTH = 398600.4418;         // Earth gravitational parameter (km³/s²)
constexpr double RADIUS_EARTH_KM = 6371.0;       // Mean Earth radius (km)
constexpr double TWO_PI = 2.0 * M_PI;

// Kepler solver defaults
constexpr double KEPLER_TOLERANCE = 1e-9;        // Absolute tolerance on the Newton step (rad)
constexpr int KEPLER_MAX_ITERATIONS = 200;
constexpr double KEPLER_CIRCULAR_LIMIT = 1e-8;   // Below this eccentricity E = M
constexpr double KEPLER_HIGH_ECCENTRICITY = 0.8; // At or above this, start Newton from π

// Radian-degree conversion factor
constexpr double RADIANS_TO_DEGREES = 180.0 / M_PI;

// ============================================================================
// Exception Classes
// ============================================================================

/**
 * Base exception class for mission planning errors.
 */
class MissionPlanException : public std::runtime_error {
public:
    explicit MissionPlanException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Exception thrown when orbital elements are invalid.
 */
class InvalidOrbitException : public MissionPlanException {
public:
    explicit InvalidOrbitException(const std::string& msg) : MissionPlanException(msg) {}
};

/**
 * Exception thrown when transfer parameters are invalid.
 */
class InvalidTransferException : public MissionPlanException {
public:
    explicit InvalidTransferException(const std::string& msg) : MissionPlanException(msg) {}
};

// ============================================================================
// Basic Data Types
// ============================================================================

/**
 * 2D vector in the orbital plane (km or km/s depending on context).
 */
struct Vec2 {
    double x, y;

    Vec2 operator+(const Vec2& other) const {
        return {x + other.x, y + other.y};
    }

    Vec2 operator-(const Vec2& other) const {
        return {x - other.x, y - other.y};
    }

    Vec2 operator*(double scalar) const {
        return {x * scalar, y * scalar};
    }

    double magnitude() const {
        return std::sqrt(x*x + y*y);
    }
};

// ============================================================================
// Kepler's Equation
// ============================================================================

/**
 * Options for the Newton-Raphson Kepler solver.
 */
struct KeplerOptions {
    double tolerance = KEPLER_TOLERANCE;        ///< Stop when |step| falls below this
    int maxIterations = KEPLER_MAX_ITERATIONS;  ///< Hard cap on Newton iterations
};

/**
 * Result of solving Kepler's equation, with convergence diagnostics.
 */
struct KeplerSolution {
    double eccentricAnomaly = 0.0;  ///< E (radians)
    int iterations = 0;             ///< Newton iterations performed
    double residual = 0.0;          ///< |E - e·sin(E) - M| on the reduced revolution
    bool converged = false;         ///< True if the step tolerance was met
};

/**
 * Solves Kepler's equation E - e·sin(E) = M for the eccentric anomaly.
 *
 * M is reduced into [0, 2π) and Newton-Raphson iteration starts from
 * the reduced M (e < 0.8) or from π. The whole revolutions are added
 * back to the result, so M does not need to be reduced by the caller.
 * Orbits with e < 1e-8 return M directly.
 *
 * The solver never throws. If the iteration budget runs out before the
 * step tolerance is met, the last iterate is returned as is.
 *
 * @param meanAnomaly Mean anomaly M (radians)
 * @param eccentricity Eccentricity, 0 <= e < 1
 * @return Eccentric anomaly E (radians)
 */
double solveKepler(double meanAnomaly, double eccentricity,
                   double tolerance = KEPLER_TOLERANCE,
                   int maxIterations = KEPLER_MAX_ITERATIONS);

/**
 * Same iteration as solveKepler(), but also reports the iteration count,
 * final residual and whether the tolerance was reached.
 */
KeplerSolution solveKeplerDetailed(double meanAnomaly, double eccentricity,
                                   const KeplerOptions& options = {});

// ============================================================================
// Orbit Class
// ============================================================================

/**
 * A planar two-body Keplerian orbit.
 *
 * Positions are returned in the perifocal frame, with x pointing toward
 * periapsis. Inclination, RAAN and argument of perigee are carried for
 * reporting only.
 *
 * The elements are not validated: callers must supply mu > 0, a > 0 and
 * 0 <= e < 1 (see validateOrbitElements()). Results for other inputs are
 * unspecified.
 *
 * Usage:
 *   Orbit orbit(MU_EARTH, 6771.0, 0.001);
 *   Vec2 position = orbit.positionFromMeanAnomaly(M);
 *
 * Instances are immutable and safe to share between threads.
 */
class Orbit {
public:
    Orbit(double mu, double semiMajorAxis, double eccentricity = 0.0,
          double inclination = 0.0, double raan = 0.0, double argumentOfPerigee = 0.0);
    ~Orbit() = default;

    // Accessors for orbital elements (angles in degrees)
    double getMu() const;
    double getSemiMajorAxis() const;
    double getEccentricity() const;
    double getInclination() const;
    double getRightAscensionOfAscendingNode() const;
    double getArgumentOfPerigee() const;

    /** Keplerian period 2π·√(a³/μ) in seconds. */
    double period() const;

    /** Mean motion √(μ/a³) in radians per second. */
    double meanMotion() const;

    double periapsisRadius() const;
    double apoapsisRadius() const;

    /**
     * Solves Kepler's equation with this orbit's eccentricity.
     */
    double solveEccentricAnomaly(double meanAnomaly) const;

    /**
     * Distance from the focus, a·(1 - e·cos E), for a given mean anomaly.
     */
    double radiusFromMeanAnomaly(double meanAnomaly) const;

    /**
     * True anomaly in (-π, π] for a given mean anomaly.
     */
    double trueAnomalyFromMeanAnomaly(double meanAnomaly) const;

    /**
     * Position in the orbital plane (km) for a given mean anomaly.
     *
     * The radius of the returned point always lies in [a(1-e), a(1+e)].
     */
    Vec2 positionFromMeanAnomaly(double meanAnomaly) const;

    /**
     * Mean anomaly reached after t seconds from periapsis, in [0, 2π).
     */
    double meanAnomalyAtTime(double secondsSinceEpoch) const;

    /**
     * Position in the orbital plane (km) t seconds after periapsis.
     */
    Vec2 positionAtTime(double secondsSinceEpoch) const;

    /**
     * Orbital speed at radius r from the vis-viva equation, √(μ·(2/r - 1/a)).
     *
     * r is not checked against this orbit. Radii outside the orbit's
     * envelope may give NaN.
     */
    double velocityAtRadius(double radius) const;

    /**
     * Evenly spaced positions in mean anomaly, M = 2πk/points for k in [0, points).
     */
    std::vector<Vec2> samplePath(int points) const;

    /**
     * Print orbital element information to a stream.
     */
    void printInfo(std::ostream &os) const;

private:
    double mu;
    double semiMajorAxis;
    double eccentricity;
    double inclination;
    double rightAscensionOfAscendingNode;
    double argumentOfPerigee;
};

/**
 * Checks the bound-orbit invariants the engine relies on.
 *
 * @throws InvalidOrbitException if mu <= 0, a <= 0 or e is outside [0, 1)
 */
void validateOrbitElements(double mu, double semiMajorAxis, double eccentricity);

}

#endif
