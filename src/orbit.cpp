/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan/orbit.hpp>

#include <cmath>
#include <format>
#include <string>
#include <vector>

namespace missionplan {

// ============================================================================
// Kepler's Equation
// ============================================================================

KeplerSolution solveKeplerDetailed(double meanAnomaly, double eccentricity,
                                   const KeplerOptions& options) {
    KeplerSolution solution;

    // Circular orbit: E = M
    if (eccentricity < KEPLER_CIRCULAR_LIMIT) {
        solution.eccentricAnomaly = meanAnomaly;
        solution.residual = std::abs(eccentricity * std::sin(meanAnomaly));
        solution.converged = true;
        return solution;
    }

    // Solve within [0, 2π) so the starting guess sits on M's own revolution
    double reduced = std::fmod(meanAnomaly, TWO_PI);
    if (reduced < 0.0) {
        reduced += TWO_PI;
    }
    double revolutions = meanAnomaly - reduced;

    double E = (eccentricity < KEPLER_HIGH_ECCENTRICITY) ? reduced : M_PI;

    for (int k = 0; k < options.maxIterations; k++) {
        double f = E - eccentricity * std::sin(E) - reduced;
        double fp = 1.0 - eccentricity * std::cos(E);
        double delta = -f / fp;
        E += delta;
        solution.iterations++;
        if (std::abs(delta) < options.tolerance) {
            solution.converged = true;
            break;
        }
    }

    solution.eccentricAnomaly = E + revolutions;
    solution.residual = std::abs(E - eccentricity * std::sin(E) - reduced);
    return solution;
}

double solveKepler(double meanAnomaly, double eccentricity,
                   double tolerance, int maxIterations) {
    KeplerOptions options{
        .tolerance = tolerance,
        .maxIterations = maxIterations
    };
    return solveKeplerDetailed(meanAnomaly, eccentricity, options).eccentricAnomaly;
}

// ============================================================================
// Orbit
// ============================================================================

Orbit::Orbit(double mu, double semiMajorAxis, double eccentricity,
             double inclination, double raan, double argumentOfPerigee)
    : mu(mu),
      semiMajorAxis(semiMajorAxis),
      eccentricity(eccentricity),
      inclination(inclination),
      rightAscensionOfAscendingNode(raan),
      argumentOfPerigee(argumentOfPerigee) {}

double Orbit::getMu() const {
    return mu;
}

double Orbit::getSemiMajorAxis() const {
    return semiMajorAxis;
}

double Orbit::getEccentricity() const {
    return eccentricity;
}

double Orbit::getInclination() const {
    return inclination;
}

double Orbit::getRightAscensionOfAscendingNode() const {
    return rightAscensionOfAscendingNode;
}

double Orbit::getArgumentOfPerigee() const {
    return argumentOfPerigee;
}

double Orbit::period() const {
    return TWO_PI * std::sqrt(std::pow(semiMajorAxis, 3) / mu);
}

double Orbit::meanMotion() const {
    return std::sqrt(mu / std::pow(semiMajorAxis, 3));
}

double Orbit::periapsisRadius() const {
    return semiMajorAxis * (1.0 - eccentricity);
}

double Orbit::apoapsisRadius() const {
    return semiMajorAxis * (1.0 + eccentricity);
}

double Orbit::solveEccentricAnomaly(double meanAnomaly) const {
    return solveKepler(meanAnomaly, eccentricity);
}

double Orbit::radiusFromMeanAnomaly(double meanAnomaly) const {
    double E = solveEccentricAnomaly(meanAnomaly);
    return semiMajorAxis * (1.0 - eccentricity * std::cos(E));
}

double Orbit::trueAnomalyFromMeanAnomaly(double meanAnomaly) const {
    double E = solveEccentricAnomaly(meanAnomaly);
    double denom = 1.0 - eccentricity * std::cos(E);
    double cosf = (std::cos(E) - eccentricity) / denom;
    double sinf = std::sqrt(1.0 - eccentricity * eccentricity) * std::sin(E) / denom;
    return std::atan2(sinf, cosf);
}

Vec2 Orbit::positionFromMeanAnomaly(double meanAnomaly) const {
    double E = solveEccentricAnomaly(meanAnomaly);
    double denom = 1.0 - eccentricity * std::cos(E);
    double r = semiMajorAxis * denom;

    // True anomaly
    double cosf = (std::cos(E) - eccentricity) / denom;
    double sinf = std::sqrt(1.0 - eccentricity * eccentricity) * std::sin(E) / denom;
    double f = std::atan2(sinf, cosf);

    return {r * std::cos(f), r * std::sin(f)};
}

double Orbit::meanAnomalyAtTime(double secondsSinceEpoch) const {
    double M = std::fmod(meanMotion() * secondsSinceEpoch, TWO_PI);
    if (M < 0.0) M += TWO_PI;
    return M;
}

Vec2 Orbit::positionAtTime(double secondsSinceEpoch) const {
    return positionFromMeanAnomaly(meanAnomalyAtTime(secondsSinceEpoch));
}

double Orbit::velocityAtRadius(double radius) const {
    return std::sqrt(mu * (2.0 / radius - 1.0 / semiMajorAxis));
}

std::vector<Vec2> Orbit::samplePath(int points) const {
    std::vector<Vec2> path;
    if (points <= 0) {
        return path;
    }
    path.reserve(static_cast<size_t>(points));
    for (int k = 0; k < points; k++) {
        double M = TWO_PI * k / points;
        path.push_back(positionFromMeanAnomaly(M));
    }
    return path;
}

void Orbit::printInfo(std::ostream &os) const {
    os << "Orbit" << std::endl;
    os << "  Gravitational Parameter: " << getMu() << " km^3/s^2" << std::endl;
    os << "  Semi-Major Axis: " << std::format("{:.2f}", getSemiMajorAxis()) << " km" << std::endl;
    os << "  Eccentricity: " << std::format("{:.5f}", getEccentricity()) << std::endl;
    os << "  Inclination: " << getInclination() << " deg" << std::endl;
    os << "  Right Ascension of Ascending Node: " << getRightAscensionOfAscendingNode() << " deg" << std::endl;
    os << "  Argument of Perigee: " << getArgumentOfPerigee() << " deg" << std::endl;
    os << "  Periapsis Radius: " << std::format("{:.2f}", periapsisRadius()) << " km" << std::endl;
    os << "  Apoapsis Radius: " << std::format("{:.2f}", apoapsisRadius()) << " km" << std::endl;
    os << "  Orbital Period: " << std::format("{:.4f}", period() / 3600.0) << " hours" << std::endl;
    os << "  Mean Motion: " << std::format("{:.8f}", meanMotion()) << " rad/s" << std::endl;
    os << std::endl;
}

void validateOrbitElements(double mu, double semiMajorAxis, double eccentricity) {
    if (!(mu > 0.0)) {
        throw InvalidOrbitException("Gravitational parameter must be positive");
    }
    if (!(semiMajorAxis > 0.0)) {
        throw InvalidOrbitException("Semi-major axis must be positive");
    }
    if (!(eccentricity >= 0.0 && eccentricity < 1.0)) {
        throw InvalidOrbitException("Eccentricity must satisfy 0 <= e < 1 for bound orbit");
    }
}

}
