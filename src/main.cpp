/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan.hpp>
#include <CLI/CLI.hpp>
#include <date/date.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <limits>
#include <optional>
#include <sstream>
#include <string>

using spdlog::debug;
using spdlog::error;

/** Replace ~ with HOME directory */
std::string expandTilde(const std::string &path) {
    if (!path.empty() && path[0] == '~') {
        const char *home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

/** Parse a UTC time string in YYYY-MM-DD HH:MM:SS format */
std::chrono::system_clock::time_point parseTime(const std::string &timeStr) {
    std::istringstream in(timeStr);
    std::chrono::system_clock::time_point tp;
    in >> date::parse("%Y-%m-%d %H:%M:%S", tp);
    if (in.fail()) {
        throw std::invalid_argument("Invalid time format (expected YYYY-MM-DD HH:MM:SS UTC): " + timeStr);
    }
    return tp;
}

/** Validate the configuration, reporting every problem before exiting */
void checkConfig(const missionplan::Config &config) {
    auto errors = config.validate();
    if (!errors.empty()) {
        for (const auto &message : errors) {
            error("{}", message);
        }
        std::exit(1);
    }
    config.check();
}

void printPosition(const missionplan::Orbit &orbit, const missionplan::TelemetrySnapshot &snapshot) {
    using namespace missionplan;

    double trueAnomaly = orbit.trueAnomalyFromMeanAnomaly(snapshot.meanAnomaly);

    std::cout << "Telemetry Snapshot" << std::endl;
    std::cout << std::format("  Time Since Periapsis: {:.1f} s", snapshot.time) << std::endl;
    std::cout << std::format("  Mean Anomaly: {:.4f} deg", snapshot.meanAnomaly * RADIANS_TO_DEGREES) << std::endl;
    std::cout << std::format("  True Anomaly: {:.4f} deg", trueAnomaly * RADIANS_TO_DEGREES) << std::endl;
    std::cout << std::format("  Position: ({:.3f}, {:.3f}) km", snapshot.position.x, snapshot.position.y) << std::endl;
    std::cout << std::format("  Range from central body: {:.3f} km", snapshot.range) << std::endl;
    std::cout << std::format("  Velocity magnitude: {:.5f} km/s", snapshot.speed) << std::endl;
    std::cout << std::endl;
}

/** Program entry point */
int main(int argc, char* argv[]) {

    missionplan::Config config;

    auto configFile = expandTilde("~/.missionplan.toml");

    CLI::App app{"MissionPlan"};
    argv = app.ensure_utf8(argv);

    app.set_config("--config", configFile, "Read configuration from this file (default: " + configFile + ").");

    app.add_option_function<double>("--mu",
        [&config](const double mu) { config.setMu(mu); },
        "Gravitational parameter of the central body in km^3/s^2 (default Earth, 398600.4418)");
    app.add_option_function<double>("-a,--sma",
        [&config](const double a) { config.setSemiMajorAxis(a); },
        "Semi-major axis in km (default 6771, min 1600)");
    app.add_option_function<double>("-e,--ecc",
        [&config](const double e) { config.setEccentricity(e); },
        "Eccentricity (default 0.001, clamped to [0, 0.9999])");
    app.add_option_function<double>("--inc",
        [&config](const double i) { config.setInclination(i); },
        "Inclination in degrees, for reporting (default 28.5)");
    app.add_option_function<double>("--raan",
        [&config](const double raan) { config.setRAAN(raan); },
        "Right ascension of the ascending node in degrees, for reporting (default 0)");
    app.add_option_function<double>("--argp",
        [&config](const double argp) { config.setArgumentOfPerigee(argp); },
        "Argument of perigee in degrees, for reporting (default 0)");
    app.add_option_function<double>("--target",
        [&config](const double r) { config.setTargetRadius(r); },
        "Target circular orbit radius for the Hohmann transfer in km (default 42164, GEO)");
    app.add_option_function<double>("-t,--time",
        [&config](const double t) { config.setTime(t); },
        "Seconds since periapsis passage, for telemetry and rendering (default 0)");
    app.add_option_function<std::string>("--launch",
        [&config](const std::string &timeStr) {
            try {
                config.setLaunchTime(parseTime(timeStr));
            } catch (const std::invalid_argument &err) {
                throw CLI::ValidationError("--launch", err.what());
            }
        },
        "Launch time for the mission timeline (format: YYYY-MM-DD HH:MM:SS UTC, default 3 days from now)");
    app.add_flag_function("-v,--verbose",
        [&config](const int64_t v) { config.setVerbose(v > 0); },
        "Display debugging information");

    app.ignore_case();

    auto infoCommand = app.add_subcommand("info", "Display orbital elements, period and mean motion");

    auto positionCommand = app.add_subcommand("position", "Display position, range and speed on the orbit");
    double meanAnomaly = 0.0;
    auto meanAnomalyOption = positionCommand->add_option("-M,--mean-anomaly", meanAnomaly,
        "Mean anomaly in radians (overrides --time)");

    auto transferCommand = app.add_subcommand("transfer", "Compute a Hohmann transfer to the target radius");

    auto timelineCommand = app.add_subcommand("timeline", "Display the mission timeline");

    auto reportCommand = app.add_subcommand("report", "Generate the mission report");
    bool reportJSON = false;
    reportCommand->add_flag("--json", reportJSON, "Output the report as JSON");

    auto renderCommand = app.add_subcommand("render", "Render the orbit as SVG");
    std::string svgFilename;
    missionplan::RenderOptions renderOptions;
    bool drawSpacecraft = false;
    renderCommand->add_option("-o,--output", svgFilename, "Write the SVG to this file (default: stdout)");
    renderCommand->add_option("--size", renderOptions.size, "Canvas size in pixels (default 700)")
        ->check(CLI::Range(2 * renderOptions.margin + 1, std::numeric_limits<int>::max()));
    renderCommand->add_option("--points", renderOptions.points, "Number of samples along the orbit (default 720)")
        ->check(CLI::PositiveNumber);
    renderCommand->add_flag("--spacecraft", drawSpacecraft, "Mark the spacecraft position at --time");

    // Runs before any subcommand callback
    app.parse_complete_callback([&config](void) {
        spdlog::set_level(config.getVerbose() ? spdlog::level::debug : spdlog::level::info);
        debug("mu={} a={} e={} target={} t={}", config.getMu(), config.getSemiMajorAxis(),
            config.getEccentricity(), config.getTargetRadius(), config.getTime());
    });

    // Command callbacks

    infoCommand->final_callback([&config](void) {
        try {
            checkConfig(config);
            config.toOrbit().printInfo(std::cout);
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    positionCommand->final_callback([&config, &meanAnomaly, meanAnomalyOption](void) {
        using namespace missionplan;
        try {
            checkConfig(config);
            auto orbit = config.toOrbit();
            TelemetrySnapshot snapshot;
            if (meanAnomalyOption->count() > 0) {
                debug("Using mean anomaly {} rad", meanAnomaly);
                double r = orbit.radiusFromMeanAnomaly(meanAnomaly);
                snapshot = TelemetrySnapshot{
                    .time = meanAnomaly / orbit.meanMotion(),
                    .meanAnomaly = meanAnomaly,
                    .position = orbit.positionFromMeanAnomaly(meanAnomaly),
                    .range = r,
                    .speed = orbit.velocityAtRadius(r)
                };
            } else {
                snapshot = snapshotAt(orbit, config.getTime());
            }
            printPosition(orbit, snapshot);
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    transferCommand->final_callback([&config](void) {
        try {
            checkConfig(config);
            auto transfer = config.toTransfer();
            debug("Transfer ellipse speeds: vp={} va={}", transfer.vPerigee, transfer.vApogee);
            missionplan::printTransfer(std::cout, transfer);
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    timelineCommand->final_callback([&config](void) {
        try {
            checkConfig(config);
            auto timeline = missionplan::buildTimeline(config.toTransfer(), config.getLaunchTime());
            missionplan::printTimeline(std::cout, timeline);
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    reportCommand->final_callback([&config, &reportJSON](void) {
        try {
            checkConfig(config);
            auto summary = missionplan::buildSummary(config.toOrbit(), config.toTransfer(),
                config.getTime(), config.getLaunchTime());
            if (reportJSON) {
                std::cout << missionplan::toJSON(summary) << std::endl;
            } else {
                missionplan::writeReport(std::cout, summary);
            }
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    renderCommand->final_callback([&config, &svgFilename, &renderOptions, &drawSpacecraft](void) {
        try {
            checkConfig(config);
            auto orbit = config.toOrbit();
            std::optional<double> t;
            if (drawSpacecraft) {
                t = config.getTime();
            }
            if (svgFilename.empty()) {
                std::cout << missionplan::renderOrbitSVG(orbit, renderOptions, t) << std::endl;
            } else {
                missionplan::writeOrbitSVG(expandTilde(svgFilename), orbit, renderOptions, t);
                spdlog::info("Wrote {}", svgFilename);
            }
        } catch (const std::exception &err) {
            error("{}", err.what());
            std::exit(1);
        }
    });

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cerr << app.help() << std::endl;
        std::exit(1);
    }

    return 0;
}
