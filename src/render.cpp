/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#include <missionplan/render.hpp>

#include <algorithm>
#include <format>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace missionplan {

namespace {

// Maps orbital-plane coordinates (km) onto the canvas, y pointing down
struct Viewport {
    double cx, cy;          // Canvas center (px)
    double midX, midY;      // Bounding box center (km)
    double scale;           // px per km

    double toX(const Vec2& p) const {
        return cx + (p.x - midX) * scale;
    }

    double toY(const Vec2& p) const {
        return cy - (p.y - midY) * scale;
    }
};

Viewport fitViewport(const std::vector<Vec2>& positions, double a, const RenderOptions& options) {
    double minX = std::numeric_limits<double>::max();
    double maxX = -std::numeric_limits<double>::max();
    double minY = std::numeric_limits<double>::max();
    double maxY = -std::numeric_limits<double>::max();
    for (const auto& p : positions) {
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }

    // Include the central body
    minX = std::min(minX, -1.1 * a);
    maxX = std::max(maxX, 1.1 * a);
    minY = std::min(minY, -1.1 * a);
    maxY = std::max(maxY, 1.1 * a);

    double width = maxX - minX;
    double height = maxY - minY;
    double drawable = options.size - 2.0 * options.margin;

    return Viewport{
        .cx = options.margin + drawable / 2.0,
        .cy = options.margin + drawable / 2.0,
        .midX = minX + width / 2.0,
        .midY = minY + height / 2.0,
        .scale = std::min(drawable / width, drawable / height)
    };
}

}

std::string renderOrbitSVG(const Orbit& orbit, const RenderOptions& options,
                           std::optional<double> secondsSinceEpoch) {
    if (options.margin < 0 || options.size <= 2 * options.margin) {
        throw std::invalid_argument(std::format(
            "Canvas size {} px leaves no drawing area inside a {} px margin", options.size, options.margin));
    }
    auto positions = orbit.samplePath(options.points);
    auto view = fitViewport(positions, orbit.getSemiMajorAxis(), options);

    std::ostringstream svg;
    svg << std::format("<svg xmlns='http://www.w3.org/2000/svg' width='{0}' height='{0}' viewBox='0 0 {0} {0}'>",
        options.size);
    svg << "<rect width='100%' height='100%' fill='#050517' rx='12'/>";

    // Central body, drawn at the focus with a minimum visible radius
    Vec2 focus{0.0, 0.0};
    double bodyDisplayRadius = std::max(4.0, options.bodyRadius * view.scale * 0.0005);
    svg << std::format("<circle cx='{:.2f}' cy='{:.2f}' r='{:.2f}' fill='#1463ff' stroke='#ffffff11'/>",
        view.toX(focus), view.toY(focus), bodyDisplayRadius);

    svg << "<polyline fill='none' stroke='#ffffff55' stroke-width='1' points='";
    bool first = true;
    for (const auto& p : positions) {
        if (!first) svg << ' ';
        svg << std::format("{:.2f},{:.2f}", view.toX(p), view.toY(p));
        first = false;
    }
    svg << "'/>";

    if (secondsSinceEpoch.has_value()) {
        Vec2 p = orbit.positionAtTime(*secondsSinceEpoch);
        double sx = view.toX(p);
        double sy = view.toY(p);
        svg << std::format("<circle cx='{:.2f}' cy='{:.2f}' r='4' fill='#ffcc33'/>", sx, sy);
        svg << std::format("<text x='{:.2f}' y='{:.2f}' font-family='monospace' font-size='12' fill='#ffffffcc'>Spacecraft</text>",
            sx + 8.0, sy - 8.0);
    }

    svg << "</svg>";
    return svg.str();
}

void writeOrbitSVG(const std::string& filepath, const Orbit& orbit,
                   const RenderOptions& options, std::optional<double> secondsSinceEpoch) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Couldn't open file for writing: " + filepath);
    }
    file << renderOrbitSVG(orbit, options, secondsSinceEpoch) << std::endl;
    if (!file) {
        throw std::runtime_error("Couldn't write SVG to file: " + filepath);
    }
}

}
