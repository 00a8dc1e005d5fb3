/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_RENDER_HPP
#define __MISSIONPLAN_RENDER_HPP

#include <missionplan/orbit.hpp>

#include <optional>
#include <string>

namespace missionplan {

struct RenderOptions {
    int size = 700;                             ///< Canvas width and height (px)
    int margin = 40;                            ///< Border around the drawing area (px)
    int points = 720;                           ///< Samples along the orbit path
    double bodyRadius = RADIUS_EARTH_KM;        ///< Central body radius (km)
};

/**
 * Renders the orbit path, the central body and (optionally) the spacecraft
 * position as a standalone SVG document.
 *
 * The view is centered on the sampled path's bounding box, which always
 * includes ±1.1·a so that the central body stays in frame.
 *
 * @param orbit The orbit to draw
 * @param options Canvas settings
 * @param secondsSinceEpoch If set, draws the spacecraft at this time
 * @return SVG markup
 * @throws std::invalid_argument if size is not larger than twice the margin
 */
std::string renderOrbitSVG(const Orbit& orbit, const RenderOptions& options = {},
                           std::optional<double> secondsSinceEpoch = std::nullopt);

/**
 * Renders the orbit and writes the SVG document to a file.
 *
 * @throws std::runtime_error if the file can't be written
 */
void writeOrbitSVG(const std::string& filepath, const Orbit& orbit,
                   const RenderOptions& options = {},
                   std::optional<double> secondsSinceEpoch = std::nullopt);

}

#endif
