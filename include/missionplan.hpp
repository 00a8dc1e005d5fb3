/*
 * Copyright (c) 2025 Andrew C. Young <andrew@vaelen.org>
 * SPDX-License-Identifier: MIT
 */

#ifndef __MISSIONPLAN_HPP
#define __MISSIONPLAN_HPP

#include <missionplan/orbit.hpp>
#include <missionplan/transfer.hpp>
#include <missionplan/config.hpp>
#include <missionplan/mission.hpp>
#include <missionplan/render.hpp>

#endif
