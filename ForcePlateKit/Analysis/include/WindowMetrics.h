/**
 * -----------------------------------------------------------------------------
 * Copyright 2026 ForcePlateKit developers.
 *
 * This file is part of ForcePlateKit.
 *
 * ForcePlateKit is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * ForcePlateKit is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS
 * FOR A PARTICULAR PURPOSE.  See the GNU General Public License for more
 * details.
 *
 * You should have received a copy of the GNU General Public License along with
 * ForcePlateKit. If not, see <https://www.gnu.org/licenses/>.
 * -----------------------------------------------------------------------------
 *
 * @file WindowMetrics.h
 *
 * \brief Peak force and impulse over a detected window.
 */
#pragma once

#include "EventDetector.h"
#include "ForceTable.h"
#include "internal/AnalysisExports.h"

#include <SimTKcommon.h>
#include <string>

namespace ForcePlateKit {

/**
 * \brief Computes the peak absolute force and the impulse (trapezoidal
 * integral of the absolute force over the actual time stamps) of the
 * samples [startIndex, endIndex].
 */
class Analysis_API WindowMetrics {
 public:
    struct Output {
        double peakForce; // N
        double impulse;   // N s
        double startTime; // s
        double endTime;   // s
    };

    static Output compute(const ForceTable& table,
                          const DetectionWindow& window,
                          const std::string& forceColumn,
                          const std::string& timeColumn = "Time");

    // trapezoidal rule of y(x) over [first, last]; 0 for a single sample
    static double trapezoid(const SimTK::Vector& x, const SimTK::Vector& y,
                            int first, int last);
};

} // namespace ForcePlateKit
