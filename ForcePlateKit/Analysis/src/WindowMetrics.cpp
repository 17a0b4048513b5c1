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
 */
#include "WindowMetrics.h"

#include "Exception.h"
#include "Utils.h"

#include <algorithm>
#include <cmath>

using namespace std;
using namespace ForcePlateKit;

WindowMetrics::Output WindowMetrics::compute(const ForceTable& table,
                                             const DetectionWindow& window,
                                             const string& forceColumn,
                                             const string& timeColumn) {
    auto n = table.getNumRows();
    ENSURE_BOUNDS(window.startIndex, 0, n - 1);
    ENSURE_BOUNDS(window.endIndex, window.startIndex, n - 1);

    auto time = table.getColumn(timeColumn);
    auto force = table.getColumn(forceColumn);

    // rectify
    SimTK::Vector absForce(n);
    for (int i = 0; i < n; ++i) absForce[i] = std::abs(force[i]);

    double peak = absForce[window.startIndex];
    for (int i = window.startIndex + 1; i <= window.endIndex; ++i) {
        peak = std::max(peak, absForce[i]);
    }

    Output output;
    output.peakForce = peak;
    output.impulse =
            trapezoid(time, absForce, window.startIndex, window.endIndex);
    output.startTime = time[window.startIndex];
    output.endTime = time[window.endIndex];
    return output;
}

double WindowMetrics::trapezoid(const SimTK::Vector& x, const SimTK::Vector& y,
                                int first, int last) {
    if (x.size() != y.size()) {
        THROW_EXCEPTION("dimensions mismatch " + toString(x.size()) +
                        " != " + toString(y.size()));
    }
    double area = 0;
    for (int i = first; i < last; ++i) {
        area += 0.5 * (x[i + 1] - x[i]) * (y[i] + y[i + 1]);
    }
    return area;
}
