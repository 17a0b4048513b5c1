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
#include "ResultRecord.h"

#include "Utils.h"

#include <sstream>

using namespace std;
using namespace ForcePlateKit;

ResultRecord::ResultRecord(const string& subjectName, const AnalysisMode& mode,
                           const string& sourceFileName,
                           const WindowMetrics::Output& metrics)
        : subjectName(subjectName), mode(mode), sourceFileName(sourceFileName),
          peakForce(roundTo(metrics.peakForce, 2)),
          impulse(roundTo(metrics.impulse, 2)), startTime(metrics.startTime),
          endTime(metrics.endTime) {}

vector<string> ResultRecord::columnLabels() {
    return {"subjectName", "mode",    "sourceFileName", "peakForce",
            "impulse",     "startTime", "endTime"};
}

vector<string> ResultRecord::asRow() const {
    return {subjectName,
            toString(mode),
            sourceFileName,
            toString(peakForce, 15),
            toString(impulse, 15),
            toString(startTime, 15),
            toString(endTime, 15)};
}

string ResultRecord::summary() const {
    ostringstream oss;
    oss << "Peak force: " << toString(peakForce, 15) << " N\n"
        << "Impulse   : " << toString(impulse, 15) << " Ns\n"
        << "Window    : " << toString(startTime, 15) << "s - "
        << toString(endTime, 15) << "s";
    return oss.str();
}
