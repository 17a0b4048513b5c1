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
 * @file ResultRecord.h
 *
 * \brief Result of one confirmed analysis.
 */
#pragma once

#include "EventDetector.h"
#include "WindowMetrics.h"
#include "internal/AnalysisExports.h"

#include <string>
#include <vector>

namespace ForcePlateKit {

/**
 * \brief Immutable summary of an analysis. Peak force and impulse are rounded
 * to 2 decimals; start and end times are the time stamps of the window
 * samples.
 */
class Analysis_API ResultRecord {
 public:
    ResultRecord(const std::string& subjectName, const AnalysisMode& mode,
                 const std::string& sourceFileName,
                 const WindowMetrics::Output& metrics);

    const std::string& getSubjectName() const { return subjectName; }
    const AnalysisMode& getMode() const { return mode; }
    const std::string& getSourceFileName() const { return sourceFileName; }
    double getPeakForce() const { return peakForce; }
    double getImpulse() const { return impulse; }
    double getStartTime() const { return startTime; }
    double getEndTime() const { return endTime; }

    // export column labels, in the order of asRow()
    static std::vector<std::string> columnLabels();

    // cells of the export table
    std::vector<std::string> asRow() const;

    // human readable summary (peak, impulse and interval)
    std::string summary() const;

 private:
    std::string subjectName;
    AnalysisMode mode;
    std::string sourceFileName;
    double peakForce;
    double impulse;
    double startTime;
    double endTime;
};

} // namespace ForcePlateKit
