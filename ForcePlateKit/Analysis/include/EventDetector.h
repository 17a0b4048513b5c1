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
 * @file EventDetector.h
 *
 * \brief Detection of the analysis window (start and end samples) in a
 * force-plate trial.
 */
#pragma once

#include "ForceTable.h"
#include "internal/AnalysisExports.h"

#include <SimTKcommon.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ForcePlateKit {

// Supported experimental protocols.
enum class AnalysisMode { LMJ, Throwing };

// "LMJ" or "Throwing"
Analysis_API std::string toString(const AnalysisMode& mode);

// Parse a mode name (case sensitive). Throws ValidationError on unknown names.
Analysis_API AnalysisMode analysisModeFromString(const std::string& name);

// Start and end sample (inclusive) of the analysis window.
struct DetectionWindow {
    int startIndex;
    int endIndex;
};

/**
 * \brief Locates the analysis window in a ForceTable.
 *
 * LMJ: the window is the envelope of all samples where the absolute axis force
 * exceeds the force threshold (first to last such sample).
 *
 * Throwing: the start is a sample where the absolute axis-foot force exceeds
 * the force threshold. If there is more than one, the operator chooses through
 * the disambiguation function. The end is the first sample at or after the
 * start where the lead-foot force exceeds mean + k * sd of the lead-foot
 * baseline (first baselinePeriod seconds of the trial, sample standard
 * deviation).
 *
 * Not finding a window and operator cancellation are reported through
 * Output::status. Missing columns throw FormatError.
 */
class Analysis_API EventDetector {
 public: /* public data structures */
    struct Parameters {
        double samplingRate = 1000.0;   // Hz
        double forceThreshold = 10.0;   // N, applies to |force|
        double baselinePeriod = 1.0;    // s, lead-foot quiet period
        double contactSdFactor = 5.0;   // k in mean + k * sd
        double timeTolerance = 1e-9;    // s, matching a chosen time to a row
        std::string timeColumn = "Time";
        std::string axisForceColumn = "Force.Fy.1"; // LMJ and throwing start
        std::string leadForceColumn = "Force.Fz.2"; // throwing foot contact
    };

    enum class Status { DETECTED, NO_WINDOW_FOUND, USER_CANCELLED };

    struct Output {
        Status status;
        DetectionWindow window; // valid only when DETECTED
        std::string message;    // reason when not DETECTED
    };

    struct Baseline {
        double mean;
        double sd;
        int numSamples;
    };

    /**
     * Disambiguation collaborator. Receives the name of the event and the
     * candidate times formatted with 4 decimals, returns the chosen time or
     * std::nullopt to cancel.
     */
    using ChooseFunction = std::function<std::optional<double>(
            const std::string& eventName,
            const std::vector<std::string>& candidates)>;

 public: /* public interface */
    EventDetector();
    EventDetector(const Parameters& parameters);

    /**
     * Detect the window according to the mode. The choose function is called
     * only in throwing mode when more than one start candidate exists; if it
     * is empty in that case a ValidationError is thrown.
     */
    Output detect(const ForceTable& table, const AnalysisMode& mode,
                  const ChooseFunction& choose = nullptr) const;

    Output detectLMJ(const ForceTable& table) const;

    Output detectThrowing(const ForceTable& table,
                          const ChooseFunction& choose) const;

    // indices where |x| > threshold
    static std::vector<int> findAbsoluteCrossings(const SimTK::Vector& x,
                                                  const double& threshold);

    // mean and sample standard deviation of the first numSamples values,
    // NaN samples are skipped and not counted in Baseline::numSamples
    static Baseline computeBaseline(const SimTK::Vector& x, int numSamples);

    /**
     * Row whose time is within tolerance of the chosen value. Throws
     * ValidationError if there is none.
     */
    static int findRowAtTime(const SimTK::Vector& time, const double& value,
                             const double& tolerance);

    // batch rule that always picks the candidate at the given position
    static ChooseFunction selectCandidateAt(std::size_t position);

    const Parameters& getParameters() const { return parameters; }

 private:
    void validateColumns(const ForceTable& table,
                         const std::vector<std::string>& required) const;

    Parameters parameters;
};

} // namespace ForcePlateKit
