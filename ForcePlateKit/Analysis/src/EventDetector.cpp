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
#include "EventDetector.h"

#include "Exception.h"
#include "Utils.h"

#include <algorithm>
#include <cmath>
#include <cstdlib>

using namespace std;
using namespace ForcePlateKit;

string ForcePlateKit::toString(const AnalysisMode& mode) {
    switch (mode) {
    case AnalysisMode::LMJ: return "LMJ";
    case AnalysisMode::Throwing: return "Throwing";
    }
    THROW_EXCEPTION("unknown analysis mode");
}

AnalysisMode ForcePlateKit::analysisModeFromString(const string& name) {
    if (name == "LMJ")
        return AnalysisMode::LMJ;
    else if (name == "Throwing")
        return AnalysisMode::Throwing;
    else
        THROW_VALIDATION_ERROR("unknown analysis mode '" + name +
                               "'. Options: 'LMJ' or 'Throwing'");
}

//==============================================================================

EventDetector::EventDetector() : parameters(Parameters()) {}

EventDetector::EventDetector(const Parameters& otherParameters)
        : parameters(otherParameters) {}

EventDetector::Output
EventDetector::detect(const ForceTable& table, const AnalysisMode& mode,
                      const ChooseFunction& choose) const {
    if (mode == AnalysisMode::LMJ)
        return detectLMJ(table);
    else
        return detectThrowing(table, choose);
}

EventDetector::Output EventDetector::detectLMJ(const ForceTable& table) const {
    validateColumns(table, {parameters.axisForceColumn, parameters.timeColumn});

    auto candidates = findAbsoluteCrossings(
            table.getColumn(parameters.axisForceColumn),
            parameters.forceThreshold);
    if (candidates.empty()) {
        return {Status::NO_WINDOW_FOUND, {-1, -1},
                "no analysis window found (threshold " +
                        toString(parameters.forceThreshold) +
                        " N was not exceeded)"};
    }

    // envelope of all samples above threshold, dips inside are kept
    return {Status::DETECTED, {candidates.front(), candidates.back()}, ""};
}

EventDetector::Output
EventDetector::detectThrowing(const ForceTable& table,
                              const ChooseFunction& choose) const {
    validateColumns(table, {parameters.axisForceColumn,
                            parameters.leadForceColumn, parameters.timeColumn});
    auto time = table.getColumn(parameters.timeColumn);

    //
    // start point
    // ...
    auto candidates = findAbsoluteCrossings(
            table.getColumn(parameters.axisForceColumn),
            parameters.forceThreshold);
    if (candidates.empty()) {
        return {Status::NO_WINDOW_FOUND, {-1, -1},
                "no start point found (threshold " +
                        toString(parameters.forceThreshold) +
                        " N was not exceeded)"};
    }

    int startIndex = candidates.front();
    if (candidates.size() > 1) {
        if (!choose) {
            THROW_VALIDATION_ERROR(
                    toString(candidates.size()) +
                    " start point candidates require a disambiguation "
                    "function");
        }
        vector<string> labels;
        for (auto i : candidates) labels.push_back(toFixedString(time[i], 4));

        auto chosen = choose("start point", labels);
        if (!chosen) {
            return {Status::USER_CANCELLED, {-1, -1},
                    "start point selection cancelled"};
        }
        startIndex = findRowAtTime(time, chosen.value(),
                                   parameters.timeTolerance);
    }

    //
    // end point (foot contact)
    // ...
    auto lead = table.getColumn(parameters.leadForceColumn);
    auto baselineSamples =
            static_cast<int>(parameters.baselinePeriod * parameters.samplingRate);
    auto baseline = computeBaseline(lead, baselineSamples);
    auto contactThreshold =
            baseline.mean + parameters.contactSdFactor * baseline.sd;

    // the start sample itself is included in the search
    for (int i = startIndex; i < lead.size(); ++i) {
        if (lead[i] > contactThreshold) {
            return {Status::DETECTED, {startIndex, i}, ""};
        }
    }
    return {Status::NO_WINDOW_FOUND, {-1, -1},
            "no end point (foot contact) found above " +
                    toString(contactThreshold) + " N"};
}

vector<int> EventDetector::findAbsoluteCrossings(const SimTK::Vector& x,
                                                 const double& threshold) {
    vector<int> indices;
    for (int i = 0; i < x.size(); ++i) {
        if (std::abs(x[i]) > threshold) indices.push_back(i);
    }
    return indices;
}

EventDetector::Baseline EventDetector::computeBaseline(const SimTK::Vector& x,
                                                       int numSamples) {
    // a baseline longer than the trial uses whatever exists
    int n = std::max(0, std::min(numSamples, x.size()));

    // missing samples (NaN) are skipped
    int numValid = 0;
    double sum = 0;
    for (int i = 0; i < n; ++i) {
        if (SimTK::isNaN(x[i])) continue;
        sum += x[i];
        ++numValid;
    }
    double mean = numValid > 0 ? sum / numValid : SimTK::NaN;

    // sample standard deviation (N - 1), undefined for fewer than 2 samples
    double sd = SimTK::NaN;
    if (numValid > 1) {
        double ss = 0;
        for (int i = 0; i < n; ++i) {
            if (SimTK::isNaN(x[i])) continue;
            ss += (x[i] - mean) * (x[i] - mean);
        }
        sd = std::sqrt(ss / (numValid - 1));
    }
    return {mean, sd, numValid};
}

int EventDetector::findRowAtTime(const SimTK::Vector& time, const double& value,
                                 const double& tolerance) {
    for (int i = 0; i < time.size(); ++i) {
        if (std::abs(time[i] - value) < tolerance) return i;
    }
    THROW_VALIDATION_ERROR("chosen time " + toString(value) +
                           " does not match any sample");
}

EventDetector::ChooseFunction
EventDetector::selectCandidateAt(std::size_t position) {
    return [position](const string&,
                      const vector<string>& candidates) -> optional<double> {
        if (position >= candidates.size()) {
            THROW_VALIDATION_ERROR("candidate " + toString(position) +
                                   " requested but only " +
                                   toString(candidates.size()) + " exist");
        }
        return strtod(candidates[position].c_str(), nullptr);
    };
}

void EventDetector::validateColumns(const ForceTable& table,
                                    const vector<string>& required) const {
    for (const auto& column : required) {
        if (!table.hasColumn(column)) {
            THROW_FORMAT_ERROR("required column '" + column + "' not found");
        }
        if (!table.isNumeric(column)) {
            THROW_FORMAT_ERROR("required column '" + column +
                               "' contains non-numeric values");
        }
    }
}
