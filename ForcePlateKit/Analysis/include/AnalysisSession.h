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
 * @file AnalysisSession.h
 *
 * \brief Holds the loaded trial, runs detection and metrics and accumulates
 * the confirmed results of a session.
 */
#pragma once

#include "EventDetector.h"
#include "ForcePlateFileReader.h"
#include "ForceTable.h"
#include "ResultRecord.h"
#include "WindowMetrics.h"
#include "internal/AnalysisExports.h"

#include <OpenSim/Common/TimeSeriesTable.h>
#include <SimTKcommon.h>
#include <optional>
#include <string>
#include <vector>

namespace ForcePlateKit {

/**
 * \brief Orchestrates an analysis session.
 *
 * State per loaded file:
 *
 *   IDLE -> DATA_LOADED -> WINDOW_DETECTED -> RESULT_PENDING
 *
 * A successful analysis stores its ResultRecord in a single pending slot that
 * is moved to the result collection by confirmPendingResult(). A new result or
 * a new file replaces the pending slot without confirmation. If no window is
 * found or the operator cancels, the session is left as it was.
 */
class Analysis_API AnalysisSession {
 public: /* public data structures */
    enum class State { IDLE, DATA_LOADED, WINDOW_DETECTED, RESULT_PENDING };

    // data required to plot the analysed channel and the window
    struct PlotData {
        SimTK::Vector time;
        SimTK::Vector force;
        DetectionWindow window;
        std::string channel;
        AnalysisMode mode;

        // channel and window mask (1 inside, 0 outside) against time
        OpenSim::TimeSeriesTable asTimeSeriesTable() const;
    };

 public: /* public interface */
    AnalysisSession();
    AnalysisSession(const EventDetector::Parameters& detectorParameters,
                    const ForcePlateFileReader::Parameters& readerParameters);

    void setSubjectName(const std::string& name) { subjectName = name; }
    const std::string& getSubjectName() const { return subjectName; }
    void setMode(const AnalysisMode& aMode) { mode = aMode; }
    const AnalysisMode& getMode() const { return mode; }

    /**
     * Read a force-plate export. On success the pending result is discarded.
     * On FormatError the session is left unchanged.
     */
    void loadFile(const std::string& fileName);

    // same as loadFile with an already normalized table
    void loadTable(const ForceTable& table, const std::string& sourceFileName);

    /**
     * Detect the window of the loaded trial and compute its metrics. Throws
     * ValidationError if the subject name is empty or no trial is loaded.
     * The returned status tells whether a new pending result exists.
     */
    EventDetector::Output
    runAnalysis(const EventDetector::ChooseFunction& choose = nullptr);

    const std::optional<ResultRecord>& getPendingResult() const {
        return pendingResult;
    }

    /**
     * Append the pending result to the collection and clear the slot. Returns
     * false (and does nothing) if there is no pending result.
     */
    bool confirmPendingResult();

    void discardPendingResult();

    const std::vector<ResultRecord>& getResults() const { return results; }

    /**
     * Write the confirmed results as a csv table. Throws ValidationError if
     * there are no results and ExportError if the file cannot be written.
     */
    void exportResults(const std::string& fileName) const;

    // plot data of the most recent successful analysis
    const std::optional<PlotData>& getPlotData() const { return plotData; }

    // store the plot data as .sto, throws ValidationError or ExportError
    void exportPlotData(const std::string& fileName) const;

    State getState() const { return state; }
    bool hasData() const { return table.has_value(); }
    const std::string& getSourceFileName() const { return sourceFileName; }
    const EventDetector& getDetector() const { return detector; }

 private:
    EventDetector detector;
    ForcePlateFileReader reader;

    std::string subjectName;
    AnalysisMode mode = AnalysisMode::LMJ;
    std::string sourceFileName;
    std::optional<ForceTable> table;

    State state = State::IDLE;
    std::optional<ResultRecord> pendingResult;
    std::optional<PlotData> plotData;
    std::vector<ResultRecord> results;
};

// "IDLE", "DATA_LOADED", ...
Analysis_API std::string toString(const AnalysisSession::State& state);

} // namespace ForcePlateKit
