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
#include "AnalysisSession.h"

#include "CSVLogger.h"
#include "Exception.h"
#include "Utils.h"

#include <OpenSim/Common/STOFileAdapter.h>
#include <filesystem>

using namespace std;
using namespace ForcePlateKit;

string ForcePlateKit::toString(const AnalysisSession::State& state) {
    switch (state) {
    case AnalysisSession::State::IDLE: return "IDLE";
    case AnalysisSession::State::DATA_LOADED: return "DATA_LOADED";
    case AnalysisSession::State::WINDOW_DETECTED: return "WINDOW_DETECTED";
    case AnalysisSession::State::RESULT_PENDING: return "RESULT_PENDING";
    }
    THROW_EXCEPTION("unknown session state");
}

OpenSim::TimeSeriesTable AnalysisSession::PlotData::asTimeSeriesTable() const {
    OpenSim::TimeSeriesTable sto;
    sto.setColumnLabels({channel, "InWindow"});
    for (int i = 0; i < time.size(); ++i) {
        SimTK::RowVector row(2);
        row[0] = force[i];
        row[1] = (i >= window.startIndex && i <= window.endIndex) ? 1.0 : 0.0;
        sto.appendRow(time[i], row);
    }
    return sto;
}

//==============================================================================

AnalysisSession::AnalysisSession()
        : detector(EventDetector::Parameters()),
          reader(ForcePlateFileReader::Parameters()) {}

AnalysisSession::AnalysisSession(
        const EventDetector::Parameters& detectorParameters,
        const ForcePlateFileReader::Parameters& readerParameters)
        : detector(detectorParameters), reader(readerParameters) {}

void AnalysisSession::loadFile(const string& fileName) {
    // read first, a FormatError leaves the session untouched
    auto newTable = reader.read(fileName);
    loadTable(newTable, filesystem::path(fileName).filename().string());
}

void AnalysisSession::loadTable(const ForceTable& newTable,
                                const string& newSourceFileName) {
    table = newTable;
    sourceFileName = newSourceFileName;
    pendingResult.reset();
    plotData.reset();
    state = State::DATA_LOADED;
}

EventDetector::Output
AnalysisSession::runAnalysis(const EventDetector::ChooseFunction& choose) {
    if (subjectName.empty()) {
        THROW_VALIDATION_ERROR("subject name is required");
    }
    if (!table) { THROW_VALIDATION_ERROR("a force-plate file is required"); }

    auto output = detector.detect(table.value(), mode, choose);
    if (output.status != EventDetector::Status::DETECTED) return output;
    state = State::WINDOW_DETECTED;

    // the axis channel is used for the metrics in both modes
    const auto& parameters = detector.getParameters();
    auto metrics = WindowMetrics::compute(table.value(), output.window,
                                          parameters.axisForceColumn,
                                          parameters.timeColumn);

    pendingResult = ResultRecord(subjectName, mode, sourceFileName, metrics);
    plotData = PlotData{table->getColumn(parameters.timeColumn),
                        table->getColumn(parameters.axisForceColumn),
                        output.window, parameters.axisForceColumn, mode};
    state = State::RESULT_PENDING;
    return output;
}

bool AnalysisSession::confirmPendingResult() {
    if (!pendingResult) return false;
    results.push_back(pendingResult.value());
    pendingResult.reset();
    state = State::DATA_LOADED;
    return true;
}

void AnalysisSession::discardPendingResult() {
    if (!pendingResult) return;
    pendingResult.reset();
    state = State::DATA_LOADED;
}

void AnalysisSession::exportResults(const string& fileName) const {
    if (results.empty()) {
        THROW_VALIDATION_ERROR("there are no results to export");
    }
    CSVLogger logger(ResultRecord::columnLabels());
    for (const auto& record : results) logger.addRow(record.asRow());
    logger.exportToFile(fileName);
}

void AnalysisSession::exportPlotData(const string& fileName) const {
    if (!plotData) {
        THROW_VALIDATION_ERROR("there is no analysis to export");
    }
    try {
        OpenSim::STOFileAdapter::write(plotData->asTimeSeriesTable(), fileName);
    } catch (const std::exception& e) {
        THROW_EXPORT_ERROR("cannot write '" + fileName + "': " + e.what());
    }
}
