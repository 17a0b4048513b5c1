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
 * @file TestAnalysisSession.cpp
 *
 * \brief Tests the session state machine: preconditions, the pending result
 * slot, accumulation and export.
 */
#include "AnalysisSession.h"
#include "Exception.h"

#include <OpenSim/Common/TimeSeriesTable.h>
#include <SimTKcommon.h>
#include <cmath>
#include <fstream>
#include <iostream>

using namespace std;
using namespace ForcePlateKit;

// 1.5 s trial at 1 kHz, axis-foot excursions at the given samples and a
// lead-foot contact from 1.2 s (if contact is true)
ForceTable makeTable(const vector<int>& excursions, bool contact = true) {
    ForceTable table({"Time", "Force.Fy.1", "Force.Fz.2"});
    for (int i = 0; i < 1500; ++i) {
        double fy = 0.0;
        for (auto k : excursions) {
            if (i >= k && i < k + 5) fy = 40.0 + i - k;
        }
        double fz = (i % 2 == 0) ? 1.0 : 3.0;
        if (contact && i >= 1200) fz = 500.0;
        table.appendRow({i * 0.001, fy, fz});
    }
    return table;
}

template <typename E, typename F> void expectThrow(F f, const string& what) {
    try {
        f();
    } catch (E& e) {
        cout << "expected: " << e.what() << endl;
        return;
    }
    THROW_EXCEPTION("no exception thrown: " + what);
}

void testPreconditions() {
    AnalysisSession session;
    SimTK_ASSERT_ALWAYS(session.getState() == AnalysisSession::State::IDLE,
                        "new session must be idle");
    expectThrow<ValidationError>([&] { session.runAnalysis(); },
                                 "missing subject name");
    session.setSubjectName("S01");
    expectThrow<ValidationError>([&] { session.runAnalysis(); },
                                 "missing file");
    session.loadTable(makeTable({100}), "trial.csv");
    session.setSubjectName("");
    expectThrow<ValidationError>([&] { session.runAnalysis(); },
                                 "empty subject name");
    SimTK_ASSERT_ALWAYS(!session.getPendingResult(),
                        "failed preconditions must not create a result");
}

void testConfirmOnce() {
    AnalysisSession session;
    session.setSubjectName("S01");
    session.setMode(AnalysisMode::LMJ);
    session.loadTable(makeTable({100, 400}), "trial.csv");

    auto output = session.runAnalysis();
    SimTK_ASSERT_ALWAYS(output.status == EventDetector::Status::DETECTED,
                        "window not detected");
    SimTK_ASSERT_ALWAYS(session.getState() ==
                                AnalysisSession::State::RESULT_PENDING,
                        "result must be pending");
    const auto& pending = session.getPendingResult();
    SimTK_ASSERT_ALWAYS(pending && pending->getSubjectName() == "S01" &&
                                pending->getSourceFileName() == "trial.csv" &&
                                pending->getStartTime() == 0.1 &&
                                pending->getEndTime() == 0.404,
                        "unexpected pending result");

    SimTK_ASSERT_ALWAYS(session.confirmPendingResult(), "confirm failed");
    SimTK_ASSERT_ALWAYS(!session.confirmPendingResult(),
                        "second confirm must be rejected");
    SimTK_ASSERT_ALWAYS(session.getResults().size() == 1,
                        "result was duplicated");

    // a re-run without confirmation replaces the pending result
    session.runAnalysis();
    session.runAnalysis();
    session.confirmPendingResult();
    SimTK_ASSERT_ALWAYS(session.getResults().size() == 2,
                        "only one pending result may exist");
}

void testPendingSlot() {
    AnalysisSession session;
    session.setSubjectName("S02");
    session.loadTable(makeTable({100}, false), "flat.csv");
    session.runAnalysis();
    SimTK_ASSERT_ALWAYS(session.getPendingResult().has_value(),
                        "LMJ result expected");

    // no foot contact: the session is left as it was
    session.setMode(AnalysisMode::Throwing);
    auto output = session.runAnalysis(EventDetector::selectCandidateAt(0));
    SimTK_ASSERT_ALWAYS(output.status ==
                                EventDetector::Status::NO_WINDOW_FOUND,
                        "no window expected");
    SimTK_ASSERT_ALWAYS(session.getPendingResult() &&
                                session.getPendingResult()->getMode() ==
                                        AnalysisMode::LMJ,
                        "pending result must be kept");
    SimTK_ASSERT_ALWAYS(session.getState() ==
                                AnalysisSession::State::RESULT_PENDING,
                        "state must be kept");

    // a new file discards the pending result
    session.loadTable(makeTable({100}), "next.csv");
    SimTK_ASSERT_ALWAYS(!session.getPendingResult(),
                        "pending result must be discarded on load");
    SimTK_ASSERT_ALWAYS(session.getState() ==
                                AnalysisSession::State::DATA_LOADED,
                        "data must be loaded");
    SimTK_ASSERT_ALWAYS(!session.confirmPendingResult() &&
                                session.getResults().empty(),
                        "nothing to confirm");
}

void testThrowing() {
    AnalysisSession session;
    session.setSubjectName("S03");
    session.setMode(AnalysisMode::Throwing);
    session.loadTable(makeTable({1100, 1150}), "throw.csv");

    // cancellation has no side effects
    auto cancel = [](const string&, const vector<string>&) {
        return optional<double>();
    };
    auto output = session.runAnalysis(cancel);
    SimTK_ASSERT_ALWAYS(output.status == EventDetector::Status::USER_CANCELLED,
                        "cancellation expected");
    SimTK_ASSERT_ALWAYS(!session.getPendingResult() &&
                                session.getResults().empty(),
                        "cancellation must not produce a result");

    // the first start candidate is the first sample of the first excursion
    output = session.runAnalysis(EventDetector::selectCandidateAt(0));
    SimTK_ASSERT_ALWAYS(output.window.startIndex == 1100 &&
                                output.window.endIndex == 1200,
                        "wrong throwing window");
    // metrics use the axis-foot channel (peak 44 N), not the lead foot
    SimTK_ASSERT1_ALWAYS(session.getPendingResult()->getPeakForce() == 44.0,
                         "wrong peak %f",
                         session.getPendingResult()->getPeakForce());

    auto first = session.getPendingResult()->getImpulse();
    session.runAnalysis(EventDetector::selectCandidateAt(5));
    SimTK_ASSERT_ALWAYS(
            std::abs(session.getPendingResult()->getStartTime() - 1.15) < 1e-12,
                        "wrong start time for the second excursion");
    SimTK_ASSERT_ALWAYS(session.getPendingResult()->getImpulse() != first,
                        "different start points must give different results");

    // plot data
    const auto& plot = session.getPlotData();
    SimTK_ASSERT_ALWAYS(plot && plot->channel == "Force.Fy.1" &&
                                plot->window.startIndex == 1150 &&
                                plot->time.size() == 1500 &&
                                plot->mode == AnalysisMode::Throwing,
                        "unexpected plot data");
    auto plotFile = "test_analysis_session.sto";
    session.exportPlotData(plotFile);
    OpenSim::TimeSeriesTable sto(plotFile);
    SimTK_ASSERT_ALWAYS(sto.getNumRows() == 1500, "wrong number of rows");
    auto mask = sto.getDependentColumn("InWindow");
    double inWindow = 0;
    for (int i = 0; i < mask.size(); ++i) inWindow += mask[i];
    SimTK_ASSERT1_ALWAYS(inWindow == 51.0, "wrong window mask %f", inWindow);
}

void testExport() {
    AnalysisSession session;
    expectThrow<ValidationError>([&] { session.exportResults("empty.csv"); },
                                 "nothing to export");
    expectThrow<ValidationError>(
            [&] { session.exportPlotData("empty.sto"); }, "nothing to plot");

    session.setSubjectName("S04");
    session.loadTable(makeTable({200}), "a.csv");
    session.runAnalysis();
    session.confirmPendingResult();
    session.loadTable(makeTable({300}), "b.csv");
    session.runAnalysis();
    session.confirmPendingResult();

    auto file = "test_analysis_session.csv";
    session.exportResults(file);
    ifstream stream(file);
    vector<string> lines;
    string line;
    while (getline(stream, line)) lines.push_back(line);
    SimTK_ASSERT_ALWAYS(lines.size() == 3, "header and two rows expected");
    SimTK_ASSERT_ALWAYS(lines[0] == "subjectName,mode,sourceFileName,"
                                    "peakForce,impulse,startTime,endTime",
                        "unexpected header");
    SimTK_ASSERT_ALWAYS(lines[1].rfind("S04,LMJ,a.csv,44,", 0) == 0,
                        "unexpected first row");

    // a failed export or load leaves the results intact
    expectThrow<ExportError>(
            [&] { session.exportResults("/nonexistent/dir/out.csv"); },
            "unwritable destination");
    expectThrow<FormatError>(
            [&] { session.loadFile("/nonexistent/dir/trial.csv"); },
            "missing file");
    SimTK_ASSERT_ALWAYS(session.getResults().size() == 2 &&
                                session.getSourceFileName() == "b.csv",
                        "failed operations must not change the session");
}

void run() {
    testPreconditions();
    testConfirmOnce();
    testPendingSlot();
    testThrowing();
    testExport();
}

int main(int argc, char* argv[]) {
    try {
        run();
    } catch (exception& e) {
        cout << e.what() << endl;
        return -1;
    }
    return 0;
}
