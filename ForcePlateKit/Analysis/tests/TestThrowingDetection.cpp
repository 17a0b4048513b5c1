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
 * @file TestThrowingDetection.cpp
 *
 * \brief Tests the two-stage throwing detection: start point candidates with
 * operator disambiguation and foot contact from the lead-foot baseline.
 */
#include "EventDetector.h"
#include "Exception.h"

#include <SimTKcommon.h>
#include <cmath>
#include <iostream>

using namespace std;
using namespace ForcePlateKit;

ForceTable makeTable(const vector<double>& fy, const vector<double>& fz) {
    ForceTable table({"Time", "Force.Fy.1", "Force.Fz.2"});
    for (size_t i = 0; i < fy.size(); ++i) {
        table.appendRow({i * 0.001, fy[i], fz[i]});
    }
    return table;
}

// 1.5 s trial, quiet lead foot alternating 1/3 N and a spike from 1.2 s
void makeSignals(vector<double>& fy, vector<double>& fz) {
    fy.assign(1500, 0.0);
    fz.assign(1500, 0.0);
    for (int i = 0; i < 1500; ++i) fz[i] = (i % 2 == 0) ? 1.0 : 3.0;
    for (int i = 1200; i < 1500; ++i) fz[i] = 100.0;
}

void testBaseline() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    auto baseline = EventDetector::computeBaseline(
            makeTable(fy, fz).getColumn("Force.Fz.2"), 1000);
    SimTK_ASSERT_ALWAYS(baseline.numSamples == 1000, "wrong baseline size");
    SimTK_ASSERT1_ALWAYS(std::abs(baseline.mean - 2.0) < 1e-12,
                         "wrong mean %f", baseline.mean);
    // sample standard deviation (N - 1)
    SimTK_ASSERT1_ALWAYS(std::abs(baseline.sd - sqrt(1000.0 / 999.0)) < 1e-12,
                         "wrong standard deviation %f", baseline.sd);
}

void testSingleCandidate() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    fy[1100] = 50.0;
    // a lead-foot spike before the start point is ignored
    for (int i = 1050; i < 1060; ++i) fz[i] = 100.0;

    bool prompted = false;
    auto choose = [&](const string&,
                      const vector<string>&) -> optional<double> {
        prompted = true;
        return nullopt;
    };
    auto output = EventDetector().detect(makeTable(fy, fz),
                                         AnalysisMode::Throwing, choose);
    SimTK_ASSERT_ALWAYS(!prompted, "a single candidate must not prompt");
    SimTK_ASSERT_ALWAYS(output.status == EventDetector::Status::DETECTED,
                        "window not detected");
    SimTK_ASSERT2_ALWAYS(output.window.startIndex == 1100 &&
                                 output.window.endIndex == 1200,
                         "wrong window [%d, %d]", output.window.startIndex,
                         output.window.endIndex);
}

void testMultipleCandidates() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    fy[1100] = 50.0;
    fy[1150] = -50.0;
    auto table = makeTable(fy, fz);

    vector<string> presented;
    auto chooseAt = [&](size_t k) {
        return [&presented, k](const string&, const vector<string>& candidates)
                       -> optional<double> {
            presented = candidates;
            return stod(candidates[k]);
        };
    };

    EventDetector detector;
    auto first = detector.detectThrowing(table, chooseAt(0));
    SimTK_ASSERT_ALWAYS(presented.size() == 2, "expected two candidates");
    SimTK_ASSERT_ALWAYS(presented[0] == "1.1000" && presented[1] == "1.1500",
                        "candidate times must have 4 decimals");
    SimTK_ASSERT_ALWAYS(first.window.startIndex == 1100 &&
                                first.window.endIndex == 1200,
                        "wrong window for the first candidate");

    auto second = detector.detectThrowing(table, chooseAt(1));
    SimTK_ASSERT_ALWAYS(second.window.startIndex == 1150 &&
                                second.window.endIndex == 1200,
                        "wrong window for the second candidate");
    SimTK_ASSERT_ALWAYS(first.window.startIndex != second.window.startIndex,
                        "different choices must yield different windows");

    // batch rule
    auto batch = detector.detectThrowing(
            table, EventDetector::selectCandidateAt(1));
    SimTK_ASSERT_ALWAYS(batch.window.startIndex == 1150,
                        "batch rule selected the wrong candidate");

    // cancellation
    auto cancelled = detector.detectThrowing(
            table, [](const string&, const vector<string>&) {
                return optional<double>();
            });
    SimTK_ASSERT_ALWAYS(cancelled.status ==
                                EventDetector::Status::USER_CANCELLED,
                        "cancellation not reported");

    // a time that is not a sample
    bool thrown = false;
    try {
        detector.detectThrowing(
                table, [](const string&, const vector<string>&) {
                    return optional<double>(1.12345);
                });
    } catch (ValidationError& e) {
        cout << "expected: " << e.what() << endl;
        thrown = true;
    }
    SimTK_ASSERT_ALWAYS(thrown, "unknown time was accepted");

    // no disambiguation function
    thrown = false;
    try {
        detector.detect(table, AnalysisMode::Throwing);
    } catch (ValidationError& e) {
        cout << "expected: " << e.what() << endl;
        thrown = true;
    }
    SimTK_ASSERT_ALWAYS(thrown, "missing disambiguation was accepted");
}

void testNoWindow() {
    vector<double> fy, fz;
    makeSignals(fy, fz);

    // no start point
    auto output = EventDetector().detectThrowing(makeTable(fy, fz), nullptr);
    SimTK_ASSERT_ALWAYS(output.status ==
                                EventDetector::Status::NO_WINDOW_FOUND,
                        "no start point expected");

    // start point after the foot contact has ended
    for (int i = 1200; i < 1500; ++i) fz[i] = 2.0;
    fy[1300] = 20.0;
    output = EventDetector().detectThrowing(makeTable(fy, fz), nullptr);
    SimTK_ASSERT_ALWAYS(output.status ==
                                EventDetector::Status::NO_WINDOW_FOUND,
                        "no foot contact expected");
}

void testStartIsContact() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    fy[1200] = 30.0;
    auto output = EventDetector().detectThrowing(makeTable(fy, fz), nullptr);
    SimTK_ASSERT_ALWAYS(output.window.startIndex == 1200 &&
                                output.window.endIndex == 1200,
                        "the start sample may also be the contact sample");
}

void testBaselineLongerThanTrial() {
    vector<double> fy(50, 0.0), fz(50, 0.0);
    for (int i = 0; i < 40; ++i) fz[i] = i % 2;
    fz[45] = 100.0;
    fy[42] = 20.0;
    auto table = makeTable(fy, fz);

    auto baseline = EventDetector::computeBaseline(
            table.getColumn("Force.Fz.2"), 1000);
    SimTK_ASSERT_ALWAYS(baseline.numSamples == 50,
                        "baseline must use the available rows");

    auto output = EventDetector().detectThrowing(table, nullptr);
    SimTK_ASSERT2_ALWAYS(output.status == EventDetector::Status::DETECTED &&
                                 output.window.startIndex == 42 &&
                                 output.window.endIndex == 45,
                         "wrong window [%d, %d]", output.window.startIndex,
                         output.window.endIndex);
}

void testMissingSamplesInBaseline() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    fy[1100] = 50.0;
    fz[10] = SimTK::NaN;
    auto table = makeTable(fy, fz);

    auto baseline = EventDetector::computeBaseline(
            table.getColumn("Force.Fz.2"), 1000);
    SimTK_ASSERT1_ALWAYS(baseline.numSamples == 999,
                         "NaN counted in the baseline, %d samples",
                         baseline.numSamples);
    SimTK_ASSERT1_ALWAYS(std::abs(baseline.mean - 1999.0 / 999.0) < 1e-12,
                         "wrong mean %f", baseline.mean);
    SimTK_ASSERT_ALWAYS(!SimTK::isNaN(baseline.sd),
                        "standard deviation must skip NaN");

    auto output = EventDetector().detectThrowing(table, nullptr);
    SimTK_ASSERT2_ALWAYS(output.status == EventDetector::Status::DETECTED &&
                                 output.window.startIndex == 1100 &&
                                 output.window.endIndex == 1200,
                         "wrong window [%d, %d]", output.window.startIndex,
                         output.window.endIndex);

    // fewer than two valid samples leave the spread undefined
    SimTK::Vector sparse(3, SimTK::NaN);
    sparse[1] = 4.0;
    auto single = EventDetector::computeBaseline(sparse, 3);
    SimTK_ASSERT_ALWAYS(single.numSamples == 1 && single.mean == 4.0 &&
                                SimTK::isNaN(single.sd),
                        "single valid sample baseline");
}

void testNonNumericRequiredColumn() {
    vector<double> fy, fz;
    makeSignals(fy, fz);
    fy[1100] = 50.0;
    auto table = makeTable(fy, fz);
    table.markNonNumeric("Force.Fz.2");
    bool thrown = false;
    try {
        EventDetector().detectThrowing(table, nullptr);
    } catch (FormatError& e) {
        cout << "expected: " << e.what() << endl;
        thrown = true;
    }
    SimTK_ASSERT_ALWAYS(thrown, "non-numeric lead-foot column was accepted");
}

void testMissingLeadColumn() {
    ForceTable table({"Time", "Force.Fy.1"});
    table.appendRow({0.0, 100.0});
    bool thrown = false;
    try {
        EventDetector().detectThrowing(table, nullptr);
    } catch (FormatError& e) {
        cout << "expected: " << e.what() << endl;
        thrown = true;
    }
    SimTK_ASSERT_ALWAYS(thrown, "missing lead-foot column was not reported");
}

void run() {
    testBaseline();
    testSingleCandidate();
    testMultipleCandidates();
    testNoWindow();
    testStartIsContact();
    testBaselineLongerThanTrial();
    testMissingSamplesInBaseline();
    testNonNumericRequiredColumn();
    testMissingLeadColumn();
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
