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
#include "Configuration.h"

#include "Exception.h"
#include "Utils.h"

using namespace std;
using namespace ForcePlateKit;

Configuration::Configuration(const string& iniFile) : ini(iniFile) {
    if (ini.ParseError() < 0) {
        THROW_EXCEPTION("cannot open configuration file '" + iniFile + "'");
    } else if (ini.ParseError() > 0) {
        THROW_EXCEPTION("parse error in '" + iniFile + "' at line " +
                        toString(ini.ParseError()));
    }
}

EventDetector::Parameters Configuration::getDetectorParameters() const {
    auto section = ANALYSIS_SECTION;
    EventDetector::Parameters p;
    p.samplingRate = ini.GetReal(section, "SAMPLING_RATE", p.samplingRate);
    p.forceThreshold =
            ini.GetReal(section, "FORCE_THRESHOLD", p.forceThreshold);
    p.baselinePeriod =
            ini.GetReal(section, "BASELINE_PERIOD", p.baselinePeriod);
    p.contactSdFactor =
            ini.GetReal(section, "CONTACT_SD_FACTOR", p.contactSdFactor);
    p.timeTolerance = ini.GetReal(section, "TIME_TOLERANCE", p.timeTolerance);
    p.timeColumn = ini.Get(section, "TIME_COLUMN", p.timeColumn);
    p.axisForceColumn =
            ini.Get(section, "AXIS_FORCE_COLUMN", p.axisForceColumn);
    p.leadForceColumn =
            ini.Get(section, "LEAD_FORCE_COLUMN", p.leadForceColumn);

    if (p.samplingRate <= 0)
        THROW_EXCEPTION("SAMPLING_RATE must be positive");
    if (p.baselinePeriod < 0)
        THROW_EXCEPTION("BASELINE_PERIOD must not be negative");
    return p;
}

ForcePlateFileReader::Parameters Configuration::getFileParameters() const {
    auto section = FILE_SECTION;
    ForcePlateFileReader::Parameters p;
    p.preambleLines = static_cast<int>(
            ini.GetInteger(section, "PREAMBLE_LINES", p.preambleLines));
    auto delimiter = ini.Get(section, "DELIMITER", string(1, p.delimiter));
    if (delimiter == "\\t" || delimiter == "tab")
        p.delimiter = '\t';
    else if (delimiter.size() == 1)
        p.delimiter = delimiter[0];
    else
        THROW_EXCEPTION("DELIMITER must be a single character, saw '" +
                        delimiter + "'");
    p.unitRowMarker = ini.Get(section, "UNIT_ROW_MARKER", p.unitRowMarker);
    p.labelColumn = ini.Get(section, "LABEL_COLUMN", p.labelColumn);

    if (p.preambleLines < 0)
        THROW_EXCEPTION("PREAMBLE_LINES must not be negative");
    return p;
}
