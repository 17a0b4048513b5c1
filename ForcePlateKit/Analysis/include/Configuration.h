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
 * @file Configuration.h
 *
 * \brief Analysis parameters from an INI file.
 */
#pragma once

#include "EventDetector.h"
#include "ForcePlateFileReader.h"
#include "internal/AnalysisExports.h"

#include <INIReader.h>
#include <string>

namespace ForcePlateKit {

/**
 * \brief Reads the analysis and file parameters from an INI file. Keys that
 * are missing fall back to the defaults of the corresponding Parameters.
 *
 * [FORCE_PLATE_ANALYSIS]
 * SAMPLING_RATE = 1000.0
 * FORCE_THRESHOLD = 10.0
 * BASELINE_PERIOD = 1.0
 * CONTACT_SD_FACTOR = 5.0
 * TIME_TOLERANCE = 1e-9
 * TIME_COLUMN = Time
 * AXIS_FORCE_COLUMN = Force.Fy.1
 * LEAD_FORCE_COLUMN = Force.Fz.2
 *
 * [FORCE_PLATE_FILE]
 * PREAMBLE_LINES = 4
 * DELIMITER = ,
 * UNIT_ROW_MARKER = DataUnit
 * LABEL_COLUMN = DataLabel
 */
class Analysis_API Configuration {
 public:
    static constexpr const char* ANALYSIS_SECTION = "FORCE_PLATE_ANALYSIS";
    static constexpr const char* FILE_SECTION = "FORCE_PLATE_FILE";

    // throws if the file cannot be opened or parsed
    Configuration(const std::string& iniFile);

    EventDetector::Parameters getDetectorParameters() const;
    ForcePlateFileReader::Parameters getFileParameters() const;

    const INIReader& getReader() const { return ini; }

 private:
    INIReader ini;
};

} // namespace ForcePlateKit
