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
 * @file ForcePlateFileReader.h
 *
 * \brief Reads the delimited text exported by the force-plate acquisition
 * software into a ForceTable.
 */
#pragma once

#include "ForceTable.h"
#include "internal/CommonExports.h"

#include <istream>
#include <map>
#include <string>

namespace ForcePlateKit {

/**
 * \brief Normalizes a raw force-plate export into a ForceTable.
 *
 * The export starts with a fixed number of metadata lines (preamble), followed
 * by the header row. The first data row may be a units annotation that starts
 * with the unit-row marker and is dropped. The label column (non-numeric
 * metadata) is dropped and the remaining columns are renamed by exact match
 * through the rename map. Empty header cells are named "Unnamed: <position>"
 * before renaming, so the unlabeled time column in the second position maps
 * to "Time".
 *
 * A FormatError is thrown when the file cannot be opened or the header row is
 * absent. Text cells are stored as NaN and their column is marked
 * non-numeric. Missing or non-numeric columns are not reported here; the
 * consumers validate the columns they need.
 */
class Common_API ForcePlateFileReader {
 public: /* public data structures */
    struct Parameters {
        int preambleLines = 4;                // lines before the header row
        char delimiter = ',';                 // cell delimiter
        std::string unitRowMarker = "DataUnit"; // prefix of the units row
        std::string labelColumn = "DataLabel";  // column that is dropped
        std::map<std::string, std::string> renameMap = {
                {"Unnamed: 1", "Time"},
                {"FY[1]", "Force.Fy.1"},
                {"FZ[2]", "Force.Fz.2"}};
    };

 public: /* public interface */
    ForcePlateFileReader();
    ForcePlateFileReader(const Parameters& parameters);

    // read and normalize the file
    ForceTable read(const std::string& fileName) const;

    // read and normalize from an already opened stream
    ForceTable read(std::istream& stream) const;

    const Parameters& getParameters() const { return parameters; }

 private:
    Parameters parameters;
};

} // namespace ForcePlateKit
