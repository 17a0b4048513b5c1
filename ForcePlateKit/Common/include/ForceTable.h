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
 * @file ForceTable.h
 *
 * \brief A column-labelled table of force-plate samples.
 */
#pragma once

#include "internal/CommonExports.h"

#include <SimTKcommon.h>
#include <map>
#include <string>
#include <vector>

namespace ForcePlateKit {

/**
 * \brief Sample table produced from a force-plate export.
 *
 * Rows are kept in sampling order and addressed by their 0-based position.
 * Cells are stored as doubles; missing values are stored as NaN. A column that
 * held any text cell (an event or comment column) is marked non-numeric and
 * its text cells are stored as NaN as well. The time column is
 * an ordinary labelled column (usually "Time"), so that a table that lacks it
 * can still be represented and reported by the consumers.
 */
class Common_API ForceTable {
 public:
    typedef std::vector<double> row_t;
    typedef std::vector<std::string> columns_t;

    ForceTable() = default;
    ForceTable(const columns_t& columns);

    // append a row, its size must match the number of columns
    void appendRow(const row_t& row);

    int getNumRows() const { return static_cast<int>(data.size()); }
    int getNumColumns() const { return static_cast<int>(columns.size()); }
    const columns_t& getColumnLabels() const { return columns; }

    bool hasColumn(const std::string& label) const;

    // false if the column held text cells, throws FormatError if absent
    bool isNumeric(const std::string& label) const;

    void markNonNumeric(const std::string& label);

    /**
     * Position of the column with the given label. Throws FormatError if the
     * column does not exist.
     */
    int getColumnIndex(const std::string& label) const;

    // copy of a column as a SimTK::Vector
    SimTK::Vector getColumn(const std::string& label) const;

    // value at row i of the column with the given label
    double getValue(int i, const std::string& label) const;

    // rename columns with exact label matches, others are left unchanged
    void renameColumns(const std::map<std::string, std::string>& renameMap);

 private:
    columns_t columns;
    std::vector<bool> numeric;
    std::vector<row_t> data;
};

} // namespace ForcePlateKit
