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
#include "ForceTable.h"

#include "Exception.h"
#include "Utils.h"

#include <algorithm>

using namespace std;
using namespace ForcePlateKit;

ForceTable::ForceTable(const columns_t& columns)
        : columns(columns), numeric(columns.size(), true) {}

void ForceTable::appendRow(const row_t& row) {
    if (row.size() != columns.size()) {
        THROW_EXCEPTION("dimensions mismatch " + toString(row.size()) +
                        " != " + toString(columns.size()));
    }
    data.push_back(row);
}

bool ForceTable::hasColumn(const string& label) const {
    return find(columns.begin(), columns.end(), label) != columns.end();
}

bool ForceTable::isNumeric(const string& label) const {
    return numeric[getColumnIndex(label)];
}

void ForceTable::markNonNumeric(const string& label) {
    numeric[getColumnIndex(label)] = false;
}

int ForceTable::getColumnIndex(const string& label) const {
    auto found = find(columns.begin(), columns.end(), label);
    if (found == columns.end()) {
        THROW_FORMAT_ERROR("required column '" + label + "' not found");
    }
    return static_cast<int>(distance(columns.begin(), found));
}

SimTK::Vector ForceTable::getColumn(const string& label) const {
    auto j = getColumnIndex(label);
    SimTK::Vector column(getNumRows());
    for (int i = 0; i < getNumRows(); ++i) { column[i] = data[i][j]; }
    return column;
}

double ForceTable::getValue(int i, const string& label) const {
    ENSURE_BOUNDS(i, 0, getNumRows() - 1);
    return data[i][getColumnIndex(label)];
}

void ForceTable::renameColumns(const map<string, string>& renameMap) {
    for (auto& label : columns) {
        auto found = renameMap.find(label);
        if (found != renameMap.end()) label = found->second;
    }
}
