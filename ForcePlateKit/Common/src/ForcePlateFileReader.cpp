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
#include "ForcePlateFileReader.h"

#include "Exception.h"
#include "Utils.h"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <set>
#include <vector>

using namespace std;
using namespace ForcePlateKit;

// split a delimited line into cells, double quotes may enclose a cell
static vector<string> splitCells(const string& line, char delimiter,
                                 int lineNumber) {
    vector<string> cells;
    string cell;
    bool inQuotes = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (inQuotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                cell += '"';
                ++i;
            } else if (c == '"') {
                inQuotes = false;
            } else {
                cell += c;
            }
        } else if (c == '"') {
            inQuotes = true;
        } else if (c == delimiter) {
            cells.push_back(trim(cell));
            cell.clear();
        } else {
            cell += c;
        }
    }
    if (inQuotes) {
        THROW_FORMAT_ERROR("unterminated quoted cell at line " +
                           toString(lineNumber));
    }
    cells.push_back(trim(cell));
    return cells;
}

// empty cells become NaN, text cells become NaN and clear isNumber
static double parseCell(const string& cell, bool& isNumber) {
    isNumber = true;
    if (cell.empty()) return SimTK::NaN;
    const char* begin = cell.c_str();
    char* end;
    double value = strtod(begin, &end);
    if (end == begin || *end != '\0') {
        isNumber = false;
        return SimTK::NaN;
    }
    return value;
}

ForcePlateFileReader::ForcePlateFileReader() : parameters(Parameters()) {}

ForcePlateFileReader::ForcePlateFileReader(const Parameters& otherParameters)
        : parameters(otherParameters) {}

ForceTable ForcePlateFileReader::read(const string& fileName) const {
    ifstream stream(fileName);
    if (!stream) {
        THROW_FORMAT_ERROR("cannot open '" + fileName + "': " +
                           strerror(errno));
    }
    return read(stream);
}

ForceTable ForcePlateFileReader::read(istream& stream) const {
    string line;
    int lineNumber = 0;

    // skip the metadata preamble
    for (int i = 0; i < parameters.preambleLines; ++i) {
        if (!getline(stream, line)) {
            THROW_FORMAT_ERROR("header row absent, file ends inside the " +
                               toString(parameters.preambleLines) +
                               "-line preamble");
        }
        ++lineNumber;
    }

    // header row
    if (!getline(stream, line) || trim(line).empty()) {
        THROW_FORMAT_ERROR("header row absent at line " +
                           toString(lineNumber + 1));
    }
    ++lineNumber;
    auto header = splitCells(line, parameters.delimiter, lineNumber);
    set<string> seen;
    for (size_t j = 0; j < header.size(); ++j) {
        if (header[j].empty()) header[j] = "Unnamed: " + toString(j);
        // mangle duplicates as X.1, X.2, ...
        auto label = header[j];
        for (int k = 1; seen.count(label); ++k) {
            label = header[j] + "." + toString(k);
        }
        header[j] = label;
        seen.insert(label);
    }

    // kept columns (the label column is metadata)
    vector<int> kept;
    ForceTable::columns_t labels;
    for (size_t j = 0; j < header.size(); ++j) {
        if (header[j] == parameters.labelColumn) continue;
        kept.push_back(static_cast<int>(j));
        labels.push_back(header[j]);
    }

    ForceTable table(labels);
    vector<bool> hasText(kept.size(), false);
    bool firstDataRow = true;
    while (getline(stream, line)) {
        ++lineNumber;
        if (trim(line).empty()) continue;

        auto cells = splitCells(line, parameters.delimiter, lineNumber);
        if (cells.size() > header.size()) {
            THROW_FORMAT_ERROR("expected " + toString(header.size()) +
                               " cells, saw " + toString(cells.size()) +
                               " at line " + toString(lineNumber));
        }
        cells.resize(header.size());

        // units annotation
        if (firstDataRow) {
            firstDataRow = false;
            if (cells[0].compare(0, parameters.unitRowMarker.size(),
                                 parameters.unitRowMarker) == 0) {
                continue;
            }
        }

        ForceTable::row_t row;
        for (size_t k = 0; k < kept.size(); ++k) {
            bool isNumber;
            row.push_back(parseCell(cells[kept[k]], isNumber));
            if (!isNumber) hasText[k] = true;
        }
        table.appendRow(row);
    }
    if (stream.bad()) {
        THROW_FORMAT_ERROR("read failure after line " + toString(lineNumber));
    }

    for (size_t k = 0; k < kept.size(); ++k) {
        if (hasText[k]) table.markNonNumeric(labels[k]);
    }
    table.renameColumns(parameters.renameMap);
    return table;
}
