#include "CSVLogger.h"
#include "Utils.h"
#include "Exception.h"
#include <cerrno>
#include <cstring>
#include <fstream>

using namespace std;
using namespace ForcePlateKit;

CSVLogger::CSVLogger(const columns_t& columns) : columns(columns) {
}

void CSVLogger::addRow(const row_t& row) {
    if (row.size() != columns.size()) {
        THROW_EXCEPTION("dimensions mismatch " + toString(row.size()) +
                        " != " + toString(columns.size()));
    }
    data.push_back(row);
}

string CSVLogger::quote(const string& cell) const {
    if (cell.find_first_of(delimiter + "\"\r\n") == string::npos) return cell;
    string quoted = "\"";
    for (auto c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    return quoted + "\"";
}

void CSVLogger::exportToFile(const string& file) const {
    auto stream = ofstream(file, ofstream::out);
    if (!stream) {
        THROW_EXPORT_ERROR("cannot open '" + file +
                           "' for writing: " + strerror(errno));
    }
    row_t header;
    for (const auto& c : columns) header.push_back(quote(c));
    stream << dump(header, delimiter) << endl;
    for (const auto& row : data) {
        row_t quoted;
        for (const auto& cell : row) quoted.push_back(quote(cell));
        stream << dump(quoted, delimiter) << endl;
    }
    stream.close();
    if (stream.fail()) {
        THROW_EXPORT_ERROR("failed writing '" + file + "'");
    }
}
