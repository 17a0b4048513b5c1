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
 * @file Utils.h
 *
 * \brief Useful utilities.
 */
#pragma once

#include "Exception.h"
#include "internal/CommonExports.h"

#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

namespace ForcePlateKit {

/**
 * Converts <T> to string and with defined precision (in case of number).
 */
template <typename T>
std::string toString(const T& value,
                     int precision = std::numeric_limits<int>::infinity()) {
    std::ostringstream oss;
    if (precision != std::numeric_limits<int>::infinity()) {
        oss << std::setprecision(precision);
    }
    oss << value;
    return oss.str();
}

/**
 * Converts a number to string with a fixed number of decimals (e.g., 4 ->
 * "0.1230").
 */
inline std::string toFixedString(const double& value, int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

/**
 * Separates (delimiter) the values of the std container into a single line
 * string.
 */
template <typename T>
std::string dump(const T& vec, std::string delimiter) {
    if (vec.empty()) return "";
    std::string row = toString(vec.at(0));
    for (std::size_t i = 1; i < vec.size(); ++i) {
        row += delimiter;
        row += toString(vec.at(i));
    }
    return row;
}

/**
 * Round half away from zero to the given number of decimals.
 */
inline double roundTo(const double& value, int decimals) {
    const double scale = std::pow(10.0, decimals);
    return std::round(value * scale) / scale;
}

/**
 * Strip leading and trailing white-space (including '\r' of CRLF files).
 */
inline std::string trim(const std::string& str) {
    const char* ws = " \t\r\n";
    auto begin = str.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    auto end = str.find_last_not_of(ws);
    return str.substr(begin, end - begin + 1);
}

} // namespace ForcePlateKit
