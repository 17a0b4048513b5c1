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
 * @file Exception.h
 *
 * \brief Exception utilities.
 */
#pragma once

#include <sstream>
#include <string>

namespace ForcePlateKit {

/**
 * \brief An exception that prints the file and line number along with
 * the message.
 */
class FileLineException : public std::exception {
 public:
    FileLineException(const std::string& arg, const char* file, int line)
            : std::exception() {
        std::ostringstream o;
        o << file << ":" << line << ": " << arg;
        msg = o.str();
    }
    const char* what() const throw() { return msg.c_str(); }

 private:
    std::string msg;
};

/**
 * \brief Malformed or unreadable input file, or a required column that is
 * missing from the loaded table.
 */
class FormatError : public FileLineException {
 public:
    FormatError(const std::string& arg, const char* file, int line)
            : FileLineException("FormatError: " + arg, file, line) {}
};

/**
 * \brief A precondition of an operation (subject name, loaded file, operator
 * choice) is not satisfied.
 */
class ValidationError : public FileLineException {
 public:
    ValidationError(const std::string& arg, const char* file, int line)
            : FileLineException("ValidationError: " + arg, file, line) {}
};

/**
 * \brief Results could not be written to the destination.
 */
class ExportError : public FileLineException {
 public:
    ExportError(const std::string& arg, const char* file, int line)
            : FileLineException("ExportError: " + arg, file, line) {}
};

// used as macro in order to insert __FILE__ and __LINE__
#define THROW_EXCEPTION(msg) throw FileLineException(msg, __FILE__, __LINE__)
#define THROW_FORMAT_ERROR(msg) throw FormatError(msg, __FILE__, __LINE__)
#define THROW_VALIDATION_ERROR(msg)                                            \
    throw ValidationError(msg, __FILE__, __LINE__)
#define THROW_EXPORT_ERROR(msg) throw ExportError(msg, __FILE__, __LINE__)

// ensure that i is within a range to avoid segmentation fault
#define ENSURE_BOUNDS(i, min, max)                                             \
    (i >= min && i <= max) ? i : THROW_EXCEPTION("ENSURE_BOUNDS failed")

} // namespace ForcePlateKit
