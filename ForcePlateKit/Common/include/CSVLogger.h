#ifndef CSV_LOGGER_H
#define CSV_LOGGER_H

#include "internal/CommonExports.h"
#include <vector>
#include <string>

namespace ForcePlateKit {

/**
 * \brief A simple csv logger for tables of text cells. Cells that contain the
 * delimiter, quotes or line breaks are quoted on export.
 */
class Common_API CSVLogger {
public:
    typedef std::vector<std::string> row_t;
    typedef std::vector<std::string> columns_t;
    columns_t columns;
    std::vector<row_t> data;
    std::string delimiter = ",";
public:
    CSVLogger(const columns_t& columns);
    void addRow(const row_t& row);
    // throws ExportError if the file cannot be written
    void exportToFile(const std::string& file) const;
private:
    std::string quote(const std::string& cell) const;
};

} // namespace ForcePlateKit

#endif
