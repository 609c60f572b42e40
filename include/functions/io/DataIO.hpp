// =============================================================================
// include/functions/io/DataIO.hpp - CSV table reading and result writing
// =============================================================================
#pragma once

#include "core/Table.hpp"
#include <string>
#include <vector>

class DataIO {
public:
    /**
     * Read <path>/<name>.csv
     * @throws IOError on missing/empty file or ragged rows
     */
    Table readTable(const std::string& path, const std::string& name) const;

    // First row is the header; cells are whitespace-trimmed
    Table readCSV(const std::string& filename) const;

    void writeCSV(const std::string& filename,
                  const std::vector<std::string>& headers,
                  const std::vector<std::vector<std::string>>& rows) const;

    static std::string tablePath(const std::string& path, const std::string& name);
};
