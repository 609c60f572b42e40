// =============================================================================
// src/functions/io/DataIO.cpp
// =============================================================================
#include "functions/io/DataIO.hpp"
#include "core/Exceptions.hpp"
#include <fstream>
#include <sstream>
#include <iostream>
#include <utility>

namespace {

void trim(std::string& s) {
    s.erase(0, s.find_first_not_of(" \t\r\n"));
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::vector<std::string> splitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ',')) {
        trim(cell);
        cells.push_back(std::move(cell));
    }
    // getline drops a trailing empty field
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

} // namespace

std::string DataIO::tablePath(const std::string& path, const std::string& name) {
    if (path.empty()) return name + ".csv";
    if (path.back() == '/') return path + name + ".csv";
    return path + "/" + name + ".csv";
}

Table DataIO::readTable(const std::string& path, const std::string& name) const {
    return readCSV(tablePath(path, name));
}

Table DataIO::readCSV(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw IOError("Unable to open file: " + filename);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw IOError("File is empty: " + filename);
    }

    const std::vector<std::string> headers = splitLine(line);
    if (headers.empty()) {
        throw IOError("No header found in " + filename);
    }

    std::vector<std::vector<std::string>> columns(headers.size());
    size_t lineNumber = 1;

    while (std::getline(file, line)) {
        ++lineNumber;
        if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        auto cells = splitLine(line);
        if (cells.size() != headers.size()) {
            throw IOError(filename + ":" + std::to_string(lineNumber) + ": expected " +
                          std::to_string(headers.size()) + " columns, found " +
                          std::to_string(cells.size()));
        }
        for (size_t c = 0; c < cells.size(); ++c) {
            columns[c].push_back(std::move(cells[c]));
        }
    }

    Table table;
    for (size_t c = 0; c < headers.size(); ++c) {
        table.addColumn(headers[c], std::move(columns[c]));
    }

    std::cout << "Loaded " << table.rows() << " rows with "
              << table.cols() << " columns from " << filename << std::endl;
    return table;
}

void DataIO::writeCSV(const std::string& filename,
                      const std::vector<std::string>& headers,
                      const std::vector<std::vector<std::string>>& rows) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        throw IOError("Failed to write to file: " + filename);
    }

    for (size_t i = 0; i < headers.size(); ++i) {
        out << headers[i];
        if (i + 1 < headers.size()) out << ',';
    }
    out << '\n';

    for (const auto& row : rows) {
        for (size_t j = 0; j < row.size(); ++j) {
            out << row[j];
            if (j + 1 < row.size()) out << ',';
        }
        out << '\n';
    }

    out.close();
    if (!out.good()) {
        throw IOError("Error occurred while writing to file: " + filename);
    }
}
