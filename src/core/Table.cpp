#include "core/Table.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>

bool Table::hasColumn(const std::string& name) const {
    return std::find(headers_.begin(), headers_.end(), name) != headers_.end();
}

size_t Table::columnIndex(const std::string& name) const {
    const auto it = std::find(headers_.begin(), headers_.end(), name);
    if (it == headers_.end()) {
        throw ConfigurationError("column '" + name + "' not found in table");
    }
    return static_cast<size_t>(it - headers_.begin());
}

const std::vector<std::string>& Table::column(const std::string& name) const {
    return columns_[columnIndex(name)];
}

std::vector<std::string>& Table::column(const std::string& name) {
    return columns_[columnIndex(name)];
}

void Table::addColumn(const std::string& name, std::vector<std::string> values) {
    if (hasColumn(name)) {
        throw IOError("duplicate column '" + name + "'");
    }
    if (!columns_.empty() && values.size() != rows()) {
        throw IOError("column '" + name + "' has " + std::to_string(values.size()) +
                      " rows, table has " + std::to_string(rows()));
    }
    headers_.push_back(name);
    columns_.push_back(std::move(values));
}

Table Table::concatColumns(const Table& left, const Table& right) {
    if (left.cols() > 0 && right.cols() > 0 && left.rows() != right.rows()) {
        throw IOError("cannot concatenate tables with " + std::to_string(left.rows()) +
                      " and " + std::to_string(right.rows()) + " rows");
    }
    Table result = left;
    for (size_t c = 0; c < right.cols(); ++c) {
        result.addColumn(right.headers_[c], right.columns_[c]);
    }
    return result;
}
