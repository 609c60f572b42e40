#pragma once

#include <string>
#include <vector>

/**
 * Column-major table of raw string cells, as read from a CSV file.
 * All columns have the same length.
 */
class Table {
public:
    Table() = default;

    size_t rows() const { return columns_.empty() ? 0 : columns_.front().size(); }
    size_t cols() const { return headers_.size(); }

    const std::vector<std::string>& headers() const { return headers_; }

    bool hasColumn(const std::string& name) const;
    size_t columnIndex(const std::string& name) const;

    const std::vector<std::string>& column(const std::string& name) const;
    std::vector<std::string>& column(const std::string& name);

    // Appends a column; length must match existing rows
    void addColumn(const std::string& name, std::vector<std::string> values);

    /**
     * Column-wise concatenation (left columns first)
     * @throws IOError when row counts differ or a column name repeats
     */
    static Table concatColumns(const Table& left, const Table& right);

private:
    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> columns_;
};
