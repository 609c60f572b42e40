#pragma once

#include "core/Table.hpp"
#include "functions/io/DataIO.hpp"
#include <map>
#include <string>
#include <utility>
#include <vector>

struct DatasetConfig {
    std::string path = "data";
    std::string file = "kddcup";
};

/**
 * KDD Cup 1999 intrusion data split over <file>_processed.csv (features)
 * and <file>_target.csv (attack_category, target).
 */
class KDDCup1999 {
public:
    explicit KDDCup1999(DatasetConfig config = {}) : config_(std::move(config)) {}

    /**
     * Reads both tables and joins them column-wise
     * @throws IOError on unreadable files or differing row counts
     */
    void load(const DataIO& io);

    const Table& features() const { return features_; }
    const Table& targets() const { return targets_; }
    const Table& full() const { return full_; }

    // Prints "Dataset shape: (rows, cols)" for the joined table
    void shape() const;

    // Row count per value of column, largest first
    std::vector<std::pair<std::string, size_t>> rowCountByTarget(const std::string& column) const;

    std::map<std::string, size_t> attackCategoryCount() const;

    const DatasetConfig& config() const { return config_; }

private:
    DatasetConfig config_;
    Table features_;
    Table targets_;
    Table full_;
};
