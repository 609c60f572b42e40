#include "dataset/KDDCup1999.hpp"
#include <algorithm>
#include <iostream>

void KDDCup1999::load(const DataIO& io) {
    features_ = io.readTable(config_.path, config_.file + "_processed");
    targets_ = io.readTable(config_.path, config_.file + "_target");
    full_ = Table::concatColumns(features_, targets_);
}

void KDDCup1999::shape() const {
    std::cout << "Dataset shape: (" << full_.rows() << ", " << full_.cols() << ")" << std::endl;
}

std::vector<std::pair<std::string, size_t>> KDDCup1999::rowCountByTarget(const std::string& column) const {
    std::map<std::string, size_t> counts;
    for (const auto& value : full_.column(column)) ++counts[value];

    std::vector<std::pair<std::string, size_t>> ordered(counts.begin(), counts.end());
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::cout << "Row count by " << column << ":" << std::endl;
    for (const auto& [value, count] : ordered) {
        std::cout << "  " << value << ": " << count << std::endl;
    }
    return ordered;
}

std::map<std::string, size_t> KDDCup1999::attackCategoryCount() const {
    std::map<std::string, size_t> counts;
    for (const auto& value : full_.column("attack_category")) ++counts[value];
    return counts;
}
