#pragma once

#include <string>
#include <vector>

// counts[actual][predicted]
struct ConfusionMatrix {
    std::vector<std::string> classNames;
    std::vector<std::vector<size_t>> counts;

    /** @throws ConfigurationError on length mismatch or codes outside classNames */
    static ConfusionMatrix compute(const std::vector<int>& actual,
                                   const std::vector<int>& predicted,
                                   const std::vector<std::string>& classNames);

    size_t total() const;
    double accuracy() const;

    // Fixed-width text table, one row per actual class
    std::string toString() const;
};
