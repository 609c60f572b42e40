#pragma once

#include "core/Table.hpp"
#include "core/Types.hpp"
#include <string>
#include <vector>

namespace preprocessing {

struct PreprocessorConfig {
    std::vector<std::string> categoricalColumns = {"protocol_type", "service", "flag"};
    std::vector<std::string> scaleColumns = defaultScaleColumns();
    bool standardize = true;

    static std::vector<std::string> defaultScaleColumns();
};

/**
 * Turns the concatenated feature/target table into the numeric feature
 * matrix: categorical columns are label-encoded, numeric columns are
 * Yeo-Johnson transformed. The table itself is not modified.
 */
class Preprocessor {
public:
    explicit Preprocessor(PreprocessorConfig config = {});

    /**
     * Builds the feature matrix from the columns of featureOrder that are
     * categorical or scale columns, keeping featureOrder's order.
     * @throws ConfigurationError if a configured column is missing
     * @throws IOError if a numeric cell cannot be parsed
     */
    FeatureMatrix encodeAndScale(const Table& full,
                                 const std::vector<std::string>& featureOrder) const;

    // Positions of the categorical columns inside a matrix built by encodeAndScale
    std::vector<int> categoricalIndices(const FeatureMatrix& X) const;

    static LabelVector encodeLabels(const Table& full, const std::string& column);

    const PreprocessorConfig& config() const { return config_; }

private:
    PreprocessorConfig config_;

    bool isCategorical(const std::string& name) const;
    bool isScaled(const std::string& name) const;
};

} // namespace preprocessing
