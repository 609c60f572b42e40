#pragma once

#include <string>
#include <vector>

/**
 * Receives rendering requests from the evaluation loop. Nothing rendered is
 * read back by the caller.
 */
class IVisualizationSink {
public:
    virtual ~IVisualizationSink() = default;

    // actual and predicted hold codes indexing classNames
    virtual void confusionMatrix(const std::vector<int>& actual,
                                 const std::vector<int>& predicted,
                                 const std::vector<std::string>& classNames,
                                 const std::string& title) = 0;

    virtual void barChart(const std::vector<std::string>& labels,
                          const std::vector<double>& values,
                          const std::string& title) = 0;
};
