#pragma once

#include "visualization/IVisualizationSink.hpp"
#include <string>
#include <vector>

// Keeps every request instead of rendering it
class RecordingSink : public IVisualizationSink {
public:
    struct Matrix {
        std::vector<int> actual;
        std::vector<int> predicted;
        std::vector<std::string> classNames;
        std::string title;
    };
    struct Bars {
        std::vector<std::string> labels;
        std::vector<double> values;
        std::string title;
    };

    void confusionMatrix(const std::vector<int>& actual,
                         const std::vector<int>& predicted,
                         const std::vector<std::string>& classNames,
                         const std::string& title) override {
        matrices.push_back({actual, predicted, classNames, title});
    }

    void barChart(const std::vector<std::string>& labels,
                  const std::vector<double>& values,
                  const std::string& title) override {
        bars.push_back({labels, values, title});
    }

    std::vector<Matrix> matrices;
    std::vector<Bars> bars;
};
