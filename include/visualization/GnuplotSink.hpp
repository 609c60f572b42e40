// =============================================================================
// include/visualization/GnuplotSink.hpp - Console tables plus gnuplot scripts
// =============================================================================
#pragma once

#include "visualization/IVisualizationSink.hpp"
#include <string>
#include <vector>

/**
 * Prints every chart to std::cout and writes <plotDir>/<id>.dat and
 * <plotDir>/<id>.gp, id being the sanitized title. With renderImages set
 * the script is run through gnuplot to produce <id>.png; a missing or
 * failing gnuplot only produces a warning on std::cerr.
 */
class GnuplotSink : public IVisualizationSink {
public:
    /** @throws IOError when plotDir cannot be created */
    GnuplotSink(std::string plotDir, bool renderImages);

    void confusionMatrix(const std::vector<int>& actual,
                         const std::vector<int>& predicted,
                         const std::vector<std::string>& classNames,
                         const std::string& title) override;

    void barChart(const std::vector<std::string>& labels,
                  const std::vector<double>& values,
                  const std::string& title) override;

    const std::string& plotDir() const { return plotDir_; }

    static std::string sanitizeId(const std::string& title);
    static std::string quoteForGnuplot(const std::string& value);

private:
    std::string plotDir_;
    bool renderImages_;

    std::string header(const std::string& id, const std::string& title) const;
    void writeScript(const std::string& id, const std::string& data, const std::string& script) const;
};
