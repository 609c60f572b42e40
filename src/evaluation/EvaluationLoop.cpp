#include "evaluation/EvaluationLoop.hpp"
#include <iostream>

namespace {

void barChartOfCounts(IVisualizationSink& sink, const LabelVector& labels, const std::string& title) {
    std::vector<std::string> names;
    std::vector<double> counts;
    for (const auto& [name, count] : labels.valueCounts()) {
        names.push_back(name);
        counts.push_back(static_cast<double>(count));
    }
    sink.barChart(names, counts, title);
}

} // namespace

void runEvaluation(RunContext& context,
                   const std::vector<std::unique_ptr<IResampler>>& strategies,
                   const ClassifierFactory& factory) {
    const LabelVector* variants[] = {&context.fine, &context.coarse};

    for (const auto& strategy : strategies) {
        const std::string title = strategy->name();

        for (const LabelVector* active : variants) {
            auto [resX, resY] = strategy->fitResample(context.X, *active);

            std::cout << "Shape after sampling with " << title
                      << " - x (" << resX.rows() << ", " << resX.rowLength() << "),  y ("
                      << resY.size() << ",)" << std::endl;

            auto result = scoreResampled(resX, resY, *active, title,
                                         context.scoring, factory, context.sink);

            if (active == &context.fine) {
                barChartOfCounts(context.sink, resY, "Re-weighted Count (" + resY.name + ") - " + title);
            }

            context.ledger.record(title, active->name, std::move(result));
        }
    }
}
