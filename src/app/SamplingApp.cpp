#include "app/SamplingApp.hpp"
#include "core/Exceptions.hpp"
#include "core/RunLog.hpp"
#include "dataset/KDDCup1999.hpp"
#include "evaluation/EvaluationLoop.hpp"
#include "preprocessing/Preprocessor.hpp"
#include "resampling/ResamplerFactory.hpp"
#include "visualization/GnuplotSink.hpp"
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

namespace {

const char* kBanner =
    "===========================================================================\n"
    "Sampling techniques using KDD Cup 1999 IDS dataset\n"
    "===========================================================================\n"
    "The following examples demonstrate various sampling techniques for a dataset\n"
    "in which classes are extremely imbalanced with heavily skewed features\n";

std::string formatFixed(double value, int precision) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

template <typename T>
T parseValue(const std::string& flag, const std::string& text) {
    std::istringstream is(text);
    T value{};
    if (!(is >> value) || !is.eof()) {
        throw ConfigurationError("invalid value '" + text + "' for " + flag);
    }
    return value;
}

} // namespace

void printSamplingUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [OPTIONS]\n\n";
    std::cout << "Dataset:\n";
    std::cout << "  --data-path DIR       Directory holding the CSV files (default: data)\n";
    std::cout << "  --file STEM           File stem, reads STEM_processed.csv and STEM_target.csv (default: kddcup)\n\n";
    std::cout << "Experiment:\n";
    std::cout << "  --seed INT            Random state for samplers, folds and classifier (default: 20)\n";
    std::cout << "  --folds INT           Stratified folds (default: 10)\n";
    std::cout << "  --num-rounds INT      Boosting rounds (default: 100)\n";
    std::cout << "  --max-depth INT       Maximum tree depth (default: 3)\n";
    std::cout << "  --eta FLOAT           Learning rate (default: 0.1)\n\n";
    std::cout << "Output:\n";
    std::cout << "  --log-dir DIR         Log and score directory (default: logs)\n";
    std::cout << "  --plot-dir DIR        Gnuplot data and script directory (default: plots)\n";
    std::cout << "  --render              Run gnuplot on every generated script\n";
    std::cout << "  --no-log-file         Keep stdout on the console\n";
    std::cout << "  --help                Show this message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << programName << " --data-path ../data --num-rounds 50\n";
}

void parseSamplingCommandLine(int argc, char** argv, SamplingAppOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.showHelp = true;
            continue;
        }
        if (arg == "--render") { opts.renderImages = true; continue; }
        if (arg == "--no-log-file") { opts.logToFile = false; continue; }

        if (i + 1 >= argc) {
            throw ConfigurationError("missing value for " + arg);
        }
        const std::string value = argv[++i];

        if (arg == "--data-path") opts.dataPath = value;
        else if (arg == "--file") opts.file = value;
        else if (arg == "--seed") opts.seed = parseValue<uint32_t>(arg, value);
        else if (arg == "--folds") opts.folds = parseValue<int>(arg, value);
        else if (arg == "--num-rounds") opts.numRounds = parseValue<int>(arg, value);
        else if (arg == "--max-depth") opts.maxDepth = parseValue<int>(arg, value);
        else if (arg == "--eta") opts.eta = parseValue<double>(arg, value);
        else if (arg == "--log-dir") opts.logDir = value;
        else if (arg == "--plot-dir") opts.plotDir = value;
        else throw ConfigurationError("unknown argument " + arg);
    }
}

void reportScores(const ScoreLedger& ledger,
                  const DataIO& io,
                  const std::string& csvPath,
                  IVisualizationSink& sink) {
    std::cout << "\n=== Score Summary ===" << std::endl;
    std::cout << std::left << std::setw(20) << "Strategy"
              << std::setw(18) << "Label"
              << std::right << std::setw(12) << "Accuracy"
              << std::setw(10) << "Std" << std::endl;

    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> chartLabels;
    std::vector<double> chartValues;

    for (const auto& [key, result] : ledger.all()) {
        std::cout << std::left << std::setw(20) << key.first
                  << std::setw(18) << key.second
                  << std::right << std::setw(11) << formatFixed(result.meanAccuracy * 100.0, 2) << "%"
                  << std::setw(10) << formatFixed(result.stdAccuracy * 100.0, 2) << std::endl;

        rows.push_back({key.first, key.second,
                        formatFixed(result.meanAccuracy, 6),
                        formatFixed(result.stdAccuracy, 6),
                        std::to_string(result.foldScores.size()),
                        std::to_string(result.predictions.size())});
        chartLabels.push_back(key.first + " / " + key.second);
        chartValues.push_back(result.meanAccuracy);
    }

    io.writeCSV(csvPath,
                {"strategy", "label", "mean_accuracy", "std_accuracy", "folds", "rows"},
                rows);
    std::cout << "Scores written to " << csvPath << std::endl;

    sink.barChart(chartLabels, chartValues, "Mean Accuracy by Strategy and Label");
}

void runSamplingApp(const SamplingAppOptions& opts) {
    const std::string timestamp = runTimestamp();
    LogRedirect logRedirect(opts.logDir, "Sampling", timestamp, opts.logToFile);

    std::cout << kBanner << std::endl;

    DataIO io;
    KDDCup1999 dataset(DatasetConfig{opts.dataPath, opts.file});

    std::map<std::string, size_t> attackCategoryCount;
    {
        ScopedTimer timer("\nLoading dataset");
        dataset.load(io);
        dataset.shape();
        dataset.rowCountByTarget("attack_category");
        attackCategoryCount = dataset.attackCategoryCount();
    }

    preprocessing::Preprocessor preprocessor;
    FeatureMatrix X;
    LabelVector fine, coarse;
    {
        ScopedTimer timer("\nEncode and Scale dataset");
        X = preprocessor.encodeAndScale(dataset.full(), dataset.features().headers());
        fine = preprocessing::Preprocessor::encodeLabels(dataset.full(), "attack_category");
        coarse = preprocessing::Preprocessor::encodeLabels(dataset.full(), "target");
    }

    std::vector<int> categorical;
    {
        ScopedTimer timer("\nSetting X");
        categorical = preprocessor.categoricalIndices(X);
        std::cout << "Feature matrix: (" << X.rows() << ", " << X.rowLength() << ")" << std::endl;
        dataset.shape();
        std::cout << "Attack category counts:";
        for (const auto& [category, count] : attackCategoryCount) {
            std::cout << " " << category << "=" << count;
        }
        std::cout << std::endl;
        std::cout << "Imbalance ratio (attack_category): " << formatFixed(imbalanceRatio(fine), 2) << std::endl;
    }

    ScoringConfig scoring;
    scoring.folds = opts.folds;
    scoring.seed = opts.seed;
    scoring.classifier.numRounds = opts.numRounds;
    scoring.classifier.maxDepth = opts.maxDepth;
    scoring.classifier.eta = opts.eta;

    const auto factory = makeXGBoostFactory(scoring);
    const auto strategies = ResamplerFactory::createStandard(opts.seed, categorical);

    GnuplotSink sink(opts.plotDir, opts.renderImages);
    ScoreLedger ledger;
    RunContext context{X, fine, coarse, ledger, scoring, sink};

    {
        ScopedTimer timer("\nScaling");
        runEvaluation(context, strategies, factory);
    }

    std::error_code ec;
    std::filesystem::create_directories(opts.logDir, ec);
    if (ec) {
        throw IOError("cannot create score directory " + opts.logDir + ": " + ec.message());
    }
    const std::string csvPath =
        (std::filesystem::path(opts.logDir) / ("Sampling_" + timestamp + "_scores.csv")).string();
    reportScores(ledger, io, csvPath, sink);

    std::cout << "Finished" << std::endl;
}
