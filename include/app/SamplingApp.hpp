#pragma once

#include "evaluation/ScoreLedger.hpp"
#include "functions/io/DataIO.hpp"
#include "visualization/IVisualizationSink.hpp"
#include <cstdint>
#include <string>

struct SamplingAppOptions {
    // Dataset
    std::string dataPath = "data";
    std::string file = "kddcup";

    // Experiment
    uint32_t seed = 20;
    int folds = 10;
    int numRounds = 100;
    int maxDepth = 3;
    double eta = 0.1;

    // Output
    std::string logDir = "logs";
    std::string plotDir = "plots";
    bool renderImages = false;
    bool logToFile = true;

    bool showHelp = false;
};

void runSamplingApp(const SamplingAppOptions& options);

/**
 * Parses --flag value pairs over the defaults in opts
 * @throws ConfigurationError for unknown flags, missing or malformed values
 */
void parseSamplingCommandLine(int argc, char** argv, SamplingAppOptions& opts);

void printSamplingUsage(const char* programName);

// Prints the ledger as a table, writes it to csvPath and charts the mean accuracies
void reportScores(const ScoreLedger& ledger,
                  const DataIO& io,
                  const std::string& csvPath,
                  IVisualizationSink& sink);
