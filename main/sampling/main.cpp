#include "app/SamplingApp.hpp"
#include <iostream>

int main(int argc, char** argv) {
    SamplingAppOptions opts;

    try {
        parseSamplingCommandLine(argc, argv, opts);
        if (opts.showHelp) {
            printSamplingUsage(argv[0]);
            return 0;
        }
        runSamplingApp(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
