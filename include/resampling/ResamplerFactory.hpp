#pragma once

#include "resampling/IResampler.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

class ResamplerFactory {
public:
    /**
     * Create a strategy by display name: Original, RandomOverSampler, SMOTE,
     * ADASYN, BorderlineSMOTE-1, BorderlineSMOTE-2, SVMSMOTE, SMOTENC.
     * @throws ConfigurationError for an unknown name
     */
    static std::unique_ptr<IResampler> create(const std::string& name,
                                              uint32_t randomState,
                                              const std::vector<int>& categoricalFeatures);

    // The full battery in evaluation order, identity baseline first
    static std::vector<std::unique_ptr<IResampler>> createStandard(uint32_t randomState,
                                                                   const std::vector<int>& categoricalFeatures);

    static std::vector<std::string> standardNames();
};
