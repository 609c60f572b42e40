#include "resampling/ResamplerFactory.hpp"
#include "resampling/IdentitySampler.hpp"
#include "resampling/RandomOverSampler.hpp"
#include "resampling/SMOTE.hpp"
#include "resampling/ADASYN.hpp"
#include "resampling/BorderlineSMOTE.hpp"
#include "resampling/SVMSMOTE.hpp"
#include "resampling/SMOTENC.hpp"
#include "core/Exceptions.hpp"

std::vector<std::string> ResamplerFactory::standardNames() {
    return {"Original", "RandomOverSampler", "SMOTE", "ADASYN",
            "BorderlineSMOTE-1", "BorderlineSMOTE-2", "SVMSMOTE", "SMOTENC"};
}

std::unique_ptr<IResampler> ResamplerFactory::create(const std::string& name,
                                                     uint32_t randomState,
                                                     const std::vector<int>& categoricalFeatures) {
    if (name == "Original") {
        return std::make_unique<IdentitySampler>();
    }
    else if (name == "RandomOverSampler") {
        return std::make_unique<RandomOverSampler>(randomState);
    }
    else if (name == "SMOTE") {
        // SMOTE keeps its own fixed seed of 0
        return std::make_unique<SMOTE>(0);
    }
    else if (name == "ADASYN") {
        return std::make_unique<ADASYN>(randomState);
    }
    else if (name == "BorderlineSMOTE-1") {
        return std::make_unique<BorderlineSMOTE>(randomState, BorderlineSMOTE::Kind::Borderline1);
    }
    else if (name == "BorderlineSMOTE-2") {
        return std::make_unique<BorderlineSMOTE>(randomState, BorderlineSMOTE::Kind::Borderline2);
    }
    else if (name == "SVMSMOTE") {
        return std::make_unique<SVMSMOTE>(randomState);
    }
    else if (name == "SMOTENC") {
        return std::make_unique<SMOTENC>(categoricalFeatures, randomState);
    }
    throw ConfigurationError("Unsupported resampling strategy: " + name);
}

std::vector<std::unique_ptr<IResampler>> ResamplerFactory::createStandard(uint32_t randomState,
                                                                          const std::vector<int>& categoricalFeatures) {
    std::vector<std::unique_ptr<IResampler>> strategies;
    for (const auto& name : standardNames()) {
        strategies.push_back(create(name, randomState, categoricalFeatures));
    }
    return strategies;
}
