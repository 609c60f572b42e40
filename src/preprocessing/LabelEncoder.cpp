#include "preprocessing/LabelEncoder.hpp"
#include "core/Exceptions.hpp"
#include <algorithm>

namespace preprocessing {

void LabelEncoder::fit(const std::vector<std::string>& values) {
    classes_ = values;
    std::sort(classes_.begin(), classes_.end());
    classes_.erase(std::unique(classes_.begin(), classes_.end()), classes_.end());
}

std::vector<int> LabelEncoder::transform(const std::vector<std::string>& values) const {
    std::vector<int> codes;
    codes.reserve(values.size());
    for (const auto& v : values) {
        const auto it = std::lower_bound(classes_.begin(), classes_.end(), v);
        if (it == classes_.end() || *it != v) {
            throw ConfigurationError("unseen label '" + v + "'");
        }
        codes.push_back(static_cast<int>(it - classes_.begin()));
    }
    return codes;
}

std::vector<int> LabelEncoder::fitTransform(const std::vector<std::string>& values) {
    fit(values);
    return transform(values);
}

} // namespace preprocessing
