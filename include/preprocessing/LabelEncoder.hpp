#pragma once

#include <string>
#include <vector>

namespace preprocessing {

/**
 * Maps string categories to integer codes in sorted category order.
 */
class LabelEncoder {
public:
    void fit(const std::vector<std::string>& values);
    std::vector<int> transform(const std::vector<std::string>& values) const;
    std::vector<int> fitTransform(const std::vector<std::string>& values);

    const std::vector<std::string>& classes() const { return classes_; }

private:
    std::vector<std::string> classes_;
};

} // namespace preprocessing
