#pragma once

#include <cmath>

/**
 * Second-order structure score with L2 (lambda) and L1 (alpha)
 * regularization on leaf weights.
 */
class XGBoostCriterion {
public:
    explicit XGBoostCriterion(double lambda = 1.0, double alpha = 0.0)
        : lambda_(lambda), alpha_(alpha) {}

    // 0.5 * T(G)^2 / (H + lambda), T soft-thresholds G by alpha
    double computeStructureScore(double G, double H) const {
        const double g = thresholdL1(G);
        return 0.5 * (g * g) / (H + lambda_);
    }

    double computeSplitGain(double Gl, double Hl,
                            double Gr, double Hr,
                            double Gp, double Hp,
                            double gamma) const {
        const double gain =
            computeStructureScore(Gl, Hl) +
            computeStructureScore(Gr, Hr) -
            computeStructureScore(Gp, Hp);
        return gain - gamma;
    }

    double computeLeafWeight(double G, double H) const {
        return -thresholdL1(G) / (H + lambda_);
    }

    double getLambda() const { return lambda_; }
    double getAlpha() const { return alpha_; }

private:
    double lambda_;
    double alpha_;

    double thresholdL1(double G) const {
        if (G > alpha_) return G - alpha_;
        if (G < -alpha_) return G + alpha_;
        return 0.0;
    }
};
