#ifndef SQUASH_H
#define SQUASH_H

#include "noveat.hpp"

namespace Noveat {
// Stable tags, they end up in archives
enum class Activation : uint8_t {
  Linear,
  Sigmoid,
  Tanh,
  Gaussian,
  Step,
  Sine,
  Cosine,
  Inverse,
  Absolute,
  Relu,
  Squared,
};

struct LinearS final {
  double operator()(double input) const { return input; }
};

struct SigmoidS final {
  double operator()(double input) const {
    return 1.0 / (1.0 + std::exp(-input));
  }
};

struct TanhS final {
  double operator()(double input) const { return std::tanh(input); }
};

struct GaussianS final {
  double operator()(double input) const {
    return std::exp(-std::pow(input, 2.0));
  }
};

struct StepS final {
  double operator()(double input) const { return input > 0.0 ? 1.0 : 0.0; }
};

struct SineS final {
  double operator()(double input) const { return std::sin(input); }
};

struct CosineS final {
  double operator()(double input) const { return std::cos(input); }
};

struct InverseS final {
  double operator()(double input) const { return -input; }
};

struct AbsoluteS final {
  double operator()(double input) const { return std::fabs(input); }
};

struct ReluS final {
  double operator()(double input) const { return input > 0.0 ? input : 0.0; }
};

struct SquaredS final {
  double operator()(double input) const { return input * input; }
};

using SquashFunc =
    std::variant<LinearS, SigmoidS, TanhS, GaussianS, StepS, SineS, CosineS,
                 InverseS, AbsoluteS, ReluS, SquaredS>;

struct Squash final {
  // indexed by Activation
  const static inline std::array<SquashFunc, 11> funcs{
      LinearS(),  SigmoidS(), TanhS(),     GaussianS(), StepS(),    SineS(),
      CosineS(),  InverseS(), AbsoluteS(), ReluS(),     SquaredS()};

  static const SquashFunc &of(Activation activation) {
    auto idx = static_cast<size_t>(activation);
    if (idx >= funcs.size())
      throw std::runtime_error("Unknown activation tag.");
    return funcs[idx];
  }

  static double apply(Activation activation, double input) {
    return std::visit([input](auto &&f) { return f(input); }, of(activation));
  }

  static Activation random(const std::vector<Activation> &candidates,
                           Random &rng) {
    if (candidates.empty())
      throw std::runtime_error("Cannot pick an activation from an empty "
                               "candidate set.");
    return candidates[rng.nextUInt() % candidates.size()];
  }
};
} // namespace Noveat

#endif /* SQUASH_H */
