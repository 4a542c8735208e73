#ifndef PROGRESS_H
#define PROGRESS_H

#include "noveat.hpp"

namespace Noveat {
// What an evaluator learned about one individual
class Progress final {
public:
  struct Empty {};

  struct Novelty {
    Behavior behavior;
  };

  struct Status {
    Raw<Fitness> fitness;
    Behavior behavior;
  };

  struct Solution {
    std::optional<Raw<Fitness>> fitness;
    std::optional<Behavior> behavior;
    std::shared_ptr<const Individual> individual;
  };

  using Value = std::variant<Empty, Novelty, Status, Solution>;

  Progress() = default;
  Progress(Value value) : _value(std::move(value)) {}

  static Progress empty() { return Progress(Empty{}); }

  static Progress novelty(std::vector<double> behavior) {
    return Progress(Novelty{Behavior{std::move(behavior)}});
  }

  static Progress status(double fitness, std::vector<double> behavior) {
    return Progress(Status{{fitness}, Behavior{std::move(behavior)}});
  }

  // keeps whatever was learned so far
  Progress solved(Individual solution) const {
    auto individual = std::make_shared<const Individual>(std::move(solution));
    return Progress(Solution{rawFitness(),
                             behavior() ? std::optional<Behavior>(*behavior())
                                        : std::nullopt,
                             individual});
  }

  std::optional<Raw<Fitness>> rawFitness() const {
    return std::visit(
        [](auto &&value) -> std::optional<Raw<Fitness>> {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, Status>)
            return value.fitness;
          else if constexpr (std::is_same_v<T, Solution>)
            return value.fitness;
          else
            return std::nullopt;
        },
        _value);
  }

  const Behavior *behavior() const {
    return std::visit(
        [](auto &&value) -> const Behavior * {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, Novelty> ||
                        std::is_same_v<T, Status>)
            return &value.behavior;
          else if constexpr (std::is_same_v<T, Solution>)
            return value.behavior ? &*value.behavior : nullptr;
          else
            return nullptr;
        },
        _value);
  }

  const Individual *solution() const {
    if (auto solution = std::get_if<Solution>(&_value))
      return solution->individual.get();
    return nullptr;
  }

  const Value &value() const { return _value; }

private:
  Value _value{Empty{}};
};
} // namespace Noveat

#endif /* PROGRESS_H */
