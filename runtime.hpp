#ifndef RUNTIME_H
#define RUNTIME_H

#include "population.hpp"

namespace Noveat {
using Evaluator = std::function<Progress(const Individual &)>;

// Either the individual that solved the problem or how the generation went
using Evaluation = std::variant<Statistics, Individual>;

class Runtime final {
public:
  Runtime(Parameters parameters, Evaluator evaluator)
      : _parameters(std::move(parameters)), _evaluator(std::move(evaluator)),
        _population(_parameters) {
    if (!_evaluator)
      throw std::runtime_error("Runtime requires an evaluator.");
  }

  Evaluation next() {
    auto start = std::chrono::steady_clock::now();

    auto &individuals = _population.individuals();
    std::vector<Progress> progress;
    progress.reserve(individuals.size());
    for (auto &individual : individuals) {
      progress.emplace_back(_evaluator(individual));
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - start)
                       .count();

    _generation++;

    for (auto &p : progress) {
      if (auto solution = p.solution()) {
        LOG(INFO) << "Solution found in generation " << _generation;
        return *solution;
      }
    }

    Statistics stats;
    stats.generation = _generation;
    stats.timeStamp = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    stats.millisecondsElapsedEvaluation = elapsed;
    stats.population = _population.nextGeneration(_parameters, progress);

    LOG(INFO) << stats;

    return stats;
  }

  uint64_t generation() const { return _generation; }

  const Parameters &parameters() const { return _parameters; }

  const Population &population() const { return _population; }

private:
  Parameters _parameters;
  Evaluator _evaluator;
  Population _population;
  uint64_t _generation{0};
};
} // namespace Noveat

#endif /* RUNTIME_H */
