#ifndef POPULATION_H
#define POPULATION_H

#include "noveat.hpp"

namespace Noveat {
// Splits `needed` offspring among survivors proportionally to their score
// shifted into [0, 1]. Scores are expected best first, rounding leftovers are
// given to the best and taken from the worst survivors so the sum is exact.
inline std::vector<size_t> allotOffspring(const std::vector<double> &scores,
                                          size_t needed) {
  std::vector<size_t> allotments(scores.size(), 0);
  if (scores.empty() || needed == 0)
    return allotments;

  auto [minIt, maxIt] = std::minmax_element(scores.begin(), scores.end());
  auto minimum = *minIt;
  auto spread = *maxIt - minimum;

  std::vector<double> shares(scores.size());
  double total = 0.0;
  for (size_t i = 0; i < scores.size(); i++) {
    // everyone is equal, split evenly
    shares[i] = spread > 0.0 ? (scores[i] - minimum) / spread : 1.0;
    total += shares[i];
  }

  size_t assigned = 0;
  for (size_t i = 0; i < scores.size(); i++) {
    allotments[i] = size_t(std::round(double(needed) * shares[i] / total));
    assigned += allotments[i];
  }

  for (size_t i = 0; assigned < needed; i = (i + 1) % allotments.size()) {
    allotments[i]++;
    assigned++;
  }

  auto i = allotments.size();
  while (assigned > needed) {
    i = (i == 0 ? allotments.size() : i) - 1;
    if (allotments[i] > 0) {
      allotments[i]--;
      assigned--;
    }
  }

  return allotments;
}

class Population final {
public:
  explicit Population(const Parameters &parameters)
      : _rng(validated(parameters).setup.seed,
             parameters.mutation.weightPerturbationStdDev) {
    // every individual shares the input and output ids
    auto initial = Individual::initial(_idGen, _rng, parameters);

    _individuals.reserve(parameters.setup.populationSize);
    for (size_t i = 0; i < parameters.setup.populationSize; i++) {
      auto individual = initial;
      individual.genome.init(_rng);
      individual.genome.mutate(_rng, _idGen, parameters);
      _individuals.emplace_back(std::move(individual));
    }

    LOG(DEBUG) << "Population of " << _individuals.size()
               << " individuals created, seed: " << parameters.setup.seed;
  }

  // progress must be index aligned with individuals()
  PopulationStatistics nextGeneration(const Parameters &parameters,
                                      const std::vector<Progress> &progress) {
    if (progress.size() != _individuals.size())
      throw std::runtime_error("Progress count differs from population size.");

    assignFitness(progress);
    assignBehavior(progress);
    calculateNovelty(parameters);

    sortByScore();

    // remove any individual that does not survive
    auto survivors = size_t(std::ceil(double(parameters.setup.populationSize) *
                                      parameters.setup.survivalRate));
    survivors = std::clamp<size_t>(survivors, 1, _individuals.size());
    _individuals.erase(_individuals.begin() + survivors, _individuals.end());

    for (auto &individual : _individuals) {
      individual.age++;
    }

    generateOffspring(parameters);

    return gatherStatistics();
  }

  const std::vector<Individual> &individuals() const { return _individuals; }

  const std::vector<Individual> &archive() const { return _archive; }

  const IdGenerator &idGenerator() const { return _idGen; }

private:
  static const Parameters &validated(const Parameters &parameters) {
    parameters.validate();
    return parameters;
  }

  void assignFitness(const std::vector<Progress> &progress) {
    std::vector<size_t> indices;
    std::vector<double> raws;
    for (size_t i = 0; i < progress.size(); i++) {
      if (auto raw = progress[i].rawFitness()) {
        indices.push_back(i);
        raws.push_back(raw->value);
      }
    }

    auto stats = ScoreStatistics::of<Fitness>(raws);
    _statistics.fitness = stats;

    for (size_t i = 0; i < indices.size(); i++) {
      _individuals[indices[i]].fitness =
          FitnessScore(raws[i], stats.baseline(), stats.with());
    }
  }

  void assignBehavior(const std::vector<Progress> &progress) {
    for (size_t i = 0; i < progress.size(); i++) {
      if (auto behavior = progress[i].behavior())
        _individuals[i].behavior = *behavior;
    }
  }

  void calculateNovelty(const Parameters &parameters) {
    Behaviors behaviors;
    std::vector<size_t> owners;
    for (size_t i = 0; i < _individuals.size(); i++) {
      auto &individual = _individuals[i];
      if (individual.behavior) {
        behaviors.emplace_back(*individual.behavior);
        owners.push_back(i);
      } else {
        individual.novelty.reset();
      }
    }

    if (owners.empty()) {
      _statistics.novelty = ScoreStatistics();
      return;
    }

    // the archive only serves as extra comparison points
    for (auto &archived : _archive) {
      if (archived.behavior)
        behaviors.emplace_back(*archived.behavior);
    }

    auto novelties = computeNovelty(behaviors, owners.size(),
                                    parameters.novelty.nearestNeighbors);

    auto stats = ScoreStatistics::of<Novelty>(novelties);
    for (size_t i = 0; i < owners.size(); i++) {
      _individuals[owners[i]].novelty =
          NoveltyScore(novelties[i], stats.baseline(), stats.with());
    }

    auto mostNovel = std::distance(
        novelties.begin(), std::max_element(novelties.begin(), novelties.end()));
    _archive.push_back(_individuals[owners[mostNovel]]);

    _statistics.novelty = stats;
  }

  void sortByScore() {
    for (auto &individual : _individuals) {
      if (std::isnan(individual.score()))
        throw std::runtime_error("Failed to compare scores, an individual has "
                                 "a NaN score.");
    }

    // highest score first
    std::stable_sort(_individuals.begin(), _individuals.end(),
                     [](const Individual &a, const Individual &b) {
                       return a.score() > b.score();
                     });
  }

  void generateOffspring(const Parameters &parameters) {
    auto start = std::chrono::steady_clock::now();

    auto survivors = _individuals.size();
    auto needed = parameters.setup.populationSize > survivors
                      ? parameters.setup.populationSize - survivors
                      : 0;

    std::vector<double> scores;
    scores.reserve(survivors);
    for (auto &individual : _individuals) {
      scores.push_back(individual.score());
    }

    auto allotments = allotOffspring(scores, needed);

    std::vector<Individual> offspring;
    offspring.reserve(needed);
    for (size_t i = 0; i < survivors; i++) {
      for (size_t n = 0; n < allotments[i]; n++) {
        auto &partner = _individuals[_rng.nextUInt() % survivors];
        auto child = _individuals[i].crossover(partner, _rng);
        child.genome.mutate(_rng, _idGen, parameters);
        offspring.emplace_back(std::move(child));
      }
    }

    LOG(DEBUG) << "Reproduced " << offspring.size() << " offspring from "
               << survivors << " survivors";

    _individuals.insert(_individuals.end(),
                        std::make_move_iterator(offspring.begin()),
                        std::make_move_iterator(offspring.end()));

    _statistics.millisecondsElapsedReproducing =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start)
            .count();
  }

  const Individual &topFitnessPerformer() const {
    if (_individuals.empty())
      throw std::runtime_error("Population is empty, no top performer.");

    auto fitnessOf = [](const Individual &individual) {
      return individual.fitness
                 ? individual.fitness->normalized.value
                 : -std::numeric_limits<double>::infinity();
    };

    return *std::max_element(_individuals.begin(), _individuals.end(),
                             [&](const Individual &a, const Individual &b) {
                               return fitnessOf(a) < fitnessOf(b);
                             });
  }

  PopulationStatistics gatherStatistics() {
    _statistics.topPerformer = topFitnessPerformer();

    size_t ageSum = 0;
    _statistics.ageMinimum = std::numeric_limits<size_t>::max();
    _statistics.ageMaximum = 0;
    for (auto &individual : _individuals) {
      _statistics.ageMinimum = std::min(_statistics.ageMinimum, individual.age);
      _statistics.ageMaximum = std::max(_statistics.ageMaximum, individual.age);
      ageSum += individual.age;
    }
    _statistics.ageAverage = double(ageSum) / double(_individuals.size());
    _statistics.archiveSize = _archive.size();

    return _statistics;
  }

  Random _rng;
  IdGenerator _idGen;
  std::vector<Individual> _individuals;
  // ever growing, only kept for their behaviors
  std::vector<Individual> _archive;
  PopulationStatistics _statistics;
};
} // namespace Noveat

#endif /* POPULATION_H */
