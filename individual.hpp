#ifndef INDIVIDUAL_H
#define INDIVIDUAL_H

#include "noveat.hpp"

namespace Noveat {
struct Individual final {
  Genome genome;
  // generations survived
  size_t age{0};
  std::optional<Behavior> behavior;
  std::optional<FitnessScore> fitness;
  std::optional<NoveltyScore> novelty;

  static Individual initial(IdGenerator &idGen, Random &rng,
                            const Parameters &parameters) {
    Individual res;
    res.genome = Genome(idGen, rng, parameters);
    return res;
  }

  // combination of fitness and novelty
  double score() const {
    auto f = fitness ? fitness->normalized.value : 0.0;
    auto n = novelty ? novelty->normalized.value : 0.0;

    if (f == 0.0 && n == 0.0)
      return 0.0;

    auto [min, max] = std::minmax(f, n);

    // how dominant the stronger signal is, weight by it
    auto ratio = min / max / 2.0;

    return min * ratio + max * (1.0 - ratio);
  }

  // higher score, or the same score carried by fewer genes
  bool isFitterThan(const Individual &other) const {
    auto scoreSelf = score();
    auto scoreOther = other.score();

    return scoreSelf > scoreOther ||
           (std::fabs(scoreSelf - scoreOther) <
                std::numeric_limits<double>::epsilon() &&
            genome.size() < other.genome.size());
  }

  Individual crossover(const Individual &other, Random &rng) const {
    auto &fitter = isFitterThan(other) ? *this : other;
    auto &weaker = &fitter == this ? other : *this;

    Individual res;
    res.genome = fitter.genome.crossIn(weaker.genome, rng);
    return res;
  }

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(genome, age, behavior, fitness, novelty);
  }
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::Individual, NOVEAT_VERSION);

#endif /* INDIVIDUAL_H */
