#ifndef STATISTICS_H
#define STATISTICS_H

#include "noveat.hpp"

namespace Noveat {
struct PopulationStatistics final {
  Individual topPerformer;
  ScoreStatistics fitness;
  ScoreStatistics novelty;
  size_t ageMinimum{0};
  double ageAverage{0.0};
  size_t ageMaximum{0};
  size_t archiveSize{0};
  uint64_t millisecondsElapsedReproducing{0};

  template <class Archive> void serialize(Archive &ar) {
    ar(CEREAL_NVP(topPerformer), CEREAL_NVP(fitness), CEREAL_NVP(novelty),
       CEREAL_NVP(ageMinimum), CEREAL_NVP(ageAverage), CEREAL_NVP(ageMaximum),
       CEREAL_NVP(archiveSize), CEREAL_NVP(millisecondsElapsedReproducing));
  }
};

struct Statistics final {
  uint64_t generation{0};
  // seconds since the unix epoch
  uint64_t timeStamp{0};
  uint64_t millisecondsElapsedEvaluation{0};
  PopulationStatistics population;

  template <class Archive> void serialize(Archive &ar) {
    ar(CEREAL_NVP(generation), CEREAL_NVP(timeStamp),
       CEREAL_NVP(millisecondsElapsedEvaluation), CEREAL_NVP(population));
  }
};

inline std::ostream &operator<<(std::ostream &os, const Statistics &stats) {
  os << "generation: " << stats.generation
     << " fitness(max/avg): " << stats.population.fitness.rawMaximum << "/"
     << stats.population.fitness.rawAverage
     << " novelty(max/avg): " << stats.population.novelty.rawMaximum << "/"
     << stats.population.novelty.rawAverage
     << " age(max/avg): " << stats.population.ageMaximum << "/"
     << stats.population.ageAverage
     << " archive: " << stats.population.archiveSize
     << " evaluation: " << stats.millisecondsElapsedEvaluation << "ms"
     << " reproduction: " << stats.population.millisecondsElapsedReproducing
     << "ms";
  return os;
}
} // namespace Noveat

#endif /* STATISTICS_H */
