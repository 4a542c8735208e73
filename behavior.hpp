#ifndef BEHAVIOR_H
#define BEHAVIOR_H

#include "noveat.hpp"

namespace Noveat {
struct Behavior final {
  std::vector<double> values;

  double distance(const Behavior &other) const {
    if (values.size() != other.values.size())
      throw std::runtime_error("Attempted to compare behaviors of different "
                               "dimensions.");

    double sum = 0.0;
    for (size_t i = 0; i < values.size(); i++) {
      sum += std::pow(values[i] - other.values[i], 2);
    }
    return std::sqrt(sum);
  }

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(values);
  }
};

using Behaviors = std::vector<std::reference_wrapper<const Behavior>>;

// Mean distance of each of the first `scored` behaviors to its k nearest
// neighbors among all the others. Fewer neighbors are used when fewer exist,
// none yields 0.
inline std::vector<double> computeNovelty(const Behaviors &behaviors,
                                          size_t scored,
                                          size_t nearestNeighbors) {
  auto count = behaviors.size();
  scored = std::min(scored, count);
  std::vector<double> res(scored, 0.0);
  std::vector<double> distances;
  distances.reserve(count);

  for (size_t i = 0; i < scored; i++) {
    distances.clear();
    for (size_t j = 0; j < count; j++) {
      if (i == j)
        continue;
      distances.push_back(behaviors[i].get().distance(behaviors[j].get()));
    }

    auto k = std::min(nearestNeighbors, distances.size());
    if (k == 0)
      continue;

    std::partial_sort(distances.begin(), distances.begin() + k,
                      distances.end());

    double sum = 0.0;
    for (size_t n = 0; n < k; n++) {
      sum += distances[n];
    }
    res[i] = sum / double(k);
  }

  return res;
}

inline std::vector<double> computeNovelty(const Behaviors &behaviors,
                                          size_t nearestNeighbors) {
  return computeNovelty(behaviors, behaviors.size(), nearestNeighbors);
}
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::Behavior, NOVEAT_VERSION);

#endif /* BEHAVIOR_H */
