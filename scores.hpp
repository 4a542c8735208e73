#ifndef SCORES_H
#define SCORES_H

#include "noveat.hpp"

namespace Noveat {
// Score kinds, they only exist to keep the stages of both apart
struct Fitness final {};
struct Novelty final {};

template <typename Kind> struct Normalized final {
  double value{0.0};

  bool operator==(const Normalized &other) const {
    return value == other.value;
  }

  template <class Archive> void serialize(Archive &ar) { ar(value); }
};

template <typename Kind> struct Shifted final {
  double value{0.0};

  // a spread below 1.0 would blow up small differences
  Normalized<Kind> normalize(double with) const {
    return {value / std::max(with, 1.0)};
  }

  bool operator==(const Shifted &other) const { return value == other.value; }

  template <class Archive> void serialize(Archive &ar) { ar(value); }
};

template <typename Kind> struct Raw final {
  double value{0.0};

  Shifted<Kind> shift(double baseline) const { return {value - baseline}; }

  bool operator==(const Raw &other) const { return value == other.value; }

  template <class Archive> void serialize(Archive &ar) { ar(value); }
};

template <typename Kind> struct Score final {
  Score() = default;

  Score(double value, double baseline, double with)
      : raw{value}, shifted(raw.shift(baseline)),
        normalized(shifted.normalize(with)) {}

  Raw<Kind> raw;
  Shifted<Kind> shifted;
  Normalized<Kind> normalized;

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(raw, shifted, normalized);
  }
};

using FitnessScore = Score<Fitness>;
using NoveltyScore = Score<Novelty>;

// min/avg/max of every stage over one generation
struct ScoreStatistics final {
  double rawMinimum{0.0};
  double rawAverage{0.0};
  double rawMaximum{0.0};
  double shiftedMinimum{0.0};
  double shiftedAverage{0.0};
  double shiftedMaximum{0.0};
  double normalizedMinimum{0.0};
  double normalizedAverage{0.0};
  double normalizedMaximum{0.0};

  // what every raw value of the generation is shifted by
  double baseline() const { return rawMinimum; }
  // and normalized with
  double with() const { return shiftedMaximum; }

  template <typename Kind>
  static ScoreStatistics of(const std::vector<double> &raws) {
    ScoreStatistics res;
    if (raws.empty())
      return res;

    auto minimum = std::numeric_limits<double>::infinity();
    auto maximum = -std::numeric_limits<double>::infinity();
    double sum = 0.0;
    for (auto raw : raws) {
      if (raw > maximum)
        maximum = raw;
      if (raw < minimum)
        minimum = raw;
      sum += raw;
    }

    Raw<Kind> rawMin{minimum};
    Raw<Kind> rawAvg{sum / double(raws.size())};
    Raw<Kind> rawMax{maximum};

    auto shiftedMin = rawMin.shift(minimum);
    auto shiftedAvg = rawAvg.shift(minimum);
    auto shiftedMax = rawMax.shift(minimum);

    auto with = shiftedMax.value;

    res.rawMinimum = rawMin.value;
    res.rawAverage = rawAvg.value;
    res.rawMaximum = rawMax.value;
    res.shiftedMinimum = shiftedMin.value;
    res.shiftedAverage = shiftedAvg.value;
    res.shiftedMaximum = shiftedMax.value;
    res.normalizedMinimum = shiftedMin.normalize(with).value;
    res.normalizedAverage = shiftedAvg.normalize(with).value;
    res.normalizedMaximum = shiftedMax.normalize(with).value;
    return res;
  }

  template <class Archive> void serialize(Archive &ar) {
    ar(CEREAL_NVP(rawMinimum), CEREAL_NVP(rawAverage), CEREAL_NVP(rawMaximum),
       CEREAL_NVP(shiftedMinimum), CEREAL_NVP(shiftedAverage),
       CEREAL_NVP(shiftedMaximum), CEREAL_NVP(normalizedMinimum),
       CEREAL_NVP(normalizedAverage), CEREAL_NVP(normalizedMaximum));
  }
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::FitnessScore, NOVEAT_VERSION);
CEREAL_CLASS_VERSION(Noveat::NoveltyScore, NOVEAT_VERSION);

#endif /* SCORES_H */
