#ifndef NOVEAT_H
#define NOVEAT_H

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <iostream>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <random>
#include <stdexcept>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

#define _USE_MATH_DEFINES
#include <cmath>

#include <cereal/archives/binary.hpp>
#include <cereal/archives/json.hpp>
#include <cereal/cereal.hpp>
#include <cereal/types/map.hpp>
#include <cereal/types/optional.hpp>
#include <cereal/types/utility.hpp>
#include <cereal/types/vector.hpp>
#include <easylogging++.h>

#define NOVEAT_VERSION 0x1

namespace Noveat {
using Id = uint64_t;
using ConnectionKey = std::pair<Id, Id>;

class Random {
public:
  Random(uint64_t seed, double perturbationStdDev)
      : _gen(seed), _ndis(0.0, perturbationStdDev) {}

  double nextDouble() { return _udis(_gen); }

  uint32_t nextUInt() { return _uintdis(_gen); }

  // our weight init
  double init() { return nextDouble() * 2.0 - 1.0; }

  // our mutation adjust for weights
  double adjust() { return _ndis(_gen); }

  bool gamble(double chance) { return nextDouble() < chance; }

private:
  std::mt19937_64 _gen;
  std::uniform_int_distribution<uint32_t> _uintdis{};
  std::uniform_real_distribution<> _udis{0.0, 1.0};
  std::normal_distribution<> _ndis;
};

class IdGenerator;
class Genome;
struct Parameters;
struct Individual;
} // namespace Noveat

// Foundation
#include "genes.hpp"
#include "ids.hpp"
#include "squash.hpp"

// Genes
#include "connections.hpp"
#include "node.hpp"

// Evolution, order matters!
#include "parameters.hpp"
#include "scores.hpp"
#include "behavior.hpp"
#include "genome.hpp"
#include "individual.hpp"
#include "progress.hpp"
#include "statistics.hpp"

#endif /* NOVEAT_H */
