#ifndef CONNECTIONS_H
#define CONNECTIONS_H

#include "noveat.hpp"

namespace Noveat {
struct Connection {
  using Key = ConnectionKey;

  Connection() = default;
  Connection(Id input, double weight, Id output)
      : input(input), weight(weight), output(output) {}

  // weight is payload, not identity
  Key key() const { return {input, output}; }

  void perturb(Random &rng) { weight += rng.adjust(); }

  Id input{0};
  double weight{0.0};
  Id output{0};

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(input, weight, output);
  }
};

// must keep the feed forward subgraph acyclic
struct FeedForwardConnection final : public Connection {
  using Connection::Connection;
};

// carries the value of the previous activation
struct RecurrentConnection final : public Connection {
  using Connection::Connection;
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::FeedForwardConnection, NOVEAT_VERSION);
CEREAL_CLASS_VERSION(Noveat::RecurrentConnection, NOVEAT_VERSION);

#endif /* CONNECTIONS_H */
