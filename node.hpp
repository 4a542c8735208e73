#ifndef NODE_H
#define NODE_H

#include "noveat.hpp"

namespace Noveat {
struct Node {
  using Key = Id;

  Node() = default;
  Node(Id id, Activation activation) : id(id), activation(activation) {}

  Key key() const { return id; }

  Id id{0};
  Activation activation{Activation::Linear};

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(id, activation);
  }
};

// Roles never change, a node is created in exactly one of these sets

struct InputNode final : public Node {
  InputNode() = default;
  explicit InputNode(Id id) : Node(id, Activation::Linear) {}
};

struct HiddenNode final : public Node {
  using Node::Node;
};

struct OutputNode final : public Node {
  using Node::Node;
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::InputNode, NOVEAT_VERSION);
CEREAL_CLASS_VERSION(Noveat::HiddenNode, NOVEAT_VERSION);
CEREAL_CLASS_VERSION(Noveat::OutputNode, NOVEAT_VERSION);

#endif /* NODE_H */
