#ifndef NETWORK_H
#define NETWORK_H

#include "noveat.hpp"

namespace Noveat {
// A recurrent source seen through its wrapper pair, the wrapper output
// records the source value and the wrapper input replays it one step later.
struct Memory final {
  Id source;
  Id input;
  Id output;
};

struct Unrolled final {
  Genome genome;
  std::vector<Memory> memories;
};

inline Unrolled unrollWithMemory(const Genome &genome) {
  Unrolled res;
  auto &unrolled = res.genome;
  unrolled.inputs() = genome.inputs();
  unrolled.hidden() = genome.hidden();
  unrolled.outputs() = genome.outputs();
  unrolled.feedForward() = genome.feedForward();

  // temporary ids, far away from anything an IdGenerator hands out
  auto next = std::numeric_limits<Id>::max();

  std::map<Id, Memory> memories;
  for (auto &connection : genome.recurrent()) {
    auto it = memories.find(connection.input);
    if (it == memories.end()) {
      Memory memory{connection.input, next--, next--};
      if (!unrolled.inputs().insert(InputNode(memory.input)) ||
          !unrolled.outputs().insert(
              OutputNode(memory.output, Activation::Linear)) ||
          !unrolled.feedForward().insert(
              FeedForwardConnection(memory.source, 1.0, memory.output)))
        throw std::runtime_error("Unrolling collides with existing genes.");
      it = memories.emplace(connection.input, memory).first;
    }

    if (!unrolled.feedForward().insert(FeedForwardConnection(
            it->second.input, connection.weight, connection.output)))
      throw std::runtime_error("Unrolling collides with existing genes.");
  }

  for (auto &[_, memory] : memories) {
    res.memories.push_back(memory);
  }

  return res;
}

// Same genome with every recurrent connection replaced by feed forward ones
inline Genome unroll(const Genome &genome) {
  return unrollWithMemory(genome).genome;
}

class Network final {
public:
  explicit Network(const Genome &genome) {
    auto unrolled = unrollWithMemory(genome);
    auto nodes = unrolled.genome.nodes();

    std::unordered_map<Id, size_t> indices;
    for (size_t i = 0; i < nodes.size(); i++) {
      indices.emplace(nodes[i].id, i);
    }

    auto indexOf = [&](Id id) {
      auto it = indices.find(id);
      if (it == indices.end())
        throw std::runtime_error("Connection refers to a node missing from "
                                 "the genome.");
      return it->second;
    };

    std::vector<std::vector<std::pair<size_t, double>>> inbound(nodes.size());
    std::vector<std::vector<size_t>> outbound(nodes.size());
    std::vector<size_t> pending(nodes.size(), 0);
    for (auto &connection : unrolled.genome.feedForward()) {
      auto from = indexOf(connection.input);
      auto to = indexOf(connection.output);
      inbound[to].emplace_back(from, connection.weight);
      outbound[from].push_back(to);
      pending[to]++;
    }

    // Kahn, nodes() order breaks ties
    std::deque<size_t> ready;
    for (size_t i = 0; i < nodes.size(); i++) {
      if (pending[i] == 0)
        ready.push_back(i);
    }

    std::vector<size_t> sorted;
    sorted.reserve(nodes.size());
    while (!ready.empty()) {
      auto idx = ready.front();
      ready.pop_front();
      sorted.push_back(idx);
      for (auto to : outbound[idx]) {
        if (--pending[to] == 0)
          ready.push_back(to);
      }
    }

    if (sorted.size() != nodes.size())
      throw std::runtime_error("Feed forward connections contain a cycle.");

    std::vector<size_t> positions(nodes.size());
    for (size_t i = 0; i < sorted.size(); i++) {
      positions[sorted[i]] = i;
    }

    _units.reserve(nodes.size());
    for (auto idx : sorted) {
      Unit unit;
      unit.activation = nodes[idx].activation;
      for (auto &[from, weight] : inbound[idx]) {
        unit.inbound.emplace_back(positions[from], weight);
      }
      _units.emplace_back(std::move(unit));
    }

    for (auto &node : genome.inputs()) {
      _inputs.push_back(positions[indices[node.id]]);
      _units[_inputs.back()].isInput = true;
    }
    for (auto &node : genome.outputs()) {
      _outputs.push_back(positions[indices[node.id]]);
    }
    for (auto &memory : unrolled.memories) {
      _memories.emplace_back(positions[indices[memory.input]],
                             positions[indices[memory.output]]);
      _units[_memories.back().first].isInput = true;
    }
    _memory.resize(_memories.size(), 0.0);
  }

  const std::vector<double> &activate(const std::vector<double> &input) {
    _outputCache.clear();

    auto isize = input.size();

    if (isize != _inputs.size())
      throw std::runtime_error(
          "Invalid activation input size, differs from actual "
          "network input size.");

    for (size_t i = 0; i < isize; i++) {
      _units[_inputs[i]].value = input[i];
    }
    for (size_t i = 0; i < _memories.size(); i++) {
      _units[_memories[i].first].value = _memory[i];
    }

    for (auto &unit : _units) {
      if (unit.isInput)
        continue;

      double sum = 0.0;
      for (auto &[from, weight] : unit.inbound) {
        sum += _units[from].value * weight;
      }
      unit.value = Squash::apply(unit.activation, sum);
    }

    for (size_t i = 0; i < _memories.size(); i++) {
      _memory[i] = _units[_memories[i].second].value;
    }

    for (auto idx : _outputs) {
      _outputCache.push_back(_units[idx].value);
    }

    return _outputCache;
  }

  // forget recurrent state
  void clear() {
    std::fill(_memory.begin(), _memory.end(), 0.0);
    for (auto &unit : _units) {
      unit.value = 0.0;
    }
  }

  size_t inputSize() const { return _inputs.size(); }

  size_t outputSize() const { return _outputs.size(); }

private:
  struct Unit {
    Activation activation{Activation::Linear};
    bool isInput{false};
    double value{0.0};
    std::vector<std::pair<size_t, double>> inbound;
  };

  // topologically sorted
  std::vector<Unit> _units;
  std::vector<size_t> _inputs;
  std::vector<size_t> _outputs;
  // wrapper input, wrapper output
  std::vector<std::pair<size_t, size_t>> _memories;
  std::vector<double> _memory;
  std::vector<double> _outputCache;
};
} // namespace Noveat

#endif /* NETWORK_H */
