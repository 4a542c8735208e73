#ifndef GENOME_H
#define GENOME_H

#include "noveat.hpp"

namespace Noveat {
class Genome final {
public:
  Genome() = default;

  // inputs and outputs only, see init()
  Genome(IdGenerator &idGen, Random &rng, const Parameters &parameters) {
    for (size_t i = 0; i < parameters.setup.inputDimension; i++) {
      _inputs.insert(InputNode(idGen.nextId()));
    }
    for (size_t i = 0; i < parameters.setup.outputDimension; i++) {
      _outputs.insert(OutputNode(
          idGen.nextId(),
          Squash::random(parameters.activations.outputNodes, rng)));
    }
  }

  // connect a random share of the inputs, at least one, to every output
  void init(Random &rng) {
    if (_inputs.empty() || _outputs.empty())
      return;

    auto count = size_t(std::ceil(rng.nextDouble() * double(_inputs.size())));
    count = std::clamp<size_t>(count, 1, _inputs.size());

    for (auto &input : _inputs.iterateWithRandomOffset(rng)) {
      if (count == 0)
        break;
      count--;

      for (auto &output : _outputs) {
        if (!_feedForward.insert(
                FeedForwardConnection(input.id, rng.init(), output.id)))
          throw std::runtime_error("Initial connection is already present, "
                                   "genome was initialized twice.");
      }
    }
  }

  void mutate(Random &rng, IdGenerator &idGen, const Parameters &parameters) {
    changeWeights(rng);

    if (rng.gamble(parameters.mutation.newConnectionChance)) {
      if (!addConnection(rng, parameters))
        LOG(TRACE) << "No connection possible";
    }

    if (rng.gamble(parameters.mutation.newNodeChance)) {
      if (!addNode(rng, idGen, parameters))
        LOG(TRACE) << "No connection to split";
    }

    if (rng.gamble(parameters.mutation.changeActivationChance)) {
      alterActivation(rng, parameters);
    }
  }

  void changeWeights(Random &rng) {
    perturbWeights(_feedForward, rng);
    perturbWeights(_recurrent, rng);
  }

  // Returns false when no connection is possible, e.g. the feed forward graph
  // is already complete.
  bool addConnection(Random &rng, const Parameters &parameters) {
    auto isRecurrent =
        rng.gamble(parameters.mutation.connectionIsRecurrentChance);

    std::vector<Id> starts;
    starts.reserve(_inputs.size() + _hidden.size());
    for (auto &node : _inputs)
      starts.push_back(node.id);
    for (auto &node : _hidden)
      starts.push_back(node.id);

    std::vector<Id> ends;
    ends.reserve(_hidden.size() + _outputs.size());
    for (auto &node : _hidden)
      ends.push_back(node.id);
    for (auto &node : _outputs)
      ends.push_back(node.id);

    if (starts.empty())
      return false;

    auto offset = rng.nextUInt() % starts.size();
    for (size_t i = 0; i < starts.size(); i++) {
      auto start = starts[(offset + i) % starts.size()];
      for (auto end : ends) {
        if (end == start || areConnected(start, end, isRecurrent))
          continue;

        if (isRecurrent) {
          if (!_recurrent.insert(
                  RecurrentConnection(start, rng.adjust(), end)))
            throw std::runtime_error("Recurrent connection already present.");
          return true;
        }

        if (wouldFormCycle(start, end))
          continue;

        if (!_feedForward.insert(
                FeedForwardConnection(start, rng.adjust(), end)))
          throw std::runtime_error("Feed forward connection already present.");
        return true;
      }
    }

    return false;
  }

  // Splits a random feed forward connection a -> b into a -> n -> b.
  // The split connection stays with a zero weight so lineages keep matching.
  bool addNode(Random &rng, IdGenerator &idGen, const Parameters &parameters) {
    auto picked = _feedForward.random(rng);
    if (!picked)
      return false;

    auto split = *picked;

    // the cache might hand out an id we already used for another split
    Id id = 0;
    for (size_t index = 0;; index++) {
      id = idGen.cachedId(split.key(), index);
      if (!_hidden.contains(id))
        break;
    }

    HiddenNode node(id,
                    Squash::random(parameters.activations.hiddenNodes, rng));

    if (!_feedForward.insert(FeedForwardConnection(split.input, 1.0, id)) ||
        !_feedForward.insert(
            FeedForwardConnection(id, split.weight, split.output)) ||
        !_hidden.insert(node))
      throw std::runtime_error("Split connection collides with existing "
                               "genes.");

    split.weight = 0.0;
    _feedForward.replace(split);
    return true;
  }

  void alterActivation(Random &rng, const Parameters &parameters) {
    auto picked = _hidden.random(rng);
    if (!picked)
      return;

    auto node = *picked;

    std::vector<Activation> candidates;
    std::copy_if(parameters.activations.hiddenNodes.begin(),
                 parameters.activations.hiddenNodes.end(),
                 std::back_inserter(candidates),
                 [&](auto activation) { return activation != node.activation; });

    if (candidates.empty())
      return;

    node.activation = candidates[rng.nextUInt() % candidates.size()];
    _hidden.replace(node);
  }

  // Can only operate on an acyclic feed forward graph, which is assumed.
  // True if `start` is reachable from `end`.
  bool wouldFormCycle(Id start, Id end) const {
    if (start == end)
      return true;

    std::deque<Id> queue{end};
    std::unordered_set<Id> visited{end};
    while (!queue.empty()) {
      auto node = queue.front();
      queue.pop_front();

      // connections are ordered by (input, output)
      for (auto it = _feedForward.lowerBound({node, 0});
           it != _feedForward.end() && it->input == node; ++it) {
        if (it->output == start)
          return true;
        if (visited.insert(it->output).second)
          queue.push_back(it->output);
      }
    }

    return false;
  }

  bool areConnected(Id start, Id end, bool recurrent) const {
    if (recurrent)
      return _recurrent.contains(ConnectionKey{start, end});
    return _feedForward.contains(ConnectionKey{start, end});
  }

  // `this` is the fitter parent
  Genome crossIn(const Genome &other, Random &rng) const {
    Genome res;
    res._feedForward = _feedForward.crossIn(other._feedForward, rng);
    res._recurrent = _recurrent.crossIn(other._recurrent, rng);
    res._hidden = _hidden.crossIn(other._hidden, rng);
    // identical across the population anyway
    res._inputs = _inputs;
    res._outputs = _outputs;
    return res;
  }

  std::vector<Node> nodes() const {
    std::vector<Node> res;
    res.reserve(_inputs.size() + _hidden.size() + _outputs.size());
    res.insert(res.end(), _inputs.begin(), _inputs.end());
    res.insert(res.end(), _hidden.begin(), _hidden.end());
    res.insert(res.end(), _outputs.begin(), _outputs.end());
    return res;
  }

  // amount of connection genes
  size_t size() const { return _feedForward.size() + _recurrent.size(); }

  bool empty() const { return _feedForward.empty() && _recurrent.empty(); }

  const Genes<InputNode> &inputs() const { return _inputs; }
  const Genes<HiddenNode> &hidden() const { return _hidden; }
  const Genes<OutputNode> &outputs() const { return _outputs; }
  const Genes<FeedForwardConnection> &feedForward() const {
    return _feedForward;
  }
  const Genes<RecurrentConnection> &recurrent() const { return _recurrent; }

  Genes<InputNode> &inputs() { return _inputs; }
  Genes<HiddenNode> &hidden() { return _hidden; }
  Genes<OutputNode> &outputs() { return _outputs; }
  Genes<FeedForwardConnection> &feedForward() { return _feedForward; }
  Genes<RecurrentConnection> &recurrent() { return _recurrent; }

  template <class Archive>
  void serialize(Archive &ar, std::uint32_t const version) {
    ar(_inputs, _hidden, _outputs, _feedForward, _recurrent);
  }

private:
  template <typename T> static void perturbWeights(Genes<T> &genes, Random &rng) {
    for (auto connection : genes.iterateWithRandomOffset(rng)) {
      connection.perturb(rng);
      genes.replace(connection);
    }
  }

  Genes<InputNode> _inputs;
  Genes<HiddenNode> _hidden;
  Genes<OutputNode> _outputs;
  Genes<FeedForwardConnection> _feedForward;
  Genes<RecurrentConnection> _recurrent;
};
} // namespace Noveat

CEREAL_CLASS_VERSION(Noveat::Genome, NOVEAT_VERSION);

#endif /* GENOME_H */
