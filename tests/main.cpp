#include "../runtime.hpp"
#include <set>
#include <sstream>

#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

INITIALIZE_EASYLOGGINGPP

using namespace Noveat;

TEST_CASE("Random ranges", "[rng]") {
  Random rng(7, 1.0);
  for (auto i = 0; i < 1000; i++) {
    auto r = rng.nextDouble();
    REQUIRE(r >= 0.0);
    REQUIRE(r < 1.0);
    auto w = rng.init();
    REQUIRE(w >= -1.0);
    REQUIRE(w <= 1.0);
  }
  REQUIRE_FALSE(rng.gamble(0.0));
  REQUIRE(rng.gamble(1.0));
}

TEST_CASE("IdGenerator split cache", "[ids]") {
  IdGenerator idGen;
  REQUIRE(idGen.nextId() == 0);
  REQUIRE(idGen.nextId() == 1);

  auto first = idGen.cachedId({0, 1}, 0);
  REQUIRE(first == 2);
  REQUIRE(idGen.cachedId({0, 1}, 0) == first);
  REQUIRE(idGen.peek() == 3);

  // asking further down the sequence fills it
  REQUIRE(idGen.cachedId({0, 1}, 2) == 4);
  REQUIRE(idGen.cachedId({0, 1}, 1) == 3);
  REQUIRE(idGen.cachedId({1, 0}, 0) == 5);
  REQUIRE(idGen.cachedSplits() == 2);
}

TEST_CASE("Genes identity and payload", "[genes]") {
  Genes<FeedForwardConnection> genes;
  REQUIRE(genes.insert(FeedForwardConnection(1, 0.5, 2)));
  REQUIRE_FALSE(genes.insert(FeedForwardConnection(1, 0.9, 2)));
  REQUIRE(genes.size() == 1);
  REQUIRE(genes.get({1, 2})->weight == 0.5);

  genes.replace(FeedForwardConnection(1, 0.9, 2));
  REQUIRE(genes.size() == 1);
  REQUIRE(genes.get({1, 2})->weight == 0.9);

  REQUIRE(genes.contains(FeedForwardConnection(1, -3.0, 2)));
  REQUIRE_FALSE(genes.contains(ConnectionKey{2, 1}));
  REQUIRE(genes.get({2, 1}) == nullptr);
}

TEST_CASE("Genes rotated iteration visits everything once", "[genes]") {
  Genes<HiddenNode> genes;
  for (Id id = 0; id < 7; id++) {
    genes.insert(HiddenNode(id, Activation::Linear));
  }

  Random rng(3, 1.0);
  for (auto i = 0; i < 20; i++) {
    std::set<Id> seen;
    size_t count = 0;
    for (auto &node : genes.iterateWithRandomOffset(rng)) {
      seen.insert(node.id);
      count++;
    }
    REQUIRE(count == 7);
    REQUIRE(seen.size() == 7);
  }

  Genes<HiddenNode> empty;
  size_t count = 0;
  for (auto &node : empty.iterateWithRandomOffset(rng)) {
    (void)node;
    count++;
  }
  REQUIRE(count == 0);
  REQUIRE(empty.random(rng) == nullptr);
}

TEST_CASE("Genes crossover keeps only our disjoint genes", "[genes]") {
  Genes<FeedForwardConnection> fitter;
  fitter.insert(FeedForwardConnection(1, 1.0, 2));
  fitter.insert(FeedForwardConnection(1, 1.0, 3));

  Genes<FeedForwardConnection> weaker;
  weaker.insert(FeedForwardConnection(1, 2.0, 2));
  weaker.insert(FeedForwardConnection(2, 2.0, 3));

  Random rng(11, 1.0);
  for (auto i = 0; i < 20; i++) {
    auto child = fitter.crossIn(weaker, rng);
    REQUIRE(child.size() == 2);
    REQUIRE(child.contains(ConnectionKey{1, 2}));
    REQUIRE(child.contains(ConnectionKey{1, 3}));
    REQUIRE_FALSE(child.contains(ConnectionKey{2, 3}));
    REQUIRE(child.get({1, 3})->weight == 1.0);

    auto weight = child.get({1, 2})->weight;
    REQUIRE((weight == 1.0 || weight == 2.0));
  }
}

TEST_CASE("Squash", "[squash]") {
  REQUIRE(Squash::apply(Activation::Linear, 0.77) == Approx(0.77));
  REQUIRE(Squash::apply(Activation::Sigmoid, 0.77) == Approx(0.683521));
  REQUIRE(Squash::apply(Activation::Tanh, 0.77) == Approx(0.646929));
  REQUIRE(Squash::apply(Activation::Gaussian, 0.77) == Approx(0.552722));
  REQUIRE(Squash::apply(Activation::Step, 0.77) == Approx(1.0));
  REQUIRE(Squash::apply(Activation::Step, -0.77) == Approx(0.0));
  REQUIRE(Squash::apply(Activation::Sine, 0.77) == Approx(0.696135));
  REQUIRE(Squash::apply(Activation::Cosine, 0.77) == Approx(0.717911));
  REQUIRE(Squash::apply(Activation::Inverse, 0.77) == Approx(-0.77));
  REQUIRE(Squash::apply(Activation::Absolute, -0.77) == Approx(0.77));
  REQUIRE(Squash::apply(Activation::Relu, -0.77) == Approx(0.0));
  REQUIRE(Squash::apply(Activation::Relu, 0.77) == Approx(0.77));
  REQUIRE(Squash::apply(Activation::Squared, 0.77) == Approx(0.5929));

  Random rng(1, 1.0);
  REQUIRE_THROWS_AS(Squash::random({}, rng), std::runtime_error);
  REQUIRE(Squash::random({Activation::Tanh}, rng) == Activation::Tanh);
}

TEST_CASE("Score normalization", "[scores]") {
  auto stats = ScoreStatistics::of<Fitness>({2.0, 5.0, 9.0});
  REQUIRE(stats.baseline() == 2.0);
  REQUIRE(stats.with() == 7.0);
  REQUIRE(stats.rawAverage == Approx(16.0 / 3.0));
  REQUIRE(stats.normalizedMinimum == 0.0);
  REQUIRE(stats.normalizedMaximum == 1.0);

  FitnessScore low(2.0, stats.baseline(), stats.with());
  FitnessScore mid(5.0, stats.baseline(), stats.with());
  FitnessScore high(9.0, stats.baseline(), stats.with());

  REQUIRE(low.shifted.value == 0.0);
  REQUIRE(mid.shifted.value == 3.0);
  REQUIRE(high.shifted.value == 7.0);

  REQUIRE(low.normalized.value == 0.0);
  REQUIRE(mid.normalized.value == Approx(3.0 / 7.0));
  REQUIRE(high.normalized.value == 1.0);
}

TEST_CASE("Score normalization of a narrow spread", "[scores]") {
  // a spread below 1 is not stretched
  auto stats = ScoreStatistics::of<Novelty>({0.1, 0.3});
  REQUIRE(stats.with() == Approx(0.2));

  NoveltyScore score(0.3, stats.baseline(), stats.with());
  REQUIRE(score.normalized.value == Approx(0.2));

  auto empty = ScoreStatistics::of<Novelty>({});
  REQUIRE(empty.rawMaximum == 0.0);
  REQUIRE(empty.with() == 0.0);
}

TEST_CASE("Novelty of evenly spaced behaviors", "[novelty]") {
  std::vector<Behavior> storage{Behavior{{0.0}}, Behavior{{1.0}},
                               Behavior{{2.0}}, Behavior{{3.0}}};
  Behaviors behaviors(storage.begin(), storage.end());

  auto nearest = computeNovelty(behaviors, 1);
  for (auto n : nearest) {
    REQUIRE(n == Approx(1.0));
  }

  auto two = computeNovelty(behaviors, 2);
  REQUIRE(two[0] == Approx(1.5));
  REQUIRE(two[1] == Approx(1.0));
  REQUIRE(two[2] == Approx(1.0));
  REQUIRE(two[3] == Approx(1.5));

  // more neighbors than exist
  auto all = computeNovelty(behaviors, 10);
  REQUIRE(all[0] == Approx(2.0));
  REQUIRE(all[1] == Approx(4.0 / 3.0));

  std::vector<Behavior> alone{Behavior{{5.0}}};
  REQUIRE(computeNovelty(Behaviors(alone.begin(), alone.end()), 3)[0] == 0.0);
}

TEST_CASE("Novelty of a leading prefix", "[novelty]") {
  std::vector<Behavior> storage{Behavior{{0.0}}, Behavior{{1.0}},
                               Behavior{{2.0}}, Behavior{{3.0}}};
  Behaviors behaviors(storage.begin(), storage.end());

  // the trailing behaviors are neighbors only
  auto scored = computeNovelty(behaviors, 2, 3);
  REQUIRE(scored.size() == 2);
  REQUIRE(scored[0] == Approx(2.0));
  REQUIRE(scored[1] == Approx(4.0 / 3.0));

  REQUIRE(computeNovelty(behaviors, 0, 3).empty());
  REQUIRE(computeNovelty(behaviors, 9, 1).size() == 4);
}

TEST_CASE("Behavior dimension mismatch", "[novelty]") {
  Behavior a{{0.0, 1.0}};
  Behavior b{{0.0}};
  REQUIRE_THROWS_AS(a.distance(b), std::runtime_error);
  REQUIRE(a.distance(Behavior{{3.0, 5.0}}) == Approx(5.0));
}

TEST_CASE("Progress projections", "[progress]") {
  auto empty = Progress::empty();
  REQUIRE_FALSE(empty.rawFitness());
  REQUIRE(empty.behavior() == nullptr);
  REQUIRE(empty.solution() == nullptr);
  REQUIRE(std::holds_alternative<Progress::Empty>(empty.value()));

  auto novelty = Progress::novelty({1.0, 2.0});
  REQUIRE_FALSE(novelty.rawFitness());
  REQUIRE(novelty.behavior()->values == std::vector<double>{1.0, 2.0});

  auto status = Progress::status(3.5, {4.0});
  REQUIRE(status.rawFitness()->value == 3.5);
  REQUIRE(status.behavior()->values == std::vector<double>{4.0});
  REQUIRE(status.solution() == nullptr);
  REQUIRE(std::get<Progress::Status>(status.value()).fitness.value == 3.5);

  Individual individual;
  individual.age = 4;
  auto solved = status.solved(individual);
  REQUIRE(solved.rawFitness()->value == 3.5);
  REQUIRE(solved.behavior()->values == std::vector<double>{4.0});
  REQUIRE(solved.solution() != nullptr);
  REQUIRE(solved.solution()->age == 4);
  REQUIRE(std::holds_alternative<Progress::Solution>(solved.value()));

  auto bare = Progress::empty().solved(individual);
  REQUIRE_FALSE(bare.rawFitness());
  REQUIRE(bare.behavior() == nullptr);
  REQUIRE(bare.solution() != nullptr);
}

TEST_CASE("Parameters json", "[parameters]") {
  Parameters parameters;
  parameters.setup.populationSize = 33;
  parameters.mutation.newNodeChance = 0.25;
  parameters.activations.outputNodes = {Activation::Sigmoid,
                                        Activation::Relu};

  std::stringstream ss;
  parameters.toJson(ss);

  auto loaded = Parameters::fromJson(ss);
  REQUIRE(loaded.setup.populationSize == 33);
  REQUIRE(loaded.setup.seed == parameters.setup.seed);
  REQUIRE(loaded.mutation.newNodeChance == 0.25);
  REQUIRE(loaded.activations.outputNodes == parameters.activations.outputNodes);
  REQUIRE(loaded.activations.hiddenNodes == parameters.activations.hiddenNodes);
}

TEST_CASE("Parameters validation", "[parameters]") {
  Parameters parameters;
  REQUIRE_NOTHROW(parameters.validate());

  auto broken = parameters;
  broken.setup.populationSize = 0;
  REQUIRE_THROWS_AS(broken.validate(), std::runtime_error);

  broken = parameters;
  broken.setup.survivalRate = 0.0;
  REQUIRE_THROWS_AS(broken.validate(), std::runtime_error);

  broken = parameters;
  broken.mutation.newConnectionChance = 1.5;
  REQUIRE_THROWS_AS(broken.validate(), std::runtime_error);

  broken = parameters;
  broken.activations.hiddenNodes.clear();
  REQUIRE_THROWS_AS(broken.validate(), std::runtime_error);

  broken = parameters;
  broken.mutation.weightPerturbationStdDev = 0.0;
  REQUIRE_THROWS_AS(broken.validate(), std::runtime_error);

  // invalid files are rejected on load
  broken = parameters;
  broken.novelty.nearestNeighbors = 0;
  std::stringstream ss;
  broken.toJson(ss);
  REQUIRE_THROWS_AS(Parameters::fromJson(ss), std::runtime_error);
}
