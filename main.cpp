#include "network.hpp"
#include "runtime.hpp"
#include <fstream>
#include <iomanip> // std::setprecision
#include <iostream>

INITIALIZE_EASYLOGGINGPP

namespace {
struct Case {
  std::vector<double> input;
  double target;
};

// last input is a constant bias
const std::vector<Case> xorCases{{{0.0, 0.0, 1.0}, 0.0},
                                 {{0.0, 1.0, 1.0}, 1.0},
                                 {{1.0, 0.0, 1.0}, 1.0},
                                 {{1.0, 1.0, 1.0}, 0.0}};

Noveat::Progress evaluate(const Noveat::Individual &individual) {
  Noveat::Network network(individual.genome);

  double error = 0.0;
  size_t correct = 0;
  std::vector<double> behavior;
  for (auto &c : xorCases) {
    network.clear();
    auto output = network.activate(c.input)[0];
    auto distance = std::fabs(c.target - output);
    error += distance * distance;
    if (distance < 0.5)
      correct++;
    behavior.push_back(output);
  }

  auto progress =
      Noveat::Progress::status(double(xorCases.size()) - error, behavior);
  if (correct == xorCases.size())
    return progress.solved(individual);
  return progress;
}
} // namespace

int main(int argc, char *argv[]) {
  Noveat::Parameters parameters;
  if (argc > 1) {
    std::ifstream is(argv[1]);
    if (!is) {
      LOG(ERROR) << "Could not open parameters file: " << argv[1];
      return 1;
    }
    parameters = Noveat::Parameters::fromJson(is);
  } else {
    parameters.setup.inputDimension = 3;
    parameters.setup.outputDimension = 1;
    parameters.setup.populationSize = 150;
    parameters.mutation.newNodeChance = 0.1;
    parameters.mutation.newConnectionChance = 0.3;
  }

  const uint64_t maxGenerations = 500;

  Noveat::Runtime runtime(parameters, evaluate);
  for (uint64_t i = 0; i < maxGenerations; i++) {
    auto evaluation = runtime.next();
    auto solution = std::get_if<Noveat::Individual>(&evaluation);
    if (!solution)
      continue;

    LOG(INFO) << "XOR solved after " << runtime.generation()
              << " generations with " << solution->genome.hidden().size()
              << " hidden nodes and " << solution->genome.size()
              << " connections";

    Noveat::Network network(solution->genome);
    for (auto &c : xorCases) {
      network.clear();
      std::cout << std::setprecision(6) << network.activate(c.input)[0]
                << " (" << c.target << ")\n";
    }

    {
      std::ofstream os("xor.json");
      cereal::JSONOutputArchive oa(os);
      oa(cereal::make_nvp("solution", *solution));
    }

    return 0;
  }

  LOG(WARNING) << "XOR not solved within " << maxGenerations << " generations";
  return 1;
}
