#ifndef PARAMETERS_H
#define PARAMETERS_H

#include "noveat.hpp"

namespace Noveat {
struct Parameters final {
  struct Setup {
    uint64_t seed = 42;
    double survivalRate = 0.5;
    size_t populationSize = 100;
    size_t inputDimension = 1;
    size_t outputDimension = 1;

    template <class Archive> void serialize(Archive &ar) {
      ar(CEREAL_NVP(seed), CEREAL_NVP(survivalRate), CEREAL_NVP(populationSize),
         CEREAL_NVP(inputDimension), CEREAL_NVP(outputDimension));
    }
  };

  struct NoveltySearch {
    size_t nearestNeighbors = 3;

    template <class Archive> void serialize(Archive &ar) {
      ar(CEREAL_NVP(nearestNeighbors));
    }
  };

  struct Mutation {
    double newNodeChance = 0.05;
    double newConnectionChance = 0.1;
    double connectionIsRecurrentChance = 0.3;
    double changeActivationChance = 0.05;
    double weightPerturbationStdDev = 1.0;

    template <class Archive> void serialize(Archive &ar) {
      ar(CEREAL_NVP(newNodeChance), CEREAL_NVP(newConnectionChance),
         CEREAL_NVP(connectionIsRecurrentChance),
         CEREAL_NVP(changeActivationChance),
         CEREAL_NVP(weightPerturbationStdDev));
    }
  };

  struct Activations {
    std::vector<Activation> outputNodes{Activation::Tanh};
    std::vector<Activation> hiddenNodes{
        Activation::Linear, Activation::Sigmoid,  Activation::Tanh,
        Activation::Gaussian, Activation::Step,   Activation::Sine,
        Activation::Cosine, Activation::Inverse,  Activation::Absolute,
        Activation::Relu};

    template <class Archive> void serialize(Archive &ar) {
      ar(CEREAL_NVP(outputNodes), CEREAL_NVP(hiddenNodes));
    }
  };

  Setup setup;
  NoveltySearch novelty;
  Mutation mutation;
  Activations activations;

  void validate() const {
    if (setup.populationSize == 0)
      throw std::runtime_error("Population size must be at least 1.");
    if (!(setup.survivalRate > 0.0 && setup.survivalRate <= 1.0))
      throw std::runtime_error("Survival rate must be within (0, 1].");
    if (setup.inputDimension == 0 || setup.outputDimension == 0)
      throw std::runtime_error(
          "Input and output dimension must be at least 1.");
    if (novelty.nearestNeighbors == 0)
      throw std::runtime_error("Novelty needs at least 1 nearest neighbor.");
    if (activations.outputNodes.empty() || activations.hiddenNodes.empty())
      throw std::runtime_error("Activation candidate sets must not be empty.");

    for (auto chance :
         {mutation.newNodeChance, mutation.newConnectionChance,
          mutation.connectionIsRecurrentChance,
          mutation.changeActivationChance}) {
      if (!(chance >= 0.0 && chance <= 1.0))
        throw std::runtime_error("Mutation chances must be within [0, 1].");
    }

    if (!(mutation.weightPerturbationStdDev > 0.0))
      throw std::runtime_error(
          "Weight perturbation standard deviation must be positive.");
  }

  static Parameters fromJson(std::istream &is) {
    Parameters res;
    {
      cereal::JSONInputArchive ia(is);
      ia(cereal::make_nvp("parameters", res));
    }
    res.validate();
    return res;
  }

  void toJson(std::ostream &os) const {
    cereal::JSONOutputArchive oa(os);
    oa(cereal::make_nvp("parameters", *this));
  }

  // unversioned, config files are hand written
  template <class Archive> void serialize(Archive &ar) {
    ar(CEREAL_NVP(setup), CEREAL_NVP(novelty), CEREAL_NVP(mutation),
       CEREAL_NVP(activations));
  }
};
} // namespace Noveat

#endif /* PARAMETERS_H */
