#pragma once

#include <cstdint>
#include <random>
#include <string>

namespace usedgear::util {

/*
  Seedable random source shared by every engine component.

  All rolls go through one generator so a fixed seed reproduces a whole
  simulation run.
*/
class Random {
 public:
  explicit Random(std::uint64_t seed);

  // Seeds from std::random_device.
  static Random FromEntropy();

  void Reseed(std::uint64_t seed);

  // Uniform in [0, 1).
  double Unit();

  // Uniform in [min, max]; returns min when max <= min.
  double Uniform(double min, double max);

  // Uniform integer in [min, max]; returns min when max <= min.
  std::int64_t UniformInt(std::int64_t min, std::int64_t max);

  // True with probability p (p <= 0 never, p >= 1 always).
  bool Chance(double p);

  // Mean of two uniform draws in [-spread, spread]; peaks at zero.
  double Bell(double spread);

  std::uint64_t Seed() const {
    return seed_;
  }

  // Full generator state as text, for snapshots.
  std::string State() const;

  // Throws std::invalid_argument on a malformed state string.
  void RestoreState(std::uint64_t seed, const std::string& state);

 private:
  std::uint64_t   seed_;
  std::mt19937_64 engine_;
};

} // namespace usedgear::util
