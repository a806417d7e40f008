#include "random.hpp"

#include <sstream>
#include <stdexcept>

namespace usedgear::util {

Random::Random(std::uint64_t seed) : seed_(seed), engine_(seed) {
}

Random Random::FromEntropy() {
  std::random_device device;
  const auto         seed = (static_cast<std::uint64_t>(device()) << 32) | device();
  return Random(seed);
}

void Random::Reseed(std::uint64_t seed) {
  seed_ = seed;
  engine_.seed(seed);
}

double Random::Unit() {
  return std::uniform_real_distribution<double>(0.0, 1.0)(engine_);
}

double Random::Uniform(double min, double max) {
  if (max <= min) return min;
  return min + (max - min) * Unit();
}

std::int64_t Random::UniformInt(std::int64_t min, std::int64_t max) {
  if (max <= min) return min;
  return std::uniform_int_distribution<std::int64_t>(min, max)(engine_);
}

bool Random::Chance(double p) {
  if (p <= 0.0) return false;
  if (p >= 1.0) return true;
  return Unit() < p;
}

std::string Random::State() const {
  std::ostringstream out;
  out << engine_;
  return out.str();
}

void Random::RestoreState(std::uint64_t seed, const std::string& state) {
  std::istringstream in(state);
  std::mt19937_64    restored;
  in >> restored;
  if (in.fail()) {
    throw std::invalid_argument("malformed random state");
  }
  seed_   = seed;
  engine_ = restored;
}

double Random::Bell(double spread) {
  return (Uniform(-spread, spread) + Uniform(-spread, spread)) / 2.0;
}

} // namespace usedgear::util
