#include "internal/condition/condition_generator.hpp"

#include <cassert>
#include <iostream>

namespace {

using usedgear::condition::ConditionGenerator;
using usedgear::market::MarketTables;
using usedgear::model::AgentTier;
using usedgear::model::GenerationClass;
using usedgear::model::QualityTier;
using usedgear::util::Random;

constexpr double kEps = 1e-9;

void TestPriceNeverBelowFloor() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);

  // 5% of base, rounded up
  assert(generator.Price(100000.0, 0.01, 20) == 5000.0);
  assert(generator.Price(999.0, 0.0, 0) == 50.0);
}

void TestPriceAppliesCappedAgeDiscount() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);

  assert(generator.Price(100000.0, 0.5, 0) == 50000.0);
  // 3%/year caps at 25%
  assert(generator.Price(100000.0, 0.8, 30) == 60000.0);
}

void TestGeneratedConditionStaysInRange() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);
  Random             rng(1234);

  for (int i = 0; i < 500; ++i) {
    const auto out = generator.Generate(rng, QualityTier::kGood, AgentTier::kRegional, 100000.0);

    assert(out.visible.damage >= 0.06 - kEps && out.visible.damage <= 0.18 + kEps);
    assert(out.visible.wear >= 0.08 - kEps && out.visible.wear <= 0.22 + kEps);
    assert(out.price_multiplier >= 0.68 - kEps && out.price_multiplier <= 0.80 + kEps);
    assert(out.price >= 5000.0);

    const auto& gen = tables.Generation(out.visible.generation);
    assert(out.visible.age_years >= gen.age_years.min && out.visible.age_years <= gen.age_years.max);

    const auto& h = out.hidden;
    assert(h.dna >= 0.0 && h.dna <= 1.0);
    assert(h.engine_reliability >= 0.10 && h.engine_reliability <= 1.0);
    assert(h.reliability_ceiling >= 0.30 && h.reliability_ceiling <= 1.0);
    assert(h.overall_rating >= 0.0 && h.overall_rating <= 100.0);
    assert(h.overall_rating <= h.reliability_ceiling * 100.0 + 0.5);
  }
}

void TestLocalAgentScalesDamageUp() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);
  Random             rng(99);

  for (int i = 0; i < 200; ++i) {
    const auto out = generator.Generate(rng, QualityTier::kFair, AgentTier::kLocal, 50000.0);
    assert(out.visible.damage >= 0.18 * 1.3 - kEps);
    assert(out.visible.damage <= 0.35 * 1.3 + kEps);
  }
}

void TestForcedGenerationIsRespected() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);
  Random             rng(7);

  for (int i = 0; i < 50; ++i) {
    const auto out = generator.Generate(rng, QualityTier::kAny, AgentTier::kNational, 80000.0, GenerationClass::kOld);
    assert(out.visible.generation == GenerationClass::kOld);
    assert(out.visible.age_years >= 8 && out.visible.age_years <= 15);
  }
}

void TestSameSeedReproducesCondition() {
  const auto         tables = MarketTables::Defaults();
  ConditionGenerator generator(tables);
  Random             a(42);
  Random             b(42);

  const auto x = generator.Generate(a, QualityTier::kExcellent, AgentTier::kNational, 250000.0);
  const auto y = generator.Generate(b, QualityTier::kExcellent, AgentTier::kNational, 250000.0);

  assert(x.visible.age_years == y.visible.age_years);
  assert(x.visible.damage == y.visible.damage);
  assert(x.hidden.dna == y.hidden.dna);
  assert(x.price == y.price);
}

void TestOutOfRangeTiersFallBack() {
  assert(ConditionGenerator::ResolveQuality(0) == QualityTier::kAny);
  assert(ConditionGenerator::ResolveQuality(99) == QualityTier::kAny);
  assert(ConditionGenerator::ResolveQuality(5) == QualityTier::kExcellent);
  assert(ConditionGenerator::ResolveAgent(-1) == AgentTier::kRegional);
  assert(ConditionGenerator::ResolveAgent(1) == AgentTier::kLocal);
}

void TestZeroWeightsPickMidAge() {
  auto tables = MarketTables::Defaults();
  tables.search[0].generation_weights = {0.0, 0.0, 0.0};
  ConditionGenerator generator(tables);
  Random             rng(3);

  assert(generator.PickGeneration(rng, AgentTier::kLocal) == GenerationClass::kMidAge);
}

} // namespace

int main() {
  TestPriceNeverBelowFloor();
  TestPriceAppliesCappedAgeDiscount();
  TestGeneratedConditionStaysInRange();
  TestLocalAgentScalesDamageUp();
  TestForcedGenerationIsRespected();
  TestSameSeedReproducesCondition();
  TestOutOfRangeTiersFallBack();
  TestZeroWeightsPickMidAge();

  std::cout << "usedgear_unit_condition_generator: pass\n";
  return 0;
}
