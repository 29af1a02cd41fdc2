#pragma once
#include <cstdint>
#include <random>

namespace loa {

// Source of the evaluator's noise. rand_int(bound) returns a value in [0, bound).
class RandomSource {
public:
  virtual ~RandomSource() = default;
  virtual int rand_int(int bound) = 0;
};

class SeededRandom : public RandomSource {
public:
  explicit SeededRandom(std::uint64_t seed = 0x5EEDULL) : gen_(seed) {}
  int rand_int(int bound) override {
    if (bound <= 1) return 0;
    std::uniform_int_distribution<int> dist(0, bound - 1);
    return dist(gen_);
  }
  void reseed(std::uint64_t seed) { gen_.seed(seed); }

private:
  std::mt19937_64 gen_;
};

// Always the same index (clamped to bound - 1). Makes evaluation a pure function.
class FixedRandom : public RandomSource {
public:
  explicit FixedRandom(int value = 0) : value_(value) {}
  int rand_int(int bound) override {
    if (bound <= 1 || value_ <= 0) return 0;
    return value_ < bound ? value_ : bound - 1;
  }

private:
  int value_;
};

} // namespace loa
