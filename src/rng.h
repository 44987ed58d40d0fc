// rng.h
#pragma once
#include <cstdint>
#include <random>

struct RNG {
    std::mt19937_64 eng;
    explicit RNG(uint64_t seed) : eng(seed) {}
    int  randint(int a, int b) { std::uniform_int_distribution<int> d(a, b); return d(eng); }
};
