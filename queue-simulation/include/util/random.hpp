#pragma once

#include <random>

/**
 * @brief Wrapper around std::mt19937 for reproducible random values.
 */
class RandomGenerator {
public:
    /** @brief Seed with std::random_device for non-deterministic runs. */
    RandomGenerator();

    /** @brief Seed with a fixed value for deterministic runs. */
    explicit RandomGenerator(unsigned int seed);

    /**
     * @brief Real range [min, max] (max reachable only when min == max).
     */
    double uniformReal(double min, double max);

    /**
     * @brief Uniform value in (0, 1], safe to pass to std::log.
     */
    double unitOpenClosed();

    /**
     * @brief Exponentially distributed value with the given mean (inverse transform).
     */
    double exponential(double mean);

private:
    std::mt19937 engine;
};
