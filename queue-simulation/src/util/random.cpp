#include "util/random.hpp"

#include <cmath>

RandomGenerator::RandomGenerator() : engine(std::random_device{}()) {}

RandomGenerator::RandomGenerator(unsigned int seed) : engine(seed) {}

double RandomGenerator::uniformReal(double min, double max) {
    if (max <= min) {
        return min;
    }
    std::uniform_real_distribution<double> dist(min, max);
    return dist(engine);
}

double RandomGenerator::unitOpenClosed() {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    // Some implementations can round a draw up to 1.0.
    double u = dist(engine);
    while (u >= 1.0) {
        u = dist(engine);
    }
    return 1.0 - u;
}

double RandomGenerator::exponential(double mean) {
    return -std::log(unitOpenClosed()) * mean;
}
