/**
 * @file Random.cpp
 * @brief Random number generation implementation
 */

#include <QiGeom/Platform/Random.h>

#include <chrono>
#include <functional>
#include <thread>

namespace Qi::Geom::Platform {

Random& Random::Instance() {
    thread_local Random instance;
    return instance;
}

Random::Random() {
    // Time combined with thread ID so concurrent threads start apart
    auto now = std::chrono::high_resolution_clock::now();
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        now.time_since_epoch()).count();

    std::hash<std::thread::id> hasher;
    uint64_t threadHash = hasher(std::this_thread::get_id());

    seed_ = static_cast<uint64_t>(nanos) ^ threadHash;
    gen_.seed(seed_);
}

void Random::SetSeed(uint64_t seed) {
    seed_ = seed;
    gen_.seed(seed);
}

// =========================================================================
// Scalar Generation
// =========================================================================

uint32_t Random::Uint32() {
    return static_cast<uint32_t>(gen_());
}

uint32_t Random::Uint32(uint32_t min, uint32_t max) {
    return Scalar<uint32_t>(min, max);
}

int32_t Random::Int(int32_t min, int32_t max) {
    return Scalar<int32_t>(min, max);
}

float Random::Float(float min, float max) {
    return Scalar<float>(min, max);
}

bool Random::Bool() {
    return (gen_() & 1) != 0;
}

} // namespace Qi::Geom::Platform
