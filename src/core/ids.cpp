#include "ids.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>

namespace termdeck
{

std::string random_id()
{
    static std::mutex      mutex;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = rng();
        lo = rng();
    }

    // Version 4, variant 10xx.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    static constexpr char HEX[] = "0123456789abcdef";
    std::string           out;
    out.reserve(36);
    auto emit = [&](uint64_t word, int from_nibble, int to_nibble)
    {
        for (int i = from_nibble; i < to_nibble; ++i)
            out += HEX[(word >> (60 - 4 * i)) & 0xF];
    };
    emit(hi, 0, 8);
    out += '-';
    emit(hi, 8, 12);
    out += '-';
    emit(hi, 12, 16);
    out += '-';
    emit(lo, 0, 4);
    out += '-';
    emit(lo, 4, 16);
    return out;
}

IdGenerator sequential_ids(std::string prefix)
{
    auto counter = std::make_shared<uint64_t>(0);
    return [prefix = std::move(prefix), counter]()
    { return prefix + std::to_string(++*counter); };
}

}   // namespace termdeck
