#pragma once

#include "Rng.h"

#include <cstddef>
#include <string>
#include <vector>

namespace KnapEvo {

/**
 * Fixed-length bit vector genome: bit i set means item i is packed.
 * Operators never resize a genome; length is fixed by the instance.
 */
struct Bitstring {
    std::vector<bool> bits;

    Bitstring() = default;
    explicit Bitstring(size_t length, bool value = false);
    explicit Bitstring(std::vector<bool> values);

    // Each bit independently set with probability 1/2.
    static Bitstring random(size_t length, Rng& rng);

    // Parses "0110"; any character other than '1' is a cleared bit.
    static Bitstring fromString(const std::string& text);

    size_t size() const { return bits.size(); }
    bool empty() const { return bits.empty(); }
    bool operator[](size_t index) const { return bits[index]; }

    size_t countSet() const;
    std::string toString() const;

    bool operator==(const Bitstring& other) const { return bits == other.bits; }
    bool operator!=(const Bitstring& other) const { return bits != other.bits; }
};

// Number of positions at which two equal-length genomes differ.
size_t hammingDistance(const Bitstring& a, const Bitstring& b);

} // namespace KnapEvo
