#include "Bitstring.h"

#include "core/Assert.h"

#include <algorithm>
#include <cstdint>

namespace KnapEvo {

Bitstring::Bitstring(size_t length, bool value) : bits(length, value)
{}

Bitstring::Bitstring(std::vector<bool> values) : bits(std::move(values))
{}

Bitstring Bitstring::random(size_t length, Rng& rng)
{
    Bitstring genome(length);

    // One 64-bit draw covers 64 positions.
    uint64_t word = 0;
    for (size_t i = 0; i < length; ++i) {
        if (i % 64 == 0) {
            word = rng();
        }
        genome.bits[i] = ((word >> (i % 64)) & 1u) != 0;
    }

    return genome;
}

Bitstring Bitstring::fromString(const std::string& text)
{
    Bitstring genome(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        genome.bits[i] = text[i] == '1';
    }
    return genome;
}

size_t Bitstring::countSet() const
{
    return static_cast<size_t>(std::count(bits.begin(), bits.end(), true));
}

std::string Bitstring::toString() const
{
    std::string text;
    text.reserve(bits.size());
    for (const bool bit : bits) {
        text.push_back(bit ? '1' : '0');
    }
    return text;
}

size_t hammingDistance(const Bitstring& a, const Bitstring& b)
{
    KNAPEVO_ASSERT(a.size() == b.size(), "Hamming distance requires equal-length genomes");

    size_t distance = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (a.bits[i] != b.bits[i]) {
            distance++;
        }
    }
    return distance;
}

} // namespace KnapEvo
