#pragma once

#include <cstdint>
#include <nlohmann/json_fwd.hpp>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <variant>

namespace KnapEvo {

/**
 * Packing exceeded the capacity. Every overload is equally bad.
 */
struct Overloaded {
    bool operator==(const Overloaded&) const { return true; }
    bool operator<(const Overloaded&) const { return false; }
};

/**
 * Packing fits; value is the summed value of the packed items.
 */
struct Feasible {
    uint64_t value = 0;

    bool operator==(const Feasible& other) const { return value == other.value; }
    bool operator<(const Feasible& other) const { return value < other.value; }
};

/**
 * Cliff fitness: Overloaded < Feasible(0) < Feasible(1) < ...
 *
 * The ordering comes from the variant alternative order, so Overloaded must
 * stay first.
 */
class CliffScore {
public:
    using Variant = std::variant<Overloaded, Feasible>;

    CliffScore() = default;
    CliffScore(Overloaded overloaded) : variant_(overloaded) {}
    CliffScore(Feasible feasible) : variant_(feasible) {}

    static CliffScore overloaded() { return CliffScore(Overloaded{}); }
    static CliffScore feasible(uint64_t value) { return CliffScore(Feasible{ .value = value }); }

    bool isFeasible() const { return std::holds_alternative<Feasible>(variant_); }
    bool isOverloaded() const { return std::holds_alternative<Overloaded>(variant_); }

    // Only valid when isFeasible().
    uint64_t getValue() const;

    const Variant& getVariant() const { return variant_; }

    bool operator==(const CliffScore& other) const { return variant_ == other.variant_; }
    bool operator!=(const CliffScore& other) const { return !(*this == other); }
    bool operator<(const CliffScore& other) const { return variant_ < other.variant_; }
    bool operator<=(const CliffScore& other) const { return !(other < *this); }
    bool operator>(const CliffScore& other) const { return other < *this; }
    bool operator>=(const CliffScore& other) const { return !(*this < other); }

private:
    Variant variant_{ Overloaded{} };
};

// "Feasible(42)" or "Overloaded".
std::string toString(const CliffScore& score);

// {"kind": "Feasible", "value": 42} or {"kind": "Overloaded"}.
void to_json(nlohmann::json& j, const CliffScore& score);
void from_json(const nlohmann::json& j, CliffScore& score);

} // namespace KnapEvo

template <>
struct fmt::formatter<KnapEvo::CliffScore> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const KnapEvo::CliffScore& score, FormatContext& ctx) const
    {
        return fmt::formatter<std::string>::format(KnapEvo::toString(score), ctx);
    }
};
