#include "CliffScore.h"

#include "core/Assert.h"

#include <nlohmann/json.hpp>
#include <stdexcept>
#include <type_traits>

namespace KnapEvo {

uint64_t CliffScore::getValue() const
{
    KNAPEVO_ASSERT(isFeasible(), "Overloaded scores have no value");
    return std::get<Feasible>(variant_).value;
}

std::string toString(const CliffScore& score)
{
    return std::visit(
        [](const auto& s) -> std::string {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, Feasible>) {
                return "Feasible(" + std::to_string(s.value) + ")";
            }
            else {
                return "Overloaded";
            }
        },
        score.getVariant());
}

void to_json(nlohmann::json& j, const CliffScore& score)
{
    if (score.isFeasible()) {
        j = nlohmann::json{ { "kind", "Feasible" }, { "value", score.getValue() } };
    }
    else {
        j = nlohmann::json{ { "kind", "Overloaded" } };
    }
}

void from_json(const nlohmann::json& j, CliffScore& score)
{
    const auto kind = j.at("kind").get<std::string>();
    if (kind == "Feasible") {
        score = CliffScore::feasible(j.at("value").get<uint64_t>());
    }
    else if (kind == "Overloaded") {
        score = CliffScore::overloaded();
    }
    else {
        throw std::runtime_error("Invalid score kind: " + kind);
    }
}

} // namespace KnapEvo
