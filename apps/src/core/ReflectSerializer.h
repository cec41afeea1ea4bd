#pragma once

#include <reflect>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <type_traits>

/**
 * Generic reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation. Member names become JSON keys; empty optionals
 * are omitted on write and left untouched on read.
 *
 * Example:
 *   struct Limits { int populationSize = 10; std::optional<uint64_t> seed; };
 *   auto j = ReflectSerializer::to_json(Limits{});
 *   auto limits = ReflectSerializer::from_json<Limits>(j);
 */
namespace ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename T>
nlohmann::json to_json(const T& obj)
{
    nlohmann::json j = nlohmann::json::object();

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            const auto& value = reflect::get<I>(obj);

            using MemberType = std::remove_cvref_t<decltype(value)>;

            if constexpr (is_optional_v<MemberType>) {
                if (value.has_value()) {
                    j[name] = *value;
                }
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

/**
 * Deserialize into a default-constructed T; keys missing from the JSON keep
 * the member's default. Type mismatches throw nlohmann::json::type_error.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if (!j.contains(name)) {
                return;
            }

            if constexpr (is_optional_v<MemberType>) {
                if (!j[name].is_null()) {
                    using InnerType = typename MemberType::value_type;
                    reflect::get<I>(obj) = j[name].get<InnerType>();
                }
            }
            else {
                reflect::get<I>(obj) = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace ReflectSerializer
