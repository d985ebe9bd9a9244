#pragma once

#include "reflect.h"

#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * Generic reflection-based JSON serialization for aggregate types.
 *
 * Uses qlibs/reflect for compile-time introspection and nlohmann/json
 * for JSON generation. Enums are written by enumerator name, empty optionals
 * are omitted, and keys missing from the input keep the aggregate's defaults.
 *
 * Example:
 *   struct Limits { int stepLimit = 1000; std::optional<double> threshold; };
 *   auto j = ReflectSerializer::to_json(Limits{});
 *   auto limits = ReflectSerializer::from_json<Limits>(j);
 */
namespace StackEvo::ReflectSerializer {

template <typename T>
struct is_optional : std::false_type {};
template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};
template <typename T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template <typename EnumType>
EnumType enumFromName(const std::string& str)
{
    for (const auto& [enumValue, enumName] : reflect::enumerators<EnumType>) {
        if (enumName == str) {
            return static_cast<EnumType>(enumValue);
        }
    }
    throw std::runtime_error("Invalid enum value: " + str);
}

/**
 * Serialize any aggregate type to nlohmann::json.
 */
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
                    using InnerType = typename MemberType::value_type;
                    if constexpr (std::is_enum_v<InnerType>) {
                        j[name] = std::string(reflect::enum_name(*value));
                    }
                    else {
                        j[name] = *value;
                    }
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                j[name] = std::string(reflect::enum_name(value));
            }
            else {
                j[name] = value;
            }
        },
        obj);

    return j;
}

/**
 * Deserialize nlohmann::json to any aggregate type.
 * Throws nlohmann::json::exception or std::runtime_error on type mismatches.
 */
template <typename T>
T from_json(const nlohmann::json& j)
{
    T obj{};

    reflect::for_each(
        [&](auto I) {
            auto name = std::string(reflect::member_name<I>(obj));
            if (!j.contains(name)) {
                return;
            }

            using MemberType = std::remove_reference_t<decltype(reflect::get<I>(obj))>;

            if constexpr (is_optional_v<MemberType>) {
                if (j[name].is_null()) {
                    reflect::get<I>(obj).reset();
                    return;
                }
                using InnerType = typename MemberType::value_type;
                if constexpr (std::is_enum_v<InnerType>) {
                    reflect::get<I>(obj) = enumFromName<InnerType>(j[name].get<std::string>());
                }
                else {
                    reflect::get<I>(obj) = j[name].get<InnerType>();
                }
            }
            else if constexpr (std::is_enum_v<MemberType>) {
                reflect::get<I>(obj) = enumFromName<MemberType>(j[name].get<std::string>());
            }
            else {
                reflect::get<I>(obj) = j[name].get<MemberType>();
            }
        },
        obj);

    return obj;
}

} // namespace StackEvo::ReflectSerializer
