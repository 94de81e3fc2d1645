/** \file
 *
 * \brief Definition of JSON serialization utilities
 */

#include "messaging/JsonSerializer.hh"
#include "messaging/SerializationFailureException.hh"

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

#ifndef MESSAGING_JSONSERIALIZERUTILITY_HH_
#define MESSAGING_JSONSERIALIZERUTILITY_HH_

namespace nlohmann {

/** \brief JSON converter for optional types
 */
template<typename T>
struct adl_serializer<std::optional<T>>
{
    /** \brief Convert optional type to JSON
     */
    static void to_json(json&, const std::optional<T>&);

    /** \brief Convert JSON to optional type
     */
    static void from_json(const json&, std::optional<T>&);
};

template<typename T>
void adl_serializer<std::optional<T>>::to_json(
    json& j, const std::optional<T>& t)
{
    if (t) {
        j = *t;
    } else {
        j = nullptr;
    }
}

template<typename T>
void adl_serializer<std::optional<T>>::from_json(
    const json& j, std::optional<T>& t)
{
    if (j.is_null()) {
        t = std::nullopt;
    } else {
        t = j.get<T>();
    }
}

}

namespace Coup {
namespace Messaging {

/** \brief Convert enumeration to JSON string
 *
 * \param e the enumeration
 * \param map the left view of a bimap from the enumeration to its name
 *
 * \return JSON string containing the name of \p e
 *
 * \throw SerializationFailureException if \p e is not in \p map
 */
template<typename Enum, typename Map>
nlohmann::json enumToJson(const Enum e, const Map& map)
{
    const auto iter = map.find(e);
    if (iter == map.end()) {
        throw SerializationFailureException {};
    }
    return iter->second;
}

/** \brief Convert JSON string to enumeration
 *
 * \param j the JSON string
 * \param map the right view of a bimap from the enumeration to its name
 *
 * \return the enumeration named by \p j
 *
 * \throw SerializationFailureException if \p j is not a string naming an
 * enumeration in \p map
 */
template<typename Enum, typename Map>
Enum jsonToEnum(const nlohmann::json& j, const Map& map)
{
    if (!j.is_string()) {
        throw SerializationFailureException {};
    }
    const auto iter = map.find(j.get<std::string>());
    if (iter == map.end()) {
        throw SerializationFailureException {};
    }
    return iter->second;
}

/** \brief Convert JSON integer to an integer type
 *
 * Unlike \c get<Integer>(), booleans and floating point numbers are not
 * accepted, and values outside the range of \p Integer are not narrowed.
 *
 * \param j the JSON integer
 *
 * \return the value of \p j
 *
 * \throw SerializationFailureException if \p j is not an integer
 * representable as \p Integer
 */
template<std::integral Integer>
Integer jsonToInteger(const nlohmann::json& j)
{
    if (j.is_number_unsigned()) {
        const auto value = j.get<std::uint64_t>();
        if (std::in_range<Integer>(value)) {
            return static_cast<Integer>(value);
        }
    } else if (j.is_number_integer()) {
        const auto value = j.get<std::int64_t>();
        if (std::in_range<Integer>(value)) {
            return static_cast<Integer>(value);
        }
    }
    throw SerializationFailureException {};
}

/** \brief Validate a deserialized value
 *
 * This function is intended to be used for an deserialized object when
 * additional validation is needed.
 *
 * \tparam Preds Predicates that can be invoked with \p t and whose return value
 * is convertible to bool.
 *
 * \param t the object to validate
 * \param preds the predicates used to validate \p t
 *
 * \return the object \p t if all predicates evaluate to true
 *
 * \throw SerializationFailureException if any predicate evaluates to false
 */
template<typename T, typename... Preds>
T validate(T&& t, Preds&&... preds)
{
    if ( ( ... && std::invoke(std::forward<Preds>(preds), t) ) ) {
        return t;
    }
    throw SerializationFailureException {};
}

/** \brief Convert JSON to object, ignoring errors
 *
 * This function tries to convert JSON object to an object of type \c T, except
 * it catches any exceptions and returns empty value instead on error.
 *
 * \param j the JSON object to covert
 *
 * \return \p j converted to object of type \c T, or none if exception is thrown
 * while converting
 */
template<typename T>
std::optional<T> tryFromJson(const nlohmann::json& j)
{
    try {
        return j.get<T>();
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}
}

#endif // MESSAGING_JSONSERIALIZERUTILITY_HH_
