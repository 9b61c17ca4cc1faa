/**
 * @file Serializer.hpp
 * @brief Writes an object graph in the TOML grammar
 *
 * The shape of a type is described by its nlohmann::json schema
 * (to_json / NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE), not discovered at
 * runtime. Members are classified from the JSON value:
 * - string, boolean, integer, float → "key = literal"
 * - array of scalars (or of arrays) → "key = [a, b]"
 * - object → sub-group "[root.key]"
 * - null → skipped
 *
 * Scalars are written first, then arrays, then sub-groups. Arrays that
 * contain objects are rejected.
 *
 * Example:
 * ```cpp
 * struct Endpoint { std::string ip; int port; };
 * NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Endpoint, ip, port)
 *
 * Serializer::write(Endpoint{"10.0.0.1", 8080}, "server", std::cout);
 * // [server]
 * // ip = "10.0.0.1"
 * // port = 8080
 * ```
 */

#ifndef TOMLET_SERIALIZER_HPP
#define TOMLET_SERIALIZER_HPP

#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace tomlet {

class Serializer {
public:
    /**
     * @brief Serialize a value through its JSON schema
     * @param value Object to write; must convert to a JSON object
     * @param root_key_group Group header for the top level ("" for none);
     *        surrounding '[', ']' and '.' are trimmed
     * @param out Destination stream
     * @throws SerializeError for unsupported shapes
     */
    template <typename T>
    static void write(const T& value, const std::string& root_key_group, std::ostream& out) {
        const nlohmann::json object = value;
        write_json(object, root_key_group, out);
    }

    /**
     * @brief Serialize a JSON object
     * @throws SerializeError if object is not an object, an array holds
     *         an object or null, a key is not a valid identifier, or a
     *         float is not finite
     */
    static void write_json(const nlohmann::json& object, const std::string& root_key_group,
                           std::ostream& out);

    /**
     * @brief Serialize a JSON object into a string
     */
    static std::string to_string(const nlohmann::json& object,
                                 const std::string& root_key_group = "");

    /**
     * @brief Literal text for one scalar or array value
     * @param value JSON scalar or array
     * @param path Full key, used in error messages
     */
    static std::string literal(const nlohmann::json& value, const std::string& path);

    /**
     * @brief Float literal that always has a '.' and never an exponent
     */
    static std::string format_float(double value, const std::string& path);

private:
    static std::string trim_key_group(const std::string& key_group);
};

} // namespace tomlet

#endif // TOMLET_SERIALIZER_HPP
