/*
 * warden C++17 - JSON value type
 *
 * Tool arguments, tool results and the wire envelope are all JSON values.
 */
#ifndef warden_CORE_JSON_HPP
#define warden_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace warden {

typedef nlohmann::json Json;

} // namespace warden

#endif // warden_CORE_JSON_HPP
