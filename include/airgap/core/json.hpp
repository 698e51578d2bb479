/*
 * AirGap C++ - JSON type
 *
 * Single alias for the JSON document type used by config, audit records
 * and tool framing.
 */
#ifndef airgap_CORE_JSON_HPP
#define airgap_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace airgap {

typedef nlohmann::json Json;

} // namespace airgap

#endif // airgap_CORE_JSON_HPP
