#ifndef sandkernel_CORE_JSON_HPP
#define sandkernel_CORE_JSON_HPP

#include <nlohmann/json.hpp>

namespace sandkernel {

typedef nlohmann::json Json;

} // namespace sandkernel

#endif // sandkernel_CORE_JSON_HPP
