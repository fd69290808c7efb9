#ifndef __MT_JSON_LIB_HPP__
#define __MT_JSON_LIB_HPP__

#include "nlohmann/json.hpp"

/** @brief Session dumps and debugging state are written as `json`. */
using json = nlohmann::json;

#endif  // __MT_JSON_LIB_HPP__
