#pragma once
/**
 * @file irb_base.hpp
 * @brief Layer 1: formatting helpers, Result and the lifecycle module definition.
 *
 * Include this when you need formatting or error-result types without the
 * services (logger, ZeroMQ context).
 */
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"
#include "utils/result.hpp"
