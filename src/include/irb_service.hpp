#pragma once
/**
 * @file irb_service.hpp
 * @brief Layer 2: process services built on irb_base.
 *
 * Logger, LifecycleManager / LifecycleGuard and the process-wide ZeroMQ context.
 */
#include "irb_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
#include "utils/zmq_context.hpp"
