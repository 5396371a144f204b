#pragma once
/**
 * @file zmq_context.hpp
 * @brief Process-wide ZeroMQ context, managed as a lifecycle module.
 *
 * All sockets in the process are created from the one context returned by
 * get_zmq_context(). Register GetZMQContextModule() with the LifecycleGuard;
 * it depends on the Logger module and is shut down before it.
 */
#include "irbridge_utils_export.h"
#include "utils/module_def.hpp"

#include <zmq.hpp>

namespace irbridge
{

/**
 * @brief Returns the process-wide context.
 * @throws std::logic_error if the ZMQContext module has not been started.
 */
IRBRIDGE_UTILS_EXPORT zmq::context_t &get_zmq_context();

/// Creates the context. Idempotent.
IRBRIDGE_UTILS_EXPORT void zmq_context_startup();

/// Destroys the context. Idempotent. All sockets must be closed first.
IRBRIDGE_UTILS_EXPORT void zmq_context_shutdown();

IRBRIDGE_UTILS_EXPORT utils::ModuleDef GetZMQContextModule();

} // namespace irbridge
