#pragma once

/**
 * Portico bridge library
 *
 * Main include file - includes all public headers.
 */

// Error types
#include "errors.hpp"

// Structured logging
#include "logging.hpp"

// Helper utilities
#include "helpers.hpp"

// Change events and their cleanup
#include "change_event.hpp"
#include "sanitizer.hpp"

// Record -> request translation
#include "translator.hpp"

// Engine transports
#include "framing.hpp"
#include "transport.hpp"
#include "connection_manager.hpp"

// Outcomes and write-back
#include "response_handler.hpp"

// Pipeline
#include "worker_pool.hpp"
#include "ingress.hpp"

// Startup settings
#include "config.hpp"
