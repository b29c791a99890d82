#pragma once

/// Umbrella header for the ssh-mcp dispatcher library.

#include "version.hpp"
#include "error.hpp"
#include "types.hpp"
#include "logging.hpp"
#include "codec.hpp"
#include "descriptor.hpp"
#include "registry.hpp"
#include "sandbox.hpp"
#include "response.hpp"
#include "request_log.hpp"
#include "meta_tools.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "cli.hpp"
