#pragma once

/// Umbrella header for the lspc language server client library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "framer.hpp"
#include "pending_requests.hpp"
#include "router.hpp"
#include "process.hpp"
#include "session.hpp"
#include "text_document.hpp"
#include "transport/transport.hpp"
#include "transport/stdio_transport.hpp"
