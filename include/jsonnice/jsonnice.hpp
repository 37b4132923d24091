#pragma once

// Debug-session bridge: protocol server and interactive REPL

#include "error.hpp"
#include "log.hpp"
#include "options.hpp"
#include "parallel/queue.hpp"
#include "parallel/scheduler.hpp"
#include "debugger/engine.hpp"
#include "debugger/line_engine.hpp"
#include "dap/protocol.hpp"
#include "dap/request.hpp"
#include "dap/transport.hpp"
#include "dap/output_writer.hpp"
#include "dap/session.hpp"
#include "dap/server.hpp"
#include "repl/repl_session.hpp"
#include "signal.hpp"
