#pragma once

#include <pipecoro/config.hpp>
#include <pipecoro/duplex_connection.hpp>
#include <pipecoro/error.hpp>
#include <pipecoro/error_info.hpp>
#include <pipecoro/expected.hpp>
#include <pipecoro/flush_strategy.hpp>
#include <pipecoro/logger.hpp>
#include <pipecoro/memory_connection.hpp>
#include <pipecoro/pipelined_connection.hpp>
#include <pipecoro/stream.hpp>
#include <pipecoro/tracing.hpp>
