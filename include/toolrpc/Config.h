//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration from defaults, TOOLRPC_* environment variables and config strings
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "toolrpc/ContentFramer.h"
#include "toolrpc/Protocol.h"

namespace toolrpc {

//==========================================================================================================
// ParseConfigString
// Purpose: Splits "key=value;key=value" into ordered pairs. Separators are ';', space and tab; tokens
//          without '=' are skipped. Shared by ServerConfig and the transport factories.
//==========================================================================================================
std::vector<std::pair<std::string, std::string>> ParseConfigString(const std::string& config);

// Strict unsigned parse of a whole string. Returns false for empty, signed or trailing characters.
bool ParseUnsigned(const std::string& text, std::uint64_t& out);

// "1"/"true"/"yes"/"on" and "0"/"false"/"no"/"off" (case-insensitive). Returns false for anything else.
bool ParseBool(const std::string& text, bool& out);

struct ServerConfig {
    std::string serverName{"toolrpc-server"};
    std::string serverVersion;                      // empty = library version
    std::string transport{"stdio"};                 // "stdio" or an http(s):// URI
    FramingMode framing{FramingMode::Newline};
    std::size_t maxMessageBytes{DEFAULT_MAX_MESSAGE_SIZE};
    std::uint64_t frameTimeoutMs{30000};
    std::size_t cancellationCapacity{DEFAULT_CANCELLATION_CAPACITY};
    std::size_t batchMaxSize{100};
    std::size_t batchConcurrency{10};
    std::string catalogPath;
    std::string logLevel{"info"};
    std::string logFile;
    std::string logFormat{"text"};

    //======================================================================================================
    // FromEnvironment
    // Purpose: Defaults overlaid with TOOLRPC_SERVER_NAME, TOOLRPC_SERVER_VERSION, TOOLRPC_TRANSPORT,
    //          TOOLRPC_USE_CONTENT_LENGTH, TOOLRPC_MAX_MESSAGE_BYTES, TOOLRPC_FRAME_TIMEOUT_MS,
    //          TOOLRPC_CANCELLATION_CAPACITY, TOOLRPC_BATCH_MAX_SIZE, TOOLRPC_BATCH_CONCURRENCY,
    //          TOOLRPC_CATALOG, TOOLRPC_LOG_LEVEL, TOOLRPC_LOG_FILE and TOOLRPC_LOG_FORMAT.
    // Throws:
    //   errors::ConfigurationError when a set variable has an invalid value.
    //======================================================================================================
    static ServerConfig FromEnvironment();

    // Applies one key: server_name, server_version, transport, content_length, max_message_bytes,
    // frame_timeout_ms, cancellation_capacity, batch_max_size, batch_concurrency, catalog, log_level,
    // log_file, log_format. Throws errors::ConfigurationError for unknown keys or invalid values.
    void Set(const std::string& key, const std::string& value);

    // Applies every pair of a "key=value;..." string in order.
    void ApplyConfigString(const std::string& config);

    // Throws errors::ConfigurationError naming the first invalid field.
    void Validate() const;

    // Pushes level, format and file to the Logger.
    void ApplyLogging() const;

    std::string EffectiveServerVersion() const;
};

} // namespace toolrpc
