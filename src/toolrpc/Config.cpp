//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: ServerConfig parsing and validation
//==========================================================================================================

#include <algorithm>
#include <array>
#include <cctype>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolrpc/Config.h"
#include "toolrpc/errors/Errors.h"
#include "toolrpc/version.h"

namespace toolrpc {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::uint64_t requireUnsigned(const std::string& key, const std::string& value) {
    std::uint64_t v = 0;
    if (!ParseUnsigned(value, v)) {
        throw errors::ConfigurationError("Invalid value for '" + key + "': " + value);
    }
    return v;
}

bool isHttpUri(const std::string& s) {
    return s.rfind("http://", 0) == 0 || s.rfind("https://", 0) == 0;
}

struct EnvBinding {
    const char* env;
    const char* key;
};

constexpr std::array<EnvBinding, 13> kEnvBindings = {{
    {"TOOLRPC_SERVER_NAME", "server_name"},
    {"TOOLRPC_SERVER_VERSION", "server_version"},
    {"TOOLRPC_TRANSPORT", "transport"},
    {"TOOLRPC_USE_CONTENT_LENGTH", "content_length"},
    {"TOOLRPC_MAX_MESSAGE_BYTES", "max_message_bytes"},
    {"TOOLRPC_FRAME_TIMEOUT_MS", "frame_timeout_ms"},
    {"TOOLRPC_CANCELLATION_CAPACITY", "cancellation_capacity"},
    {"TOOLRPC_BATCH_MAX_SIZE", "batch_max_size"},
    {"TOOLRPC_BATCH_CONCURRENCY", "batch_concurrency"},
    {"TOOLRPC_CATALOG", "catalog"},
    {"TOOLRPC_LOG_LEVEL", "log_level"},
    {"TOOLRPC_LOG_FILE", "log_file"},
    {"TOOLRPC_LOG_FORMAT", "log_format"},
}};

} // namespace

std::vector<std::pair<std::string, std::string>> ParseConfigString(const std::string& config) {
    std::vector<std::pair<std::string, std::string>> out;
    for (std::size_t i = 0; i < config.size();) {
        while (i < config.size() && (config[i] == ';' || config[i] == ' ' || config[i] == '\t')) ++i;
        if (i >= config.size()) break;
        const std::size_t start = i;
        while (i < config.size() && config[i] != ';' && config[i] != ' ' && config[i] != '\t') ++i;
        const std::string token = config.substr(start, i - start);
        const auto eq = token.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        out.emplace_back(token.substr(0, eq), token.substr(eq + 1));
    }
    return out;
}

bool ParseUnsigned(const std::string& text, std::uint64_t& out) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return false;
    }
    try {
        std::size_t pos = 0;
        const unsigned long long v = std::stoull(text, &pos, 10);
        if (pos != text.size()) return false;
        out = static_cast<std::uint64_t>(v);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool ParseBool(const std::string& text, bool& out) {
    const std::string s = lower(text);
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}

void ServerConfig::Set(const std::string& key, const std::string& value) {
    if (key == "server_name") {
        serverName = value;
    } else if (key == "server_version") {
        serverVersion = value;
    } else if (key == "transport") {
        transport = value;
    } else if (key == "content_length") {
        bool v = false;
        if (!ParseBool(value, v)) {
            throw errors::ConfigurationError("Invalid value for 'content_length': " + value);
        }
        framing = v ? FramingMode::ContentLength : FramingMode::Newline;
    } else if (key == "max_message_bytes") {
        maxMessageBytes = static_cast<std::size_t>(requireUnsigned(key, value));
    } else if (key == "frame_timeout_ms") {
        frameTimeoutMs = requireUnsigned(key, value);
    } else if (key == "cancellation_capacity") {
        cancellationCapacity = static_cast<std::size_t>(requireUnsigned(key, value));
    } else if (key == "batch_max_size") {
        batchMaxSize = static_cast<std::size_t>(requireUnsigned(key, value));
    } else if (key == "batch_concurrency") {
        batchConcurrency = static_cast<std::size_t>(requireUnsigned(key, value));
    } else if (key == "catalog") {
        catalogPath = value;
    } else if (key == "log_level") {
        logLevel = lower(value);
    } else if (key == "log_file") {
        logFile = value;
    } else if (key == "log_format") {
        logFormat = lower(value);
    } else {
        throw errors::ConfigurationError("Unknown configuration key: " + key);
    }
}

void ServerConfig::ApplyConfigString(const std::string& config) {
    for (const auto& [key, value] : ParseConfigString(config)) {
        Set(key, value);
    }
}

ServerConfig ServerConfig::FromEnvironment() {
    ServerConfig cfg;
    for (const auto& b : kEnvBindings) {
        const std::string v = GetEnvOrDefault(b.env, "");
        if (!v.empty()) {
            cfg.Set(b.key, v);
        }
    }
    return cfg;
}

void ServerConfig::Validate() const {
    if (serverName.empty()) {
        throw errors::ConfigurationError("server_name must not be empty");
    }
    if (transport != "stdio" && !isHttpUri(transport)) {
        throw errors::ConfigurationError("transport must be 'stdio' or an http(s):// URI, got: " + transport);
    }
    if (maxMessageBytes == 0) {
        throw errors::ConfigurationError("max_message_bytes must be greater than 0");
    }
    if (frameTimeoutMs == 0) {
        throw errors::ConfigurationError("frame_timeout_ms must be greater than 0");
    }
    if (cancellationCapacity == 0) {
        throw errors::ConfigurationError("cancellation_capacity must be greater than 0");
    }
    if (batchMaxSize == 0) {
        throw errors::ConfigurationError("batch_max_size must be greater than 0");
    }
    if (batchConcurrency == 0) {
        throw errors::ConfigurationError("batch_concurrency must be greater than 0");
    }
    static const std::array<const char*, 6> levels = {"debug", "info", "warn", "warning", "error", "fatal"};
    if (std::find(levels.begin(), levels.end(), logLevel) == levels.end()) {
        throw errors::ConfigurationError("log_level must be one of debug, info, warn, error, fatal; got: " + logLevel);
    }
    if (logFormat != "text" && logFormat != "json") {
        throw errors::ConfigurationError("log_format must be 'text' or 'json', got: " + logFormat);
    }
}

void ServerConfig::ApplyLogging() const {
    Logger::setLogLevel(Logger::levelFromString(logLevel));
    Logger::setLogFormat(Logger::formatFromString(logFormat));
    if (!logFile.empty()) {
        Logger::setLogFile(logFile);
    }
}

std::string ServerConfig::EffectiveServerVersion() const {
    return serverVersion.empty() ? getVersionString() : serverVersion;
}

} // namespace toolrpc
