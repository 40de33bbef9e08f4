#pragma once

#include "tvremote/core/constants.hpp"
#include "tvremote/core/failures.hpp"
#include "tvremote/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tvremote::configuration {

/// How this client introduces itself in the device-info message.
///
/// The device shows `name` in its list of connected remotes. The unique
/// identifier it keys per-client state on is the pairing identifier.
struct ClientIdentity {
    std::string name = "tvremote";
    std::string localized_model_name = "iPhone";
    std::string system_build_version = "18M391";
    std::string bundle_identifier = "com.apple.TVRemote";
    std::string bundle_version = "344.28";
    std::string media_application = "com.apple.TVMusic";
    int32_t protocol_version = 1;
    uint32_t last_supported_message_type = 108;
    uint32_t shared_queue_version = 2;
};

/// Timing and limits for one protocol session
///
/// All durations are per operation:
/// - request_timeout bounds a single send-and-receive round trip
/// - connect_timeout bounds the TCP connect
/// - heartbeat_interval is the idle period between keep-alive requests;
///   a heartbeat is retried heartbeat_retries times before the connection
///   is declared dead
/// - initial_state_wait is how long connect waits, best effort, for the
///   first now-playing push before reporting success anyway
///
/// @example
/// ```cpp
/// auto config = SessionConfig::Default();
/// config.identity.name = "Living room remote";
/// if (config.Validate().IsErr()) { ... }
/// ```
class SessionConfig {
public:
    static SessionConfig Default() {
        return SessionConfig{};
    }

    /// Short timeouts and no heartbeat, for loopback peers.
    static SessionConfig ForTesting() {
        SessionConfig config;
        config.request_timeout = std::chrono::milliseconds{500};
        config.connect_timeout = std::chrono::milliseconds{1000};
        config.heartbeat_interval = std::chrono::milliseconds{0};
        config.initial_state_wait = std::chrono::milliseconds{100};
        return config;
    }

    [[nodiscard]] bool HeartbeatEnabled() const noexcept {
        return heartbeat_interval.count() > 0;
    }

    [[nodiscard]] Result<Unit, RemoteFailure> Validate() const {
        if (request_timeout.count() <= 0 || connect_timeout.count() <= 0) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Timeouts must be positive"));
        }
        if (max_frame_bytes == 0) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Maximum frame size must be positive"));
        }
        if (identity.name.empty() || identity.system_build_version.empty()) {
            return Result<Unit, RemoteFailure>::Err(
                RemoteFailure::InvalidInput("Client name and build version are required"));
        }
        return Result<Unit, RemoteFailure>::Ok(unit);
    }

    std::chrono::milliseconds request_timeout = kDefaultRequestTimeout;
    std::chrono::milliseconds connect_timeout = kDefaultConnectTimeout;
    std::chrono::milliseconds heartbeat_interval = kDefaultHeartbeatInterval;
    uint32_t heartbeat_retries = kDefaultHeartbeatRetries;
    std::chrono::milliseconds initial_state_wait = kDefaultInitialStateWait;
    size_t max_frame_bytes = kDefaultMaxFrameBytes;
    ClientIdentity identity{};
};

}  // namespace tvremote::configuration
