#pragma once

/**
 * @file log.hpp
 * @brief Diagnostic logging for protocol state and key material.
 *
 * Debug output (frames, handshake steps, derived keys) is compiled in only
 * with TVREMOTE_DEBUG_PROTOCOL and goes to stdout. It prints session keys:
 * never enable it in production builds.
 *
 * Warnings are always compiled in and go to stderr.
 *
 * Enable via CMake: -DTVREMOTE_DEBUG_PROTOCOL=ON
 */

#include <cstdint>
#include <cstdio>
#include <span>
#include <string>
#include <string_view>

namespace tvremote::debug {

inline std::string ToHex(std::span<const uint8_t> data, size_t max_bytes = 64) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const size_t shown = data.size() < max_bytes ? data.size() : max_bytes;
    std::string result;
    result.reserve(shown * 2 + 24);
    for (size_t i = 0; i < shown; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    if (shown < data.size()) {
        result += "...(" + std::to_string(data.size()) + " bytes)";
    }
    return result;
}

inline std::string ToText(std::string_view text) { return std::string(text); }
inline std::string ToText(const std::string& text) { return text; }
inline std::string ToText(const char* text) { return std::string(text); }

// ============================================================================
// Always-on warnings
// ============================================================================

#define TVREMOTE_LOG_WARN(component, message) \
    do { \
        fprintf(stderr, "[TVREMOTE-WARN] %s: %s\n", \
            component, \
            ::tvremote::debug::ToText(message).c_str()); \
    } while(0)

#ifdef TVREMOTE_DEBUG_PROTOCOL

// ============================================================================
// Debug tracing
// ============================================================================

#define TVREMOTE_LOG_MSG(component, message) \
    do { \
        fprintf(stdout, "[TVREMOTE-DEBUG] %s %s\n", \
            component, \
            ::tvremote::debug::ToText(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define TVREMOTE_LOG_VALUE(component, name, value) \
    do { \
        fprintf(stdout, "[TVREMOTE-DEBUG] %s %s: %s\n", \
            component, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define TVREMOTE_LOG_BYTES(component, name, data) \
    do { \
        fprintf(stdout, "[TVREMOTE-DEBUG] %s %s: %s\n", \
            component, \
            name, \
            ::tvremote::debug::ToHex(data).c_str()); \
        fflush(stdout); \
    } while(0)

#define TVREMOTE_LOG_SECTION(component, title) \
    do { \
        fprintf(stdout, "[TVREMOTE-DEBUG] %s ========== %s ==========\n", \
            component, \
            title); \
        fflush(stdout); \
    } while(0)

#else // !TVREMOTE_DEBUG_PROTOCOL

#define TVREMOTE_LOG_MSG(component, message) ((void)0)
#define TVREMOTE_LOG_VALUE(component, name, value) ((void)0)
#define TVREMOTE_LOG_BYTES(component, name, data) ((void)0)
#define TVREMOTE_LOG_SECTION(component, title) ((void)0)

#endif // TVREMOTE_DEBUG_PROTOCOL

} // namespace tvremote::debug
