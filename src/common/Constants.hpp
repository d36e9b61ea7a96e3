#pragma once

#include <cstddef>

namespace hostbridge {

    // Host channel
    inline constexpr std::size_t MAX_MESSAGE_SIZE          = 1024 * 1024; // 1 MiB per line
    inline constexpr int         HOST_CONNECT_TIMEOUT_MS   = 1000;

    // Operation timeouts
    inline constexpr int API_REQUEST_TIMEOUT_MS  = 5000;
    inline constexpr int DIALOG_TIMEOUT_MS       = 60 * 1000;
    inline constexpr int DIALOG_POLL_INTERVAL_MS = 50;
    inline constexpr int DIALOG_MAX_ATTEMPTS     = 100; // helper default: 5 seconds at 50 ms

    // Request defaults
    inline constexpr const char* DEFAULT_SESSION_ID   = "desktop-session";
    inline constexpr const char* DEFAULT_CONTENT_TYPE = "application/json";
    inline constexpr const char* DEFAULT_OK_TEXT      = "OK";
    inline constexpr const char* DEFAULT_CANCEL_TEXT  = "Cancel";

} // namespace hostbridge
