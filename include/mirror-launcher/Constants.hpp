#pragma once

namespace mirror_launcher {

constexpr int DEVICE_LIST_TIMEOUT = 10000;   // ms
constexpr int PROPERTY_TIMEOUT = 5000;       // ms
constexpr int IP_ROUTE_TIMEOUT = 10000;      // ms
constexpr int TCPIP_TIMEOUT = 10000;         // ms
constexpr int CONNECT_TIMEOUT = 15000;       // ms
constexpr int DISCONNECT_TIMEOUT = 10000;    // ms

constexpr int REFRESH_DEBOUNCE = 1000;       // ms
constexpr int TRACK_RETRY_NOT_FOUND = 5000;  // ms
constexpr int TRACK_RETRY_ERROR = 2000;      // ms
constexpr int TRACK_READ_SLICE = 250;        // ms
constexpr int SILENT_POLL_INTERVAL = 500;    // ms
constexpr int EXIT_GRACE_DELAY = 500;        // ms
constexpr int TCPIP_RESTART_DELAY = 2000;    // ms
constexpr int RESCAN_AFTER_CONNECT = 500;    // ms
constexpr int INITIAL_SCAN_DELAY = 100;      // ms
constexpr int ONBOARDING_DELAY = 1000;       // ms

constexpr int WIRELESS_PORT = 5555;
constexpr int DEFAULT_HOST_RAM_GB = 8;
constexpr int MIN_BITRATE_MBPS = 4;
constexpr int MAX_BITRATE_MBPS = 40;
constexpr int HIGH_TIER_MIN_DIMENSION = 2500; // px, exclusive
constexpr int HIGH_TIER_MIN_RAM_GB = 16;
constexpr int TOP_RIGHT_WINDOW_MARGIN = 500;  // px from the right screen edge
constexpr int WINDOW_CORNER_OFFSET = 50;      // px

namespace ErrorCodes {
    constexpr int SUCCESS = 0;
    constexpr int TOOL_NOT_FOUND = -1;
    constexpr int LAUNCH_FAILED = -2;
    constexpr int SESSION_ACTIVE = -3;
    constexpr int INVALID_DEVICE = -4;
}

}
