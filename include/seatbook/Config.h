#pragma once
#include <string>

namespace seatbook {

// Service config (load from seatbook.yml)
struct ServiceConfig {
    // ===================== fields ===================== //

    // storage
    std::string db_path          = "out/seatbook.db";
    int         busy_timeout_ms  = 5000;       // wait on another process holding the write lock

    // booking rules
    int  max_transaction_retries    = 3;       // transient store conflicts only
    int  retry_backoff_ms           = 25;      // linear: attempt * backoff
    bool forbid_same_day            = true;    // no booking / event creation for today
    bool admin_override_after_close = true;    // admins may still book once registration closed

    // inventory
    int seat_price = 200;

    // listings
    int recent_window_days = 7;

    // notifications
    std::string notifications_jsonl = "runtime/notifications.jsonl";
    std::string roster_recipient;              // owner address attached to roster messages

    // websocket hub
    std::string ws_host = "127.0.0.1";
    int         ws_port = 12345;
    bool        ws_admin_loopback_only = true; // "hello" as admin honoured only from 127.0.0.1 / ::1

    // upper bound on the summed backoff of one booking
    static constexpr int kMaxRetrySleepMs = 2000;

    // ===================== methods ===================== //

    static ServiceConfig fromYaml(const std::string& yaml_path);
    static ServiceConfig fromJson(const std::string& json_path);

    // Throws std::invalid_argument on out-of-range values
    void validate() const;

    // Whether a websocket client may take the admin role
    bool adminRoleAllowed(bool peer_is_loopback) const {
        return peer_is_loopback || !ws_admin_loopback_only;
    }
};

} // namespace seatbook
