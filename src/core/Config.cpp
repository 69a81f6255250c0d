#include "seatbook/Config.h"
#include "seatbook/log.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>

using nlohmann::json;

namespace seatbook {

static void try_get(const YAML::Node& n, const char* key, std::string& v) { if (n && n[key]) v = n[key].as<std::string>(); }
static void try_get(const YAML::Node& n, const char* key, int& v)         { if (n && n[key]) v = n[key].as<int>(); }
static void try_get(const YAML::Node& n, const char* key, bool& v)        { if (n && n[key]) v = n[key].as<bool>(); }

static void try_get(const json& j, const char* key, std::string& v) { if (j.contains(key)) v = j.at(key).get<std::string>(); }
static void try_get(const json& j, const char* key, int& v)         { if (j.contains(key)) v = j.at(key).get<int>(); }
static void try_get(const json& j, const char* key, bool& v)        { if (j.contains(key)) v = j.at(key).get<bool>(); }

ServiceConfig ServiceConfig::fromYaml(const std::string& yaml_path) {
    ServiceConfig c;
    if (!std::filesystem::exists(yaml_path)) {
        log::warn("config", "Config file not found, using defaults", {{"path", yaml_path}});
        return c;
    }

    try {
        YAML::Node r = YAML::LoadFile(yaml_path);

        const YAML::Node database = r["database"];
        try_get(database, "path",            c.db_path);
        try_get(database, "busy_timeout_ms", c.busy_timeout_ms);

        const YAML::Node booking = r["booking"];
        try_get(booking, "max_transaction_retries",    c.max_transaction_retries);
        try_get(booking, "retry_backoff_ms",           c.retry_backoff_ms);
        try_get(booking, "forbid_same_day",            c.forbid_same_day);
        try_get(booking, "admin_override_after_close", c.admin_override_after_close);

        try_get(r["seats"],  "price",              c.seat_price);
        try_get(r["events"], "recent_window_days", c.recent_window_days);

        const YAML::Node notify = r["notify"];
        try_get(notify, "jsonl_path",       c.notifications_jsonl);
        try_get(notify, "roster_recipient", c.roster_recipient);

        const YAML::Node ws = r["ws"];
        try_get(ws, "host", c.ws_host);
        try_get(ws, "port", c.ws_port);
        try_get(ws, "admin_loopback_only", c.ws_admin_loopback_only);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config " + yaml_path + ": " + e.what());
    }

    c.validate();
    return c;
}

ServiceConfig ServiceConfig::fromJson(const std::string& json_path) {
    ServiceConfig c;
    std::ifstream in(json_path);
    if (!in.is_open()) {
        log::warn("config", "Config file not found, using defaults", {{"path", json_path}});
        return c;
    }

    try {
        json r = json::parse(in);
        const json empty = json::object();

        const json& database = r.contains("database") ? r.at("database") : empty;
        try_get(database, "path",            c.db_path);
        try_get(database, "busy_timeout_ms", c.busy_timeout_ms);

        const json& booking = r.contains("booking") ? r.at("booking") : empty;
        try_get(booking, "max_transaction_retries",    c.max_transaction_retries);
        try_get(booking, "retry_backoff_ms",           c.retry_backoff_ms);
        try_get(booking, "forbid_same_day",            c.forbid_same_day);
        try_get(booking, "admin_override_after_close", c.admin_override_after_close);

        if (r.contains("seats"))  try_get(r.at("seats"),  "price",              c.seat_price);
        if (r.contains("events")) try_get(r.at("events"), "recent_window_days", c.recent_window_days);

        const json& notify = r.contains("notify") ? r.at("notify") : empty;
        try_get(notify, "jsonl_path",       c.notifications_jsonl);
        try_get(notify, "roster_recipient", c.roster_recipient);

        const json& ws = r.contains("ws") ? r.at("ws") : empty;
        try_get(ws, "host", c.ws_host);
        try_get(ws, "port", c.ws_port);
        try_get(ws, "admin_loopback_only", c.ws_admin_loopback_only);
    } catch (const json::exception& e) {
        throw std::runtime_error("Failed to load config " + json_path + ": " + e.what());
    }

    c.validate();
    return c;
}

void ServiceConfig::validate() const {
    if (db_path.empty())             throw std::invalid_argument("database.path must not be empty");
    if (busy_timeout_ms < 0)         throw std::invalid_argument("database.busy_timeout_ms must be >= 0");
    if (max_transaction_retries < 0) throw std::invalid_argument("booking.max_transaction_retries must be >= 0");
    if (retry_backoff_ms < 0)        throw std::invalid_argument("booking.retry_backoff_ms must be >= 0");
    // Retries sleep on the caller's thread (the hub's event loop)
    if (static_cast<long long>(retry_backoff_ms) * max_transaction_retries * (max_transaction_retries + 1) / 2 >
        kMaxRetrySleepMs) {
        throw std::invalid_argument("booking retry backoff exceeds " + std::to_string(kMaxRetrySleepMs) +
                                    " ms in total");
    }
    if (seat_price < 0)              throw std::invalid_argument("seats.price must be >= 0");
    if (recent_window_days < 0)      throw std::invalid_argument("events.recent_window_days must be >= 0");
    if (ws_port <= 0 || ws_port > 65535) throw std::invalid_argument("ws.port out of range");
}

} // namespace seatbook
