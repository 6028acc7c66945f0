#include "util.hpp"
#include "logging.hpp"
#include "probe_options.hpp"
#include "test_harness.hpp"

using namespace rkprobe;

bool test_parse_host_port() {
    std::string host;
    uint16_t port = 0;
    if (!parse_host_port("10.0.0.5:8089", host, port)) return false;
    if (host != "10.0.0.5" || port != 8089) return false;
    if (parse_host_port("10.0.0.5", host, port)) return false;
    if (parse_host_port(":8089", host, port)) return false;
    if (parse_host_port("h:70000", host, port)) return false;
    return !parse_host_port("h:80x", host, port);
}

bool test_parse_bridge_url() {
    std::string host;
    uint16_t port = 0;
    if (!parse_bridge_url("http://192.168.50.225:8088", host, port)) return false;
    if (host != "192.168.50.225" || port != 8089) return false;
    if (!parse_bridge_url("http://bridge.local", host, port)) return false;
    if (host != "bridge.local" || port != 8089) return false;
    if (!parse_bridge_url("bridge.local:9000/status", host, port)) return false;
    if (host != "bridge.local" || port != 9001) return false;
    if (parse_bridge_url("http://", host, port)) return false;
    return !parse_bridge_url("http://h:65535", host, port);
}

bool test_parse_port() {
    uint16_t port = 0;
    if (!parse_port("8089", port) || port != 8089) return false;
    if (parse_port("0", port)) return false;
    if (parse_port("-1", port)) return false;
    if (parse_port("65536", port)) return false;
    if (parse_port("", port)) return false;
    return !parse_port("80 ", port);
}

bool test_parse_timeout() {
    double t = 0;
    if (!parse_timeout("2.5", t) || t != 2.5) return false;
    if (parse_timeout("0", t)) return false;
    if (parse_timeout("-1", t)) return false;
    if (parse_timeout("inf", t)) return false;
    if (parse_timeout("1e10", t)) return false;
    if (parse_timeout("3600.5", t)) return false;
    if (!parse_timeout("3600", t) || t != 3600.0) return false;
    return !parse_timeout("fast", t);
}

bool test_hex() {
    std::vector<uint8_t> b = {0x00, 0x4B, 0x52, 0xFF};
    if (to_hex(b) != "004b52ff") return false;
    if (!to_hex(std::vector<uint8_t>{}).empty()) return false;
    if (hex_to_bytes("004B52ff") != b) return false;
    if (!hex_to_bytes("abc").empty()) return false;
    return hex_to_bytes("zz").empty();
}

bool test_log_level_from_string() {
    LogLevel lvl = LogLevel::INFO;
    if (!log_level_from_string("DEBUG", lvl) || lvl != LogLevel::DEBUG) return false;
    if (!log_level_from_string("warning", lvl) || lvl != LogLevel::WARN) return false;
    return !log_level_from_string("loud", lvl);
}

bool test_args_defaults() {
    ProbeConfig cfg;
    std::string err;
    if (!parse_probe_args({}, cfg, err)) return false;
    return cfg.host == "192.168.50.225" && cfg.port == 8089 && cfg.zone_id.empty() &&
           cfg.timeout_s == 2.0 && !cfg.broadcast && cfg.log_level == LogLevel::WARN;
}

bool test_args_positionals() {
    ProbeConfig cfg;
    std::string err;
    if (!parse_probe_args({"10.1.1.1", "9999", "zone-7"}, cfg, err)) return false;
    return cfg.host == "10.1.1.1" && cfg.port == 9999 && cfg.zone_id == "zone-7";
}

bool test_args_options_mixed() {
    ProbeConfig cfg;
    std::string err;
    std::vector<std::string> args = {"--timeout", "0.5", "10.1.1.1", "-v",
                                     "--hash", std::string(38, '0') + "ff", "8090"};
    if (!parse_probe_args(args, cfg, err)) return false;
    return cfg.host == "10.1.1.1" && cfg.port == 8090 && cfg.timeout_s == 0.5 &&
           cfg.log_level == LogLevel::DEBUG && cfg.hash[19] == 0xFF && cfg.hash[0] == 0;
}

bool test_args_bridge_url() {
    ProbeConfig cfg;
    std::string err;
    if (!parse_probe_args({"--bridge", "http://bridge.lan:8088"}, cfg, err)) return false;
    return cfg.host == "bridge.lan" && cfg.port == 8089;
}

bool test_args_broadcast() {
    ProbeConfig cfg;
    std::string err;
    if (!parse_probe_args({"--broadcast", "10.0.0.1", "8089", "zone"}, cfg, err)) return false;
    return cfg.broadcast && cfg.host == "255.255.255.255" && cfg.zone_id.empty();
}

bool test_args_broadcast_warns_on_dropped_target() {
    ProbeConfig cfg;
    std::string err;
    bool ok = false;
    std::string log = capture_log(LogLevel::WARN, [&]() {
        ok = parse_probe_args({"--broadcast", "10.0.0.1", "8089", "kitchen"}, cfg, err);
    });
    if (!ok) return false;
    if (log.find("[WARN] --broadcast ignores host 10.0.0.1") == std::string::npos) return false;
    if (log.find("[WARN] --broadcast ignores zone 'kitchen'") == std::string::npos) return false;

    ProbeConfig plain;
    std::string quiet = capture_log(LogLevel::WARN, [&]() {
        ok = parse_probe_args({"--broadcast"}, plain, err);
    });
    return ok && quiet.empty();
}

bool test_args_rejects_bad_input() {
    ProbeConfig cfg;
    std::string err;
    if (parse_probe_args({"h", "notaport"}, cfg, err)) return false;
    if (parse_probe_args({"--timeout"}, cfg, err)) return false;
    if (err.find("missing value") == std::string::npos) return false;
    if (parse_probe_args({"--hash", "abcd"}, cfg, err)) return false;
    if (parse_probe_args({"--frobnicate"}, cfg, err)) return false;
    if (parse_probe_args({"--log-level", "loud"}, cfg, err)) return false;
    return !parse_probe_args({"h", "1", "z", "extra"}, cfg, err);
}

bool test_args_double_dash() {
    ProbeConfig cfg;
    std::string err;
    if (!parse_probe_args({"h", "8089", "--", "-odd-zone"}, cfg, err)) return false;
    return cfg.zone_id == "-odd-zone";
}

bool test_args_help() {
    ProbeConfig cfg;
    std::string err;
    return parse_probe_args({"--help"}, cfg, err) && cfg.show_help;
}

int main() {
    run_test("parse_host_port", test_parse_host_port);
    run_test("parse_bridge_url", test_parse_bridge_url);
    run_test("parse_port", test_parse_port);
    run_test("parse_timeout", test_parse_timeout);
    run_test("Hex encode and decode", test_hex);
    run_test("Log level names", test_log_level_from_string);
    run_test("Argument defaults", test_args_defaults);
    run_test("Positional arguments", test_args_positionals);
    run_test("Options mixed with positionals", test_args_options_mixed);
    run_test("Bridge URL option", test_args_bridge_url);
    run_test("Broadcast option", test_args_broadcast);
    run_test("Broadcast warns about dropped host and zone", test_args_broadcast_warns_on_dropped_target);
    run_test("Bad arguments rejected", test_args_rejects_bad_input);
    run_test("Double dash ends options", test_args_double_dash);
    run_test("Help flag", test_args_help);
    return finish_tests();
}
