/*
 * Entity Receiver (UDP entity-state ingestion)
 *
 * Architecture (single io_context, single thread):
 * 1. Main Thread: runs boost::asio::io_context until SIGINT/SIGTERM.
 * 2. EntityReceiver: one instance per configuration. Owns the registry,
 *    observer hub, UDP listener and eviction sweeper.
 *
 * - "Hot Path" (Datagram -> Registry):
 *   UdpListener receives a JSON datagram, MessageDecoder validates it,
 *   EntityRegistry upserts it, ObserverHub fans out ADDED / UPDATED.
 *
 * - "Cold Path" (Eviction):
 *   EvictionSweeper ticks every cleanup interval (30s), removes entities
 *   not seen for the staleness window (10min), fans out REMOVED.
 *
 * - Lifecycle:
 *   Enable / Disable / Start / Stop gate the listener and sweeper and fan
 *   out STATUS_CHANGED.
 *
 * Usage: entity_receiver [config.json] [--port N] [--verbose]
 */

#include <csignal>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "EntityReceiver.h"
#include "ReceiverLog.h"

namespace {

void PrintUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [config.json] [--port N] [--verbose]\n";
}

} // namespace

int main(int argc, char** argv) {
    g_log_to_console = true;

    // --- 1. Configuration ---
    std::string config_path;
    std::string port_override;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--port" && i + 1 < argc) {
            port_override = argv[++i];
        }
        else if (arg == "--verbose") {
            g_log_min_level = static_cast<int>(LogLevel::Debug);
        }
        else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        }
        else if (!arg.empty() && arg[0] != '-' && config_path.empty()) {
            config_path = arg;
        }
        else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    ReceiverConfig config;
    try {
        ConfigMap values;
        if (!config_path.empty()) values = LoadConfigMap(config_path);
        if (!port_override.empty()) values["udp_port"] = port_override;
        config = ReceiverConfigFromMap(values);
    }
    catch (const ConfigError& e) {
        AddLog(std::string("Config error: ") + e.what(), LogType::SYSTEM, LogLevel::Error);
        return 1;
    }

    // --- 2. Core ---
    boost::asio::io_context io_ctx;
    EntityReceiver receiver(io_ctx, config);

    auto console = std::make_shared<CallbackObserver>([&receiver](const ReceiverEvent& event) {
        if (event.kind == EventKind::STATUS_CHANGED) {
            AddLog(std::string("Listener is now ") + (event.listening ? "listening" : "stopped") +
                (event.enabled ? "" : " (disabled)"), LogType::LIFECYCLE);
            return;
        }
        std::string line = "Entity " + EventKindName(event.kind) + ": " + event.entity_id;
        if (auto record = receiver.Get(event.entity_id)) {
            line += " = " + record->state.dump() + " (" + record->broadcaster_name + " @ " + record->source_ip + ")";
        }
        AddLog(line, LogType::INGRESS);
    });
    receiver.Subscribe(EventKind::ADDED, console);
    receiver.Subscribe(EventKind::UPDATED, console);
    receiver.Subscribe(EventKind::REMOVED, console);
    receiver.Subscribe(EventKind::STATUS_CHANGED, console);

    try {
        receiver.Start();
    }
    catch (const StartError& e) {
        AddLog(std::string("Listener start failed: ") + e.what(), LogType::SYSTEM, LogLevel::Error);
        return 2;
    }

    // --- 3. Run until signalled ---
    boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);

    // SIGUSR1 flips the enabled switch.
    boost::asio::signal_set toggle(io_ctx, SIGUSR1);
    std::function<void(const boost::system::error_code&, int)> on_toggle =
        [&](const boost::system::error_code& ec, int) {
            if (ec) return;
            try {
                receiver.SetEnabled(!receiver.IsEnabled());
            }
            catch (const StartError& e) {
                AddLog(std::string("Enable failed: ") + e.what(), LogType::SYSTEM, LogLevel::Error);
            }
            toggle.async_wait(on_toggle);
        };
    toggle.async_wait(on_toggle);

    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec) return;
        AddLog("Signal " + std::to_string(signo) + " received, stopping...");
        toggle.cancel();
        receiver.Stop();
    });

    io_ctx.run();

    // --- 4. Cleanup ---
    receiver.Stop();
    nlohmann::json snapshot = nlohmann::json::object();
    for (const auto& [entity_id, record] : receiver.ListAll()) {
        snapshot[entity_id] = record;
    }
    ReceiverStats stats = receiver.GetStats();
    AddLog("Final entities: " + snapshot.dump());
    AddLog("Datagrams: " + std::to_string(stats.datagrams_received) +
        ", decode errors: " + std::to_string(stats.decode_errors) +
        ", validation errors: " + std::to_string(stats.validation_errors) +
        ", receive errors: " + std::to_string(stats.receive_errors) +
        ", added: " + std::to_string(stats.entities_added) +
        ", updated: " + std::to_string(stats.entities_updated) +
        ", removed: " + std::to_string(stats.entities_removed));
    return 0;
}
