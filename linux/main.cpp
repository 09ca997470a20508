#include "bluez_transport.hpp"
#include "dbus.hpp"
#include "notifications.hpp"

#include <monitor/scheduler.hpp>
#include <types/config.hpp>

#include <poll.h>
#include <signal.h>

#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

using namespace battwatch;

static std::atomic<bool> g_running{true};

// Discovery runs up to 20s on the daemon side
constexpr int DISCOVER_CALL_TIMEOUT_MS = 30000;
constexpr int RELOAD_CALL_TIMEOUT_MS = 60000;
constexpr int DEFAULT_CALL_TIMEOUT_MS = 5000;

static void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

// ============================================================================
// Daemon
// ============================================================================

static void run_event_loop(DBusConnection* session) {
    while (g_running) {
        pollfd pfd = {};
        pfd.fd = dbus_service::get_fd(session);
        pfd.events = POLLIN;

        int ret = poll(&pfd, pfd.fd >= 0 ? 1 : 0, 100);
        if (ret < 0) {
            if (errno == EINTR) continue;
            std::cerr << "poll error: " << strerror(errno) << std::endl;
            break;
        }

        // Also flushes notifications queued by refresh workers
        dbus_service::process_pending(session);
    }
}

static int cmd_daemon(const Config& config) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    std::cout << "battwatch daemon starting..." << std::endl;

    // Refresh workers share the bus connections with the main loop
    if (!dbus_threads_init_default()) {
        std::cerr << "Failed to initialize D-Bus threading" << std::endl;
        return 1;
    }

    auto transport = std::make_shared<BluezTransport>();
    if (!transport->is_open()) {
        return 1;
    }

    std::unique_ptr<Scheduler> scheduler;
    dbus_service::Callbacks callbacks;

    callbacks.on_discover = [&scheduler]() { return scheduler->discover(); };
    callbacks.on_register = [&scheduler](const std::string& id) {
        return scheduler->register_device(id);
    };
    callbacks.on_unregister = [&scheduler](const std::string& id) {
        return scheduler->unregister_device(id);
    };
    callbacks.on_reload = [&scheduler]() { scheduler->reload(); };
    callbacks.list_devices = [&scheduler]() { return scheduler->devices(); };
    callbacks.get_config = [&scheduler]() { return scheduler->config(); };
    callbacks.set_config = [&scheduler](const Config& c) { scheduler->set_config(c); };

    DBusConnection* session = dbus_service::init(&callbacks);
    if (!session) {
        std::cerr << "Failed to initialize D-Bus service" << std::endl;
        return 1;
    }

    auto notifier = std::make_shared<DesktopNotifier>(session);
    scheduler = std::make_unique<Scheduler>(transport, notifier, nullptr, config);
    scheduler->load();

    if (!dbus_service::request_name(session)) {
        dbus_service::cleanup(session);
        return 1;
    }

    scheduler->start();
    std::cout << "Daemon ready. D-Bus service: " << dbus_service::SERVICE_NAME << std::endl;

    run_event_loop(session);

    std::cout << "\nShutting down..." << std::endl;
    scheduler->stop();
    scheduler.reset();
    dbus_service::cleanup(session);

    std::cout << "Daemon stopped" << std::endl;
    return 0;
}

// ============================================================================
// Client commands
// ============================================================================

static DBusConnection* connect_session() {
    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to connect to session D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }
    return conn;
}

// Call a method on the daemon, optionally with one string argument.
// Returns the reply (caller unrefs) or nullptr after printing the error.
static DBusMessage* call_daemon(DBusConnection* conn, const char* iface, const char* method,
                                int timeout_ms, const char* arg = nullptr) {
    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        iface,
        method
    );
    if (!msg) {
        std::cerr << "Failed to create D-Bus message" << std::endl;
        return nullptr;
    }

    if (arg) {
        dbus_message_append_args(msg, DBUS_TYPE_STRING, &arg, DBUS_TYPE_INVALID);
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, timeout_ms, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (strcmp(err.name, DBUS_ERROR_SERVICE_UNKNOWN) == 0) {
            std::cerr << method << " failed (is daemon running?): " << err.message << std::endl;
        } else {
            std::cerr << err.message << std::endl;
        }
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

static int cmd_devices() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* reply = call_daemon(conn, dbus_service::INTERFACE_NAME, "ListDevices",
                                     DEFAULT_CALL_TIMEOUT_MS);
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    int count = 0;
    DBusMessageIter iter, array;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &array);

        while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
            DBusMessageIter entry, readings;
            dbus_message_iter_recurse(&array, &entry);

            const char* id;
            const char* name;
            dbus_bool_t disconnected;
            dbus_message_iter_get_basic(&entry, &id);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &name);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &disconnected);
            dbus_message_iter_next(&entry);

            std::cout << name << " (" << id << ")"
                      << (disconnected ? " [disconnected]" : "") << std::endl;

            dbus_message_iter_recurse(&entry, &readings);
            while (dbus_message_iter_get_arg_type(&readings) == DBUS_TYPE_STRUCT) {
                DBusMessageIter reading;
                dbus_message_iter_recurse(&readings, &reading);

                dbus_int32_t level;
                const char* label;
                dbus_message_iter_get_basic(&reading, &level);
                dbus_message_iter_next(&reading);
                dbus_message_iter_get_basic(&reading, &label);

                std::cout << "  " << (*label ? label : "Battery") << ": ";
                if (level >= 0) {
                    std::cout << level << "%" << std::endl;
                } else {
                    std::cout << "unknown" << std::endl;
                }
                dbus_message_iter_next(&readings);
            }

            ++count;
            dbus_message_iter_next(&array);
        }
    }
    dbus_message_unref(reply);
    dbus_connection_unref(conn);

    if (count == 0) {
        std::cout << "No devices registered" << std::endl;
    }
    return 0;
}

static int cmd_discover() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    std::cout << "Fetching devices..." << std::endl;
    DBusMessage* reply = call_daemon(conn, dbus_service::INTERFACE_NAME, "Discover",
                                     DISCOVER_CALL_TIMEOUT_MS);
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    int count = 0;
    DBusMessageIter iter, array;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {
        dbus_message_iter_recurse(&iter, &array);

        while (dbus_message_iter_get_arg_type(&array) == DBUS_TYPE_STRUCT) {
            DBusMessageIter entry;
            dbus_message_iter_recurse(&array, &entry);

            const char* id;
            const char* name;
            dbus_message_iter_get_basic(&entry, &id);
            dbus_message_iter_next(&entry);
            dbus_message_iter_get_basic(&entry, &name);

            std::cout << "  " << id << "  " << name << std::endl;
            ++count;
            dbus_message_iter_next(&array);
        }
    }
    dbus_message_unref(reply);
    dbus_connection_unref(conn);

    if (count == 0) {
        std::cout << "No devices found" << std::endl;
    }
    return 0;
}

static int cmd_register(const char* id) {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    std::cout << "Fetching battery info..." << std::endl;
    DBusMessage* reply = call_daemon(conn, dbus_service::INTERFACE_NAME, "Register",
                                     DEFAULT_CALL_TIMEOUT_MS * 2, id);
    if (!reply) {
        std::cerr << "Run 'discover' first to list devices that can be registered" << std::endl;
        dbus_connection_unref(conn);
        return 1;
    }

    const char* result = "";
    dbus_message_get_args(reply, nullptr, DBUS_TYPE_STRING, &result, DBUS_TYPE_INVALID);
    std::cout << id << ": " << result << std::endl;

    dbus_message_unref(reply);
    dbus_connection_unref(conn);
    return 0;
}

static int cmd_unregister(const char* id) {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* reply = call_daemon(conn, dbus_service::INTERFACE_NAME, "Unregister",
                                     DEFAULT_CALL_TIMEOUT_MS, id);
    if (!reply) {
        dbus_connection_unref(conn);
        return 1;
    }

    dbus_bool_t removed = FALSE;
    dbus_message_get_args(reply, nullptr, DBUS_TYPE_BOOLEAN, &removed, DBUS_TYPE_INVALID);
    dbus_message_unref(reply);
    dbus_connection_unref(conn);

    if (!removed) {
        std::cerr << id << " is not registered" << std::endl;
        return 1;
    }
    std::cout << id << ": removed" << std::endl;
    return 0;
}

static int cmd_reload() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    std::cout << "Fetching battery info..." << std::endl;
    DBusMessage* reply = call_daemon(conn, dbus_service::INTERFACE_NAME, "Reload",
                                     RELOAD_CALL_TIMEOUT_MS);
    dbus_connection_unref(conn);
    if (!reply) return 1;

    dbus_message_unref(reply);
    return cmd_devices();
}

static int cmd_status() {
    DBusConnection* conn = connect_session();
    if (!conn) return 1;

    DBusMessage* msg = dbus_message_new_method_call(
        dbus_service::SERVICE_NAME,
        dbus_service::OBJECT_PATH,
        "org.freedesktop.DBus.Properties",
        "GetAll"
    );
    if (!msg) {
        dbus_connection_unref(conn);
        return 1;
    }

    const char* iface = dbus_service::INTERFACE_NAME;
    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "Failed to get status (is daemon running?): " << err.message << std::endl;
        dbus_error_free(&err);
        dbus_connection_unref(conn);
        return 1;
    }

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, variant;
                dbus_message_iter_recurse(&dict, &entry);

                const char* prop_name;
                dbus_message_iter_get_basic(&entry, &prop_name);
                dbus_message_iter_next(&entry);
                dbus_message_iter_recurse(&entry, &variant);

                int type = dbus_message_iter_get_arg_type(&variant);
                if (type == DBUS_TYPE_BOOLEAN) {
                    dbus_bool_t val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": " << (val ? "true" : "false") << std::endl;
                } else if (type == DBUS_TYPE_UINT32) {
                    dbus_uint32_t val;
                    dbus_message_iter_get_basic(&variant, &val);
                    std::cout << prop_name << ": " << val << std::endl;
                }

                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    dbus_connection_unref(conn);
    return 0;
}

// ============================================================================
// Argument parsing
// ============================================================================

// Parse daemon flags into config. False on an unknown flag or bad value.
static bool parse_daemon_flags(int argc, char* argv[], Config& config) {
    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--interval") {
            if (i + 1 >= argc) {
                std::cerr << "--interval needs a value in milliseconds" << std::endl;
                return false;
            }
            char* end = nullptr;
            errno = 0;
            unsigned long ms = std::strtoul(argv[++i], &end, 10);
            if (errno != 0 || *end != '\0' || ms == 0) {
                std::cerr << "Invalid interval: " << argv[i] << std::endl;
                return false;
            }
            config.poll_interval = std::chrono::milliseconds(ms);
        } else if (flag == "--no-notify") {
            config.notifications.enabled = false;
        } else if (flag == "--no-notify-connected") {
            config.notifications.on_connected = false;
        } else if (flag == "--no-notify-disconnected") {
            config.notifications.on_disconnected = false;
        } else if (flag == "--no-notify-low-battery") {
            config.notifications.on_low_battery = false;
        } else {
            std::cerr << "Unknown option: " << flag << std::endl;
            return false;
        }
    }
    return true;
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  daemon [options]    Run the battery monitor daemon\n"
              << "  devices             List registered devices and their batteries\n"
              << "  discover            List devices that can be registered\n"
              << "  register <id>       Start monitoring a discovered device\n"
              << "  unregister <id>     Stop monitoring a device\n"
              << "  reload              Refresh all devices now\n"
              << "  status              Show daemon settings\n"
              << "  help                Show this help\n"
              << "\n"
              << "Daemon options:\n"
              << "  --interval <ms>             Poll interval (default 60000)\n"
              << "  --no-notify                 Disable all notifications\n"
              << "  --no-notify-connected       No notification on reconnect\n"
              << "  --no-notify-disconnected    No notification on disconnect\n"
              << "  --no-notify-low-battery     No notification on low battery\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string cmd = argv[1];

    if (cmd == "daemon") {
        Config config;
        if (!parse_daemon_flags(argc, argv, config)) {
            print_usage(argv[0]);
            return 1;
        }
        return cmd_daemon(config);
    } else if (cmd == "devices" || cmd == "list") {
        return cmd_devices();
    } else if (cmd == "discover") {
        return cmd_discover();
    } else if (cmd == "register" || cmd == "unregister") {
        if (argc < 3) {
            std::cerr << "Usage: " << argv[0] << " " << cmd << " <id>\n";
            return 1;
        }
        return cmd == "register" ? cmd_register(argv[2]) : cmd_unregister(argv[2]);
    } else if (cmd == "reload") {
        return cmd_reload();
    } else if (cmd == "status") {
        return cmd_status();
    } else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage(argv[0]);
        return 0;
    } else {
        std::cerr << "Unknown command: " << cmd << std::endl;
        print_usage(argv[0]);
        return 1;
    }
}
