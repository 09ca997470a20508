#include "dbus.hpp"

#include <cstring>
#include <iostream>

namespace battwatch::dbus_service {

// Set in init
static Callbacks* g_callbacks = nullptr;

static const char* INTROSPECT_XML =
    "<!DOCTYPE node PUBLIC \"-//freedesktop//DTD D-BUS Object Introspection 1.0//EN\"\n"
    "\"http://www.freedesktop.org/standards/dbus/1.0/introspect.dtd\">\n"
    "<node>\n"
    "  <interface name=\"io.github.battwatch.Monitor\">\n"
    "    <method name=\"Discover\">\n"
    "      <arg name=\"devices\" type=\"a(ss)\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Register\">\n"
    "      <arg name=\"id\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"result\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Unregister\">\n"
    "      <arg name=\"id\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"removed\" type=\"b\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Reload\"/>\n"
    "    <method name=\"ListDevices\">\n"
    "      <arg name=\"devices\" type=\"a(ssba(is))\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <property name=\"PollInterval\" type=\"u\" access=\"readwrite\"/>\n"
    "    <property name=\"Notifications\" type=\"b\" access=\"readwrite\"/>\n"
    "    <property name=\"NotifyConnected\" type=\"b\" access=\"readwrite\"/>\n"
    "    <property name=\"NotifyDisconnected\" type=\"b\" access=\"readwrite\"/>\n"
    "    <property name=\"NotifyLowBattery\" type=\"b\" access=\"readwrite\"/>\n"
    "    <property name=\"DeviceCount\" type=\"u\" access=\"read\"/>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Properties\">\n"
    "    <method name=\"Get\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <method name=\"Set\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"property\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"value\" type=\"v\" direction=\"in\"/>\n"
    "    </method>\n"
    "    <method name=\"GetAll\">\n"
    "      <arg name=\"interface\" type=\"s\" direction=\"in\"/>\n"
    "      <arg name=\"properties\" type=\"a{sv}\" direction=\"out\"/>\n"
    "    </method>\n"
    "    <signal name=\"PropertiesChanged\">\n"
    "      <arg name=\"interface\" type=\"s\"/>\n"
    "      <arg name=\"changed_properties\" type=\"a{sv}\"/>\n"
    "      <arg name=\"invalidated_properties\" type=\"as\"/>\n"
    "    </signal>\n"
    "  </interface>\n"
    "  <interface name=\"org.freedesktop.DBus.Introspectable\">\n"
    "    <method name=\"Introspect\">\n"
    "      <arg name=\"xml\" type=\"s\" direction=\"out\"/>\n"
    "    </method>\n"
    "  </interface>\n"
    "</node>\n";

static const char* PROPERTY_NAMES[] = {
    "PollInterval",
    "Notifications",
    "NotifyConnected",
    "NotifyDisconnected",
    "NotifyLowBattery",
    "DeviceCount",
};

// Helper to append variant with bool
static void append_variant_bool(DBusMessageIter* iter, dbus_bool_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "b", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_BOOLEAN, &value);
    dbus_message_iter_close_container(iter, &variant);
}

// Helper to append variant with uint32
static void append_variant_uint32(DBusMessageIter* iter, dbus_uint32_t value) {
    DBusMessageIter variant;
    dbus_message_iter_open_container(iter, DBUS_TYPE_VARIANT, "u", &variant);
    dbus_message_iter_append_basic(&variant, DBUS_TYPE_UINT32, &value);
    dbus_message_iter_close_container(iter, &variant);
}

static Config current_config() {
    return (g_callbacks && g_callbacks->get_config) ? g_callbacks->get_config() : Config{};
}

static size_t device_count() {
    return (g_callbacks && g_callbacks->list_devices) ? g_callbacks->list_devices().size() : 0;
}

// Append the value of a property as a variant. False for unknown names.
static bool append_property(DBusMessageIter* iter, const char* prop, const Config& config) {
    const auto& n = config.notifications;

    if (strcmp(prop, "PollInterval") == 0) {
        append_variant_uint32(iter, static_cast<dbus_uint32_t>(config.poll_interval.count()));
    } else if (strcmp(prop, "Notifications") == 0) {
        append_variant_bool(iter, n.enabled);
    } else if (strcmp(prop, "NotifyConnected") == 0) {
        append_variant_bool(iter, n.on_connected);
    } else if (strcmp(prop, "NotifyDisconnected") == 0) {
        append_variant_bool(iter, n.on_disconnected);
    } else if (strcmp(prop, "NotifyLowBattery") == 0) {
        append_variant_bool(iter, n.on_low_battery);
    } else if (strcmp(prop, "DeviceCount") == 0) {
        append_variant_uint32(iter, static_cast<dbus_uint32_t>(device_count()));
    } else {
        return false;
    }
    return true;
}

// (ss)
static void append_device(DBusMessageIter* array, const Device& device) {
    DBusMessageIter entry;
    const char* id = device.id.c_str();
    const char* name = device.name.c_str();
    dbus_message_iter_open_container(array, DBUS_TYPE_STRUCT, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &id);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
    dbus_message_iter_close_container(array, &entry);
}

// (ssba(is)); unknown level is -1, missing label is ""
static void append_registered(DBusMessageIter* array, const RegisteredDevice& device) {
    DBusMessageIter entry, readings, reading;
    const char* id = device.device.id.c_str();
    const char* name = device.device.name.c_str();
    dbus_bool_t disconnected = device.disconnected;

    dbus_message_iter_open_container(array, DBUS_TYPE_STRUCT, nullptr, &entry);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &id);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
    dbus_message_iter_append_basic(&entry, DBUS_TYPE_BOOLEAN, &disconnected);

    dbus_message_iter_open_container(&entry, DBUS_TYPE_ARRAY, "(is)", &readings);
    for (const auto& r : device.telemetry) {
        dbus_int32_t level = r.level ? *r.level : -1;
        const char* label = r.label ? r.label->c_str() : "";
        dbus_message_iter_open_container(&readings, DBUS_TYPE_STRUCT, nullptr, &reading);
        dbus_message_iter_append_basic(&reading, DBUS_TYPE_INT32, &level);
        dbus_message_iter_append_basic(&reading, DBUS_TYPE_STRING, &label);
        dbus_message_iter_close_container(&readings, &reading);
    }
    dbus_message_iter_close_container(&entry, &readings);

    dbus_message_iter_close_container(array, &entry);
}

// Handle Get property
static DBusMessage* handle_get(DBusMessage* msg) {
    const char* iface;
    const char* prop;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_STRING, &prop,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter;
    dbus_message_iter_init_append(reply, &iter);

    if (!append_property(&iter, prop, current_config())) {
        dbus_message_unref(reply);
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }
    return reply;
}

// Handle GetAll properties
static DBusMessage* handle_get_all(DBusMessage* msg) {
    const char* iface;

    if (!dbus_message_get_args(msg, nullptr,
            DBUS_TYPE_STRING, &iface,
            DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }

    Config config = current_config();

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, dict, entry;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);

    for (const char* name : PROPERTY_NAMES) {
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &name);
        append_property(&entry, name, config);
        dbus_message_iter_close_container(&dict, &entry);
    }

    dbus_message_iter_close_container(&iter, &dict);
    return reply;
}

// Handle Set property
static DBusMessage* handle_set(DBusConnection* conn, DBusMessage* msg) {
    const char* iface;
    const char* prop;

    DBusMessageIter iter;
    if (!dbus_message_iter_init(msg, &iter) ||
        dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }

    dbus_message_iter_get_basic(&iter, &iface);
    dbus_message_iter_next(&iter);
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_STRING) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Invalid arguments");
    }
    dbus_message_iter_get_basic(&iter, &prop);
    dbus_message_iter_next(&iter);

    if (strcmp(iface, INTERFACE_NAME) != 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_INTERFACE, "Unknown interface");
    }
    if (dbus_message_iter_get_arg_type(&iter) != DBUS_TYPE_VARIANT) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected variant value");
    }

    DBusMessageIter variant;
    dbus_message_iter_recurse(&iter, &variant);
    int type = dbus_message_iter_get_arg_type(&variant);

    Config config = current_config();
    auto& n = config.notifications;

    if (strcmp(prop, "PollInterval") == 0) {
        if (type != DBUS_TYPE_UINT32) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected uint32");
        }
        dbus_uint32_t ms;
        dbus_message_iter_get_basic(&variant, &ms);
        if (ms == 0) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Interval must be positive");
        }
        config.poll_interval = std::chrono::milliseconds(ms);
    } else if (strcmp(prop, "Notifications") == 0 || strcmp(prop, "NotifyConnected") == 0 ||
               strcmp(prop, "NotifyDisconnected") == 0 || strcmp(prop, "NotifyLowBattery") == 0) {
        if (type != DBUS_TYPE_BOOLEAN) {
            return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected boolean");
        }
        dbus_bool_t val;
        dbus_message_iter_get_basic(&variant, &val);

        if (strcmp(prop, "Notifications") == 0) n.enabled = val;
        else if (strcmp(prop, "NotifyConnected") == 0) n.on_connected = val;
        else if (strcmp(prop, "NotifyDisconnected") == 0) n.on_disconnected = val;
        else n.on_low_battery = val;
    } else if (strcmp(prop, "DeviceCount") == 0) {
        return dbus_message_new_error(msg, DBUS_ERROR_PROPERTY_READ_ONLY, "Property is read-only");
    } else {
        return dbus_message_new_error(msg, DBUS_ERROR_UNKNOWN_PROPERTY, "Unknown property");
    }

    std::cout << "dbus: " << prop << " changed" << std::endl;
    if (g_callbacks && g_callbacks->set_config) {
        g_callbacks->set_config(config);
    }
    emit_properties_changed(conn, {prop});
    return dbus_message_new_method_return(msg);
}

static DBusMessage* handle_discover(DBusMessage* msg) {
    if (!g_callbacks || !g_callbacks->on_discover) {
        return dbus_message_new_error(msg, DBUS_ERROR_NOT_SUPPORTED, "Discovery unavailable");
    }

    DiscoveryResult result = g_callbacks->on_discover();
    if (!result.ok()) {
        return dbus_message_new_error(msg, ERROR_DISCOVERY, result.message.c_str());
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, array;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ss)", &array);
    for (const auto& device : result.devices) {
        append_device(&array, device);
    }
    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

static DBusMessage* handle_register(DBusConnection* conn, DBusMessage* msg) {
    const char* id;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &id, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
    }

    std::cout << "dbus: Register(" << id << ") called" << std::endl;
    if (!g_callbacks || !g_callbacks->on_register) {
        return dbus_message_new_error(msg, DBUS_ERROR_NOT_SUPPORTED, "Registration unavailable");
    }

    RegisterResult result = g_callbacks->on_register(id);
    if (result == RegisterResult::UnknownDevice) {
        return dbus_message_new_error(msg, ERROR_UNKNOWN_DEVICE,
                                      "Device was not found by the last discovery");
    }
    if (result == RegisterResult::Added) {
        emit_properties_changed(conn, {"DeviceCount"});
    }

    const char* text = to_string(result);
    DBusMessage* reply = dbus_message_new_method_return(msg);
    dbus_message_append_args(reply, DBUS_TYPE_STRING, &text, DBUS_TYPE_INVALID);
    return reply;
}

static DBusMessage* handle_unregister(DBusConnection* conn, DBusMessage* msg) {
    const char* id;
    if (!dbus_message_get_args(msg, nullptr, DBUS_TYPE_STRING, &id, DBUS_TYPE_INVALID)) {
        return dbus_message_new_error(msg, DBUS_ERROR_INVALID_ARGS, "Expected string argument");
    }

    std::cout << "dbus: Unregister(" << id << ") called" << std::endl;
    dbus_bool_t removed = g_callbacks && g_callbacks->on_unregister && g_callbacks->on_unregister(id);
    if (removed) {
        emit_properties_changed(conn, {"DeviceCount"});
    }

    DBusMessage* reply = dbus_message_new_method_return(msg);
    dbus_message_append_args(reply, DBUS_TYPE_BOOLEAN, &removed, DBUS_TYPE_INVALID);
    return reply;
}

static DBusMessage* handle_list(DBusMessage* msg) {
    DBusMessage* reply = dbus_message_new_method_return(msg);
    DBusMessageIter iter, array;
    dbus_message_iter_init_append(reply, &iter);
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "(ssba(is))", &array);
    if (g_callbacks && g_callbacks->list_devices) {
        for (const auto& device : g_callbacks->list_devices()) {
            append_registered(&array, device);
        }
    }
    dbus_message_iter_close_container(&iter, &array);
    return reply;
}

// Message handler
static DBusHandlerResult message_handler(DBusConnection* conn, DBusMessage* msg, void* data) {
    (void)data;

    const char* iface = dbus_message_get_interface(msg);
    const char* member = dbus_message_get_member(msg);
    const char* path = dbus_message_get_path(msg);

    if (!path || strcmp(path, OBJECT_PATH) != 0 || !member) {
        return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
    }

    DBusMessage* reply = nullptr;

    if (iface && strcmp(iface, "org.freedesktop.DBus.Introspectable") == 0 &&
        strcmp(member, "Introspect") == 0) {
        reply = dbus_message_new_method_return(msg);
        dbus_message_append_args(reply, DBUS_TYPE_STRING, &INTROSPECT_XML, DBUS_TYPE_INVALID);
    }
    else if (iface && strcmp(iface, "org.freedesktop.DBus.Properties") == 0) {
        if (strcmp(member, "Get") == 0) {
            reply = handle_get(msg);
        } else if (strcmp(member, "GetAll") == 0) {
            reply = handle_get_all(msg);
        } else if (strcmp(member, "Set") == 0) {
            reply = handle_set(conn, msg);
        }
    }
    else if (iface && strcmp(iface, INTERFACE_NAME) == 0) {
        if (strcmp(member, "Discover") == 0) {
            std::cout << "dbus: Discover() called" << std::endl;
            reply = handle_discover(msg);
        } else if (strcmp(member, "Register") == 0) {
            reply = handle_register(conn, msg);
        } else if (strcmp(member, "Unregister") == 0) {
            reply = handle_unregister(conn, msg);
        } else if (strcmp(member, "Reload") == 0) {
            std::cout << "dbus: Reload() called" << std::endl;
            if (g_callbacks && g_callbacks->on_reload) g_callbacks->on_reload();
            reply = dbus_message_new_method_return(msg);
        } else if (strcmp(member, "ListDevices") == 0) {
            reply = handle_list(msg);
        }
    }

    if (reply) {
        dbus_connection_send(conn, reply, nullptr);
        dbus_message_unref(reply);
        return DBUS_HANDLER_RESULT_HANDLED;
    }

    return DBUS_HANDLER_RESULT_NOT_YET_HANDLED;
}

DBusConnection* init(Callbacks* callbacks) {
    g_callbacks = callbacks;

    DBusError err;
    dbus_error_init(&err);

    DBusConnection* conn = dbus_bus_get(DBUS_BUS_SESSION, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: connection error: " << err.message << std::endl;
        dbus_error_free(&err);
        return nullptr;
    }

    DBusObjectPathVTable vtable = {};
    vtable.message_function = message_handler;

    if (!dbus_connection_register_object_path(conn, OBJECT_PATH, &vtable, nullptr)) {
        std::cerr << "dbus: failed to register object path" << std::endl;
        dbus_connection_unref(conn);
        return nullptr;
    }

    return conn;
}

bool request_name(DBusConnection* conn) {
    DBusError err;
    dbus_error_init(&err);

    int ret = dbus_bus_request_name(conn, SERVICE_NAME, DBUS_NAME_FLAG_DO_NOT_QUEUE, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "dbus: name error: " << err.message << std::endl;
        dbus_error_free(&err);
        return false;
    }

    if (ret != DBUS_REQUEST_NAME_REPLY_PRIMARY_OWNER) {
        std::cerr << "dbus: " << SERVICE_NAME << " is already owned, is another daemon running?" << std::endl;
        return false;
    }

    std::cout << "dbus: registered service " << SERVICE_NAME << std::endl;
    return true;
}

void emit_properties_changed(DBusConnection* conn, const std::vector<const char*>& property_names) {
    DBusMessage* signal = dbus_message_new_signal(OBJECT_PATH,
        "org.freedesktop.DBus.Properties", "PropertiesChanged");
    if (!signal) return;

    Config config = current_config();

    DBusMessageIter iter, dict, entry;
    dbus_message_iter_init_append(signal, &iter);

    const char* iface = INTERFACE_NAME;
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &iface);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &dict);
    for (const char* prop : property_names) {
        dbus_message_iter_open_container(&dict, DBUS_TYPE_DICT_ENTRY, nullptr, &entry);
        dbus_message_iter_append_basic(&entry, DBUS_TYPE_STRING, &prop);
        append_property(&entry, prop, config);
        dbus_message_iter_close_container(&dict, &entry);
    }
    dbus_message_iter_close_container(&iter, &dict);

    // Invalidated properties (empty array)
    DBusMessageIter invalidated;
    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &invalidated);
    dbus_message_iter_close_container(&iter, &invalidated);

    dbus_connection_send(conn, signal, nullptr);
    dbus_message_unref(signal);
}

void process_pending(DBusConnection* conn) {
    dbus_connection_read_write(conn, 0);
    while (dbus_connection_dispatch(conn) == DBUS_DISPATCH_DATA_REMAINS) {
        // Keep processing
    }
}

int get_fd(DBusConnection* conn) {
    int fd = -1;
    if (!dbus_connection_get_unix_fd(conn, &fd)) {
        return -1;
    }
    return fd;
}

void cleanup(DBusConnection* conn) {
    if (conn) {
        dbus_connection_unregister_object_path(conn, OBJECT_PATH);
        dbus_connection_unref(conn);
    }
    g_callbacks = nullptr;
}

} // namespace battwatch::dbus_service
