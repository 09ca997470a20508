#include "bluez.hpp"

#include <strings.h>

#include <cstring>
#include <iostream>

namespace battwatch::bluez {

// Blocking Properties.Get. Returns the reply (caller unrefs) or nullptr.
static DBusMessage* get_property(DBusConnection* conn, const char* path,
                                 const char* iface, const char* prop,
                                 bool report_errors = true) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, path,
        "org.freedesktop.DBus.Properties", "Get");
    if (!msg) return nullptr;

    dbus_message_append_args(msg, DBUS_TYPE_STRING, &iface,
                             DBUS_TYPE_STRING, &prop, DBUS_TYPE_INVALID);

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 2000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        if (report_errors) {
            std::cerr << "bluez: Get " << iface << "." << prop << " on " << path
                      << " failed: " << err.message << std::endl;
        }
        dbus_error_free(&err);
        return nullptr;
    }
    return reply;
}

bool is_airpods(DBusMessageIter* uuids_iter) {
    if (dbus_message_iter_get_arg_type(uuids_iter) != DBUS_TYPE_ARRAY) {
        return false;
    }

    DBusMessageIter array_iter;
    dbus_message_iter_recurse(uuids_iter, &array_iter);

    while (dbus_message_iter_get_arg_type(&array_iter) == DBUS_TYPE_STRING) {
        const char* uuid;
        dbus_message_iter_get_basic(&array_iter, &uuid);
        if (strcasecmp(uuid, AIRPODS_UUID) == 0) {
            return true;
        }
        dbus_message_iter_next(&array_iter);
    }
    return false;
}

// Fill info from an a{sv} of org.bluez.Device1 properties
static void read_device_properties(DBusMessageIter* props, DeviceInfo* info) {
    std::string alias;
    std::string name;

    while (dbus_message_iter_get_arg_type(props) == DBUS_TYPE_DICT_ENTRY) {
        DBusMessageIter prop_entry, variant;
        dbus_message_iter_recurse(props, &prop_entry);

        const char* prop_name;
        dbus_message_iter_get_basic(&prop_entry, &prop_name);
        dbus_message_iter_next(&prop_entry);

        if (dbus_message_iter_get_arg_type(&prop_entry) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&prop_entry, &variant);
            int type = dbus_message_iter_get_arg_type(&variant);

            if (type == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(&variant, &val);
                if (strcmp(prop_name, "Address") == 0) info->address = val;
                else if (strcmp(prop_name, "Alias") == 0) alias = val;
                else if (strcmp(prop_name, "Name") == 0) name = val;
            } else if (type == DBUS_TYPE_BOOLEAN) {
                dbus_bool_t val;
                dbus_message_iter_get_basic(&variant, &val);
                if (strcmp(prop_name, "Connected") == 0) info->connected = val;
                else if (strcmp(prop_name, "Paired") == 0) info->paired = val;
            } else if (strcmp(prop_name, "UUIDs") == 0) {
                info->airpods = is_airpods(&variant);
            }
        }
        dbus_message_iter_next(props);
    }

    if (!alias.empty()) {
        info->name = alias;
    } else if (!name.empty()) {
        info->name = name;
    } else {
        info->name = info->address;
    }
}

std::optional<std::vector<DeviceInfo>> list_devices(DBusConnection* conn, std::string& error) {
    DBusMessage* msg = dbus_message_new_method_call(SERVICE, "/",
        "org.freedesktop.DBus.ObjectManager", "GetManagedObjects");
    if (!msg) {
        error = "Out of memory building BlueZ request.";
        return std::nullopt;
    }

    DBusError err;
    dbus_error_init(&err);
    DBusMessage* reply = dbus_connection_send_with_reply_and_block(conn, msg, 5000, &err);
    dbus_message_unref(msg);

    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: GetManagedObjects failed: " << err.message << std::endl;
        error = std::string("Bluetooth service unavailable: ") + err.message;
        dbus_error_free(&err);
        return std::nullopt;
    }

    std::vector<DeviceInfo> result;

    if (reply) {
        DBusMessageIter iter, dict;
        if (dbus_message_iter_init(reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_ARRAY) {

            dbus_message_iter_recurse(&iter, &dict);

            while (dbus_message_iter_get_arg_type(&dict) == DBUS_TYPE_DICT_ENTRY) {
                DBusMessageIter entry, ifaces;
                dbus_message_iter_recurse(&dict, &entry);

                const char* obj_path;
                dbus_message_iter_get_basic(&entry, &obj_path);
                dbus_message_iter_next(&entry);

                DeviceInfo info;
                info.path = obj_path;
                bool is_device = false;

                if (dbus_message_iter_get_arg_type(&entry) == DBUS_TYPE_ARRAY) {
                    dbus_message_iter_recurse(&entry, &ifaces);

                    while (dbus_message_iter_get_arg_type(&ifaces) == DBUS_TYPE_DICT_ENTRY) {
                        DBusMessageIter iface_entry, props;
                        dbus_message_iter_recurse(&ifaces, &iface_entry);

                        const char* iface_name;
                        dbus_message_iter_get_basic(&iface_entry, &iface_name);
                        dbus_message_iter_next(&iface_entry);

                        if (strcmp(iface_name, DEVICE_INTERFACE) == 0 &&
                            dbus_message_iter_get_arg_type(&iface_entry) == DBUS_TYPE_ARRAY) {
                            is_device = true;
                            dbus_message_iter_recurse(&iface_entry, &props);
                            read_device_properties(&props, &info);
                        } else if (strcmp(iface_name, BATTERY_INTERFACE) == 0) {
                            info.has_battery = true;
                        }
                        dbus_message_iter_next(&ifaces);
                    }
                }

                if (is_device && !info.address.empty()) {
                    result.push_back(std::move(info));
                }
                dbus_message_iter_next(&dict);
            }
        }
        dbus_message_unref(reply);
    }

    return result;
}

std::optional<DeviceInfo> find_device(DBusConnection* conn, const std::string& mac_address) {
    std::string error;
    auto devices = list_devices(conn, error);
    if (!devices) {
        return std::nullopt;
    }

    for (auto& dev : *devices) {
        if (strcasecmp(dev.address.c_str(), mac_address.c_str()) == 0) {
            return std::move(dev);
        }
    }
    return std::nullopt;
}

std::optional<BatteryInfo> read_battery(DBusConnection* conn, const std::string& device_path) {
    DBusMessage* reply = get_property(conn, device_path.c_str(), BATTERY_INTERFACE, "Percentage");
    if (!reply) {
        return std::nullopt;
    }

    std::optional<BatteryInfo> result;
    DBusMessageIter iter, variant;
    if (dbus_message_iter_init(reply, &iter) &&
        dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
        dbus_message_iter_recurse(&iter, &variant);
        if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_BYTE) {
            uint8_t val;
            dbus_message_iter_get_basic(&variant, &val);
            result = BatteryInfo{};
            result->percentage = val;
        }
    }
    dbus_message_unref(reply);

    if (!result) {
        return std::nullopt;
    }

    // Source is optional and only present for some profiles
    DBusMessage* source_reply = get_property(conn, device_path.c_str(), BATTERY_INTERFACE,
                                          "Source", false);
    if (source_reply) {
        if (dbus_message_iter_init(source_reply, &iter) &&
            dbus_message_iter_get_arg_type(&iter) == DBUS_TYPE_VARIANT) {
            dbus_message_iter_recurse(&iter, &variant);
            if (dbus_message_iter_get_arg_type(&variant) == DBUS_TYPE_STRING) {
                const char* val;
                dbus_message_iter_get_basic(&variant, &val);
                if (*val) result->source = val;
            }
        }
        dbus_message_unref(source_reply);
    }

    return result;
}

} // namespace battwatch::bluez
