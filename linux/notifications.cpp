#include "notifications.hpp"

#include <iostream>

namespace battwatch {

namespace {

constexpr const char* NOTIFY_SERVICE = "org.freedesktop.Notifications";
constexpr const char* NOTIFY_PATH = "/org/freedesktop/Notifications";
constexpr const char* APP_NAME = "battwatch";
constexpr const char* ICON = "battery-caution";
constexpr dbus_int32_t EXPIRE_DEFAULT = -1;

} // namespace

DesktopNotifier::DesktopNotifier(DBusConnection* session) : conn_(session) {
    if (conn_) {
        dbus_connection_ref(conn_);
    }
}

DesktopNotifier::~DesktopNotifier() {
    if (conn_) {
        dbus_connection_unref(conn_);
    }
}

void DesktopNotifier::notify(const std::string& message) {
    if (!conn_) {
        std::cerr << "notify: no session bus, dropping \"" << message << "\"" << std::endl;
        return;
    }

    DBusMessage* msg = dbus_message_new_method_call(NOTIFY_SERVICE, NOTIFY_PATH,
                                                    NOTIFY_SERVICE, "Notify");
    if (!msg) return;

    // Notify(s app_name, u replaces_id, s icon, s summary, s body,
    //        as actions, a{sv} hints, i expire_timeout)
    DBusMessageIter iter, array;
    dbus_message_iter_init_append(msg, &iter);

    const char* app = APP_NAME;
    dbus_uint32_t replaces_id = 0;
    const char* icon = ICON;
    const char* summary = message.c_str();
    const char* body = "";
    dbus_int32_t expire = EXPIRE_DEFAULT;

    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &app);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_UINT32, &replaces_id);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &icon);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &summary);
    dbus_message_iter_append_basic(&iter, DBUS_TYPE_STRING, &body);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "s", &array);
    dbus_message_iter_close_container(&iter, &array);

    dbus_message_iter_open_container(&iter, DBUS_TYPE_ARRAY, "{sv}", &array);
    dbus_message_iter_close_container(&iter, &array);

    dbus_message_iter_append_basic(&iter, DBUS_TYPE_INT32, &expire);

    dbus_message_set_no_reply(msg, TRUE);
    if (!dbus_connection_send(conn_, msg, nullptr)) {
        std::cerr << "notify: failed to queue notification" << std::endl;
    }
    dbus_connection_flush(conn_);
    dbus_message_unref(msg);
}

} // namespace battwatch
