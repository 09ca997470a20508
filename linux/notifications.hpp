#pragma once

#include <monitor/interfaces.hpp>
#include <dbus/dbus.h>

namespace battwatch {

// Sends org.freedesktop.Notifications.Notify without waiting for a reply.
// Delivery is up to the desktop notification server.
class DesktopNotifier : public Notifier {
public:
    // Borrows a session bus connection (referenced for our lifetime)
    explicit DesktopNotifier(DBusConnection* session);
    ~DesktopNotifier() override;

    DesktopNotifier(const DesktopNotifier&) = delete;
    DesktopNotifier& operator=(const DesktopNotifier&) = delete;

    void notify(const std::string& message) override;

private:
    DBusConnection* conn_;
};

} // namespace battwatch
