#pragma once

#include "../core/HostBridge.hpp"

#include <QCoreApplication>

namespace modes {

    // Shows a host dialog and prints the typed answer
    int runDialog(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& type, const QString& title, const QString& message);

} // namespace modes
