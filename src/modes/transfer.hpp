#pragma once

#include "../core/HostBridge.hpp"

#include <QCoreApplication>

namespace modes {

    // Starts a transfer and prints progress lines until it completes or fails
    int runTransfer(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& url, const QString& filename);

    // Asks the host to reveal a downloaded file
    int runReveal(hostbridge::HostBridge& bridge, const QString& filename);

} // namespace modes
