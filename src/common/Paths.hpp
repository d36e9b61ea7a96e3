#pragma once

#include <QString>

namespace hostbridge {

    // Returns the default host socket path: $XDG_RUNTIME_DIR/hostbridge.sock
    QString socketPath();

    // Returns the default config file: $XDG_CONFIG_HOME/hostbridge/hostbridge.conf
    QString configPath();

} // namespace hostbridge
