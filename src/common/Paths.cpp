#include "Paths.hpp"

#include <QStandardPaths>

namespace hostbridge {

    QString socketPath() {
        const auto runtimeDir = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
        return runtimeDir + QStringLiteral("/hostbridge.sock");
    }

    QString configPath() {
        const auto configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
        return configDir + QStringLiteral("/hostbridge/hostbridge.conf");
    }

} // namespace hostbridge
