#include "dialog.hpp"
#include "await.hpp"

#include <print>

namespace modes {

    int runDialog(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& type, const QString& title, const QString& message) {
        auto result = awaitResult(app, bridge.facade().showDialog(type, title, message));
        if (!result) {
            return 1;
        }

        if (result->typeId() == QMetaType::Bool) {
            std::print("{}\n", result->toBool() ? "true" : "false");
        } else {
            std::print("{}\n", result->toString().toStdString());
        }
        return 0;
    }

} // namespace modes
