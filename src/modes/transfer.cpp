#include "transfer.hpp"

#include <print>

namespace modes {

    using hostbridge::transfer::TransferStatus;

    int runTransfer(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& url, const QString& filename) {
        auto&   transfers = bridge.transfers();
        QString watchedKey;

        QObject::connect(&transfers, &hostbridge::transfer::TransferRegistry::transferUpdated, &app, [&app, &transfers, &watchedKey](const QString& key) {
            if (watchedKey.isEmpty() || key != watchedKey) {
                return;
            }

            const auto record = transfers.get(key);
            if (!record) {
                return;
            }

            switch (record->status) {
                case TransferStatus::Completed:
                    std::print("Completed: {}\n", record->filename.toStdString());
                    app.exit(0);
                    break;
                case TransferStatus::Error:
                    std::print(stderr, "Failed: {}: {}\n", record->filename.toStdString(), record->error.toStdString());
                    app.exit(1);
                    break;
                case TransferStatus::Downloading:
                case TransferStatus::Idle:
                    std::print("{:5.1f}% {} eta {}\n", record->progressPercent, record->speedHuman.toStdString(), record->etaHuman.toStdString());
                    break;
            }
        });

        QObject::connect(&bridge, &hostbridge::HostBridge::hostDisconnected, &app, [&app]() { app.exit(1); });

        watchedKey = bridge.facade().startTransfer(url, filename);

        // The start request itself may already have failed
        const auto initial = transfers.get(watchedKey);
        if (initial && initial->status == TransferStatus::Error) {
            std::print(stderr, "Failed: {}: {}\n", initial->filename.toStdString(), initial->error.toStdString());
            return 1;
        }

        return app.exec();
    }

    int runReveal(hostbridge::HostBridge& bridge, const QString& filename) {
        try {
            bridge.facade().showInFolder(filename);
        } catch (const hostbridge::OperationError& error) {
            std::print(stderr, "{}: {}\n", hostbridge::OperationError::kindToString(error.kind()).toStdString(), error.message().toStdString());
            return 1;
        }
        return 0;
    }

} // namespace modes
