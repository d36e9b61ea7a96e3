#pragma once

#include "../core/OperationError.hpp"

#include <QCoreApplication>
#include <QFuture>
#include <QFutureWatcher>

#include <optional>
#include <print>

namespace modes {

    // Runs the event loop until the future settles. Prints the failure and returns nullopt on OperationError.
    template <typename T>
    std::optional<T> awaitResult(QCoreApplication& app, QFuture<T> future) {
        if (!future.isFinished()) {
            QFutureWatcher<T> watcher;
            QObject::connect(&watcher, &QFutureWatcher<T>::finished, &app, [&app]() { app.exit(0); });
            watcher.setFuture(future);
            app.exec();
        }

        try {
            return future.result();
        } catch (const hostbridge::OperationError& error) {
            std::print(stderr, "{}: {}\n", hostbridge::OperationError::kindToString(error.kind()).toStdString(), error.message().toStdString());
            return std::nullopt;
        }
    }

} // namespace modes
