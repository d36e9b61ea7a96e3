#pragma once

#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace hostbridge {

    enum class DialogMode {
        Poll,
        Push
    };

    struct Config {
        QString    socketPath;
        int        apiTimeoutMs         = 0;
        int        dialogTimeoutMs      = 0;
        int        dialogPollIntervalMs = 0;
        DialogMode dialogMode           = DialogMode::Poll;
        QString    sessionId;

        // Built-in defaults from Constants.hpp and Paths.hpp
        static Config defaults();

        // Overlays the [bridge] group of an ini file. Missing file leaves the config untouched.
        void          applyFile(const QString& path);

        // Overlays HOSTBRIDGE_* variables
        void          applyEnvironment(const QProcessEnvironment& env);

        // defaults -> file -> environment
        static Config load(const QString& filePath, const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());

        // Number of poll ticks that fit in the dialog timeout, at least one
        int           dialogPollAttempts() const;

        static QString                   dialogModeToString(DialogMode mode);
        static std::optional<DialogMode> dialogModeFromString(const QString& value);
    };

} // namespace hostbridge
