#include "Config.hpp"
#include "Constants.hpp"
#include "Paths.hpp"

#include <QFileInfo>
#include <QSettings>

#include <print>

namespace hostbridge {

    namespace {

        // Positive integers only; anything else keeps the previous value
        void overlayInt(int& target, const QString& raw, const char* name) {
            if (raw.isEmpty()) {
                return;
            }

            bool      ok    = false;
            const int value = raw.toInt(&ok);
            if (!ok || value <= 0) {
                std::print(stderr, "config: ignoring invalid {}={}\n", name, raw.toStdString());
                return;
            }
            target = value;
        }

        void overlayMode(DialogMode& target, const QString& raw, const char* name) {
            if (raw.isEmpty()) {
                return;
            }

            const auto mode = Config::dialogModeFromString(raw);
            if (!mode) {
                std::print(stderr, "config: ignoring invalid {}={}\n", name, raw.toStdString());
                return;
            }
            target = *mode;
        }

    } // namespace

    Config Config::defaults() {
        Config config;
        config.socketPath           = hostbridge::socketPath();
        config.apiTimeoutMs         = API_REQUEST_TIMEOUT_MS;
        config.dialogTimeoutMs      = DIALOG_TIMEOUT_MS;
        config.dialogPollIntervalMs = DIALOG_POLL_INTERVAL_MS;
        config.dialogMode           = DialogMode::Poll;
        config.sessionId            = QString::fromLatin1(DEFAULT_SESSION_ID);
        return config;
    }

    void Config::applyFile(const QString& path) {
        if (path.isEmpty() || !QFileInfo::exists(path)) {
            return;
        }

        QSettings settings(path, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError) {
            std::print(stderr, "config: failed to read {}\n", path.toStdString());
            return;
        }

        settings.beginGroup("bridge");
        const QString socket = settings.value("socket").toString();
        if (!socket.isEmpty()) {
            socketPath = socket;
        }
        overlayInt(apiTimeoutMs, settings.value("api_timeout_ms").toString(), "api_timeout_ms");
        overlayInt(dialogTimeoutMs, settings.value("dialog_timeout_ms").toString(), "dialog_timeout_ms");
        overlayInt(dialogPollIntervalMs, settings.value("dialog_poll_interval_ms").toString(), "dialog_poll_interval_ms");
        overlayMode(dialogMode, settings.value("dialog_mode").toString(), "dialog_mode");
        const QString session = settings.value("session_id").toString();
        if (!session.isEmpty()) {
            sessionId = session;
        }
        settings.endGroup();
    }

    void Config::applyEnvironment(const QProcessEnvironment& env) {
        const QString socket = env.value("HOSTBRIDGE_SOCKET");
        if (!socket.isEmpty()) {
            socketPath = socket;
        }
        overlayInt(apiTimeoutMs, env.value("HOSTBRIDGE_API_TIMEOUT_MS"), "HOSTBRIDGE_API_TIMEOUT_MS");
        overlayInt(dialogTimeoutMs, env.value("HOSTBRIDGE_DIALOG_TIMEOUT_MS"), "HOSTBRIDGE_DIALOG_TIMEOUT_MS");
        overlayMode(dialogMode, env.value("HOSTBRIDGE_DIALOG_MODE"), "HOSTBRIDGE_DIALOG_MODE");
        const QString session = env.value("HOSTBRIDGE_SESSION_ID");
        if (!session.isEmpty()) {
            sessionId = session;
        }
    }

    Config Config::load(const QString& filePath, const QProcessEnvironment& env) {
        Config config = defaults();
        config.applyFile(filePath.isEmpty() ? hostbridge::configPath() : filePath);
        config.applyEnvironment(env);
        return config;
    }

    int Config::dialogPollAttempts() const {
        const int interval = dialogPollIntervalMs > 0 ? dialogPollIntervalMs : DIALOG_POLL_INTERVAL_MS;
        const int attempts = dialogTimeoutMs / interval;
        return attempts > 0 ? attempts : 1;
    }

    QString Config::dialogModeToString(DialogMode mode) {
        switch (mode) {
            case DialogMode::Poll: return "poll";
            case DialogMode::Push: return "push";
        }
        return "poll";
    }

    std::optional<DialogMode> Config::dialogModeFromString(const QString& value) {
        const QString normalized = value.trimmed().toLower();
        if (normalized == "poll") {
            return DialogMode::Poll;
        }
        if (normalized == "push") {
            return DialogMode::Push;
        }
        return std::nullopt;
    }

} // namespace hostbridge
