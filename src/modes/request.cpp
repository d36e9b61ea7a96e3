#include "request.hpp"
#include "await.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <print>

namespace modes {

    bool parseHeaders(const QStringList& raw, QJsonObject& out) {
        for (const QString& entry : raw) {
            const int colon = entry.indexOf(':');
            if (colon <= 0) {
                std::print(stderr, "Invalid header '{}', expected 'Name: value'\n", entry.toStdString());
                return false;
            }
            out.insert(entry.left(colon).trimmed(), entry.mid(colon + 1).trimmed());
        }
        return true;
    }

    int runRequest(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& method, const QString& path, const QString& body, const QStringList& headers) {
        QJsonObject headerObject;
        if (!parseHeaders(headers, headerObject)) {
            return 2;
        }

        QJsonValue bodyValue = QJsonValue::Undefined;
        if (!body.isEmpty()) {
            QJsonParseError     parseError;
            const QJsonDocument doc = QJsonDocument::fromJson(body.toUtf8(), &parseError);
            if (parseError.error != QJsonParseError::NoError) {
                std::print(stderr, "Invalid --body JSON: {}\n", parseError.errorString().toStdString());
                return 2;
            }
            bodyValue = doc.isArray() ? QJsonValue(doc.array()) : QJsonValue(doc.object());
        }

        auto result = awaitResult(app, bridge.facade().request(method, path, bodyValue, headerObject));
        if (!result) {
            return 1;
        }

        if (result->isObject()) {
            std::print("{}\n", QJsonDocument(result->toObject()).toJson(QJsonDocument::Compact).toStdString());
        } else if (result->isArray()) {
            std::print("{}\n", QJsonDocument(result->toArray()).toJson(QJsonDocument::Compact).toStdString());
        } else {
            std::print("{}\n", result->toVariant().toString().toStdString());
        }
        return 0;
    }

} // namespace modes
