#pragma once

#include "../core/HostBridge.hpp"

#include <QCoreApplication>
#include <QJsonObject>
#include <QStringList>

namespace modes {

    // Sends one API request and prints the host's data as compact JSON
    int runRequest(QCoreApplication& app, hostbridge::HostBridge& bridge, const QString& method, const QString& path, const QString& body, const QStringList& headers);

    // "Name: value" pairs to a header object; returns false on a malformed entry
    bool parseHeaders(const QStringList& raw, QJsonObject& out);

} // namespace modes
