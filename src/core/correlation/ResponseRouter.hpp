#pragma once

#include "PendingOperationTable.hpp"

#include <QJsonObject>

namespace hostbridge::correlation {

    // Inbound entry point for { requestId, success, data?, error? } responses
    class ResponseRouter {
      public:
        explicit ResponseRouter(PendingOperationTable& table);

        static bool isResponse(const QJsonObject& msg);

        // Returns true only if the response settled a pending operation
        bool        route(const QJsonObject& msg);

      private:
        PendingOperationTable& m_table;
    };

} // namespace hostbridge::correlation
