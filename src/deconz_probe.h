#pragma once

#include <QString>

#include "deconz_http.h"

namespace deconzctl {

struct ProbeResult {
    bool ok = false;
    QString error;
    QString message;
    QString bridgeName;
    QString apiVersion;
};

// Verifies that the bridge is reachable and accepts the configured API key.
ProbeResult checkCredentials(HttpClient &http,
                             const ConnectionSettings &settings,
                             int timeoutMs = 10000);

} // namespace deconzctl
