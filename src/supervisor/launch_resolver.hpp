#pragma once

#include <QString>

#include "supervisor/child_process.hpp"

namespace officebridge {

// Locates the bridge service installation:
//   1. BRIDGE_SERVICE_PATH, used verbatim
//   2. packaged resources: <appDir>/bridge-service, then
//      <appDir>/../share/office-bridge/bridge-service
//   3. development checkout: ../.. from the working directory when it
//      contains src/server.ts
//   4. the working directory itself
QString resolveServiceLocation(const QString &envOverride,
                               const QString &applicationDir,
                               const QString &workingDir);

// Same lookup against the live environment, application and working directory.
QString resolveServiceLocation();

// Picks how to run the service found at serviceDir: the packaged binary, the
// built node script, or `npm run dev`. Runs inside serviceDir.
LaunchCommand resolveLaunchCommand(const QString &serviceDir);

} // namespace officebridge
