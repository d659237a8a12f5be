#pragma once

#include <QString>

#include "common/errors.hpp"

namespace officebridge {

// Login autostart through an XDG autostart desktop entry:
// $XDG_CONFIG_HOME/autostart/office-bridge-desktop.desktop, falling back to
// ~/.config/autostart.
class Autostart {
public:
    // Exec= points at the running application's executable.
    Autostart();
    Autostart(QString entryDir, QString executablePath);

    static QString defaultEntryDir();

    QString entryPath() const;

    Status enable() const;
    // Removing an absent entry succeeds.
    Status disable() const;
    // Entry exists and is not marked Hidden=true.
    bool isEnabled() const;

private:
    QString m_entryDir;
    QString m_executablePath;
};

} // namespace officebridge
