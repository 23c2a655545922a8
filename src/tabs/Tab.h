/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TAB_H
#define TAB_H

#include <QList>
#include <QMetaType>
#include <QString>

namespace Termgrid
{

struct Tab {
    QString id;
    QString title;
    // Empty while no backend session is attached
    QString sessionId;
    QString workingDirectory;

    bool hasSession() const
    {
        return !sessionId.isEmpty();
    }

    bool operator==(const Tab &other) const
    {
        return id == other.id && title == other.title && sessionId == other.sessionId && workingDirectory == other.workingDirectory;
    }

    bool operator!=(const Tab &other) const
    {
        return !(*this == other);
    }
};

} // namespace Termgrid

Q_DECLARE_METATYPE(Termgrid::Tab)

#endif // TAB_H
