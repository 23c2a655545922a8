/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "layout/LayoutSerialization.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QSet>

#include <utility>

namespace Termgrid
{
namespace LayoutSerialization
{

namespace
{
const QLatin1String KeyId("id");
const QLatin1String KeyX("x");
const QLatin1String KeyY("y");
const QLatin1String KeyWidth("w");
const QLatin1String KeyHeight("h");
const QLatin1String KeyTabs("tabs");
const QLatin1String KeyTitle("title");
const QLatin1String KeySessionId("sessionId");
const QLatin1String KeyWorkingDirectory("workingDirectory");

QJsonObject tabToJson(const Tab &tab)
{
    QJsonObject object;
    object[KeyId] = tab.id;
    object[KeyTitle] = tab.title;
    object[KeySessionId] = tab.hasSession() ? QJsonValue(tab.sessionId) : QJsonValue(QJsonValue::Null);
    object[KeyWorkingDirectory] = tab.workingDirectory;
    return object;
}

bool readInt(const QJsonObject &object, QLatin1String key, int *value)
{
    const QJsonValue field = object.value(key);
    if (!field.isDouble()) {
        return false;
    }
    *value = field.toInt();
    return true;
}

bool tabFromJson(const QJsonValue &value, Tab *tab, QString *error)
{
    if (!value.isObject()) {
        *error = QStringLiteral("tab entry is not an object");
        return false;
    }
    const QJsonObject object = value.toObject();

    const QJsonValue id = object.value(KeyId);
    if (!id.isString() || id.toString().isEmpty()) {
        *error = QStringLiteral("tab without an id");
        return false;
    }
    tab->id = id.toString();
    tab->title = object.value(KeyTitle).toString();
    tab->workingDirectory = object.value(KeyWorkingDirectory).toString();

    const QJsonValue sessionId = object.value(KeySessionId);
    if (sessionId.isString()) {
        tab->sessionId = sessionId.toString();
    } else if (sessionId.isNull() || sessionId.isUndefined()) {
        tab->sessionId.clear();
    } else {
        *error = QStringLiteral("tab %1 has a malformed sessionId").arg(tab->id);
        return false;
    }
    return true;
}

bool cellFromJson(const QJsonValue &value, GridCell *cell, QString *error)
{
    if (!value.isObject()) {
        *error = QStringLiteral("cell entry is not an object");
        return false;
    }
    const QJsonObject object = value.toObject();

    const QJsonValue id = object.value(KeyId);
    if (!id.isString() || id.toString().isEmpty()) {
        *error = QStringLiteral("cell without an id");
        return false;
    }
    cell->id = id.toString();

    if (!readInt(object, KeyX, &cell->x) || !readInt(object, KeyY, &cell->y) || !readInt(object, KeyWidth, &cell->w)
        || !readInt(object, KeyHeight, &cell->h)) {
        *error = QStringLiteral("cell %1 has malformed geometry").arg(cell->id);
        return false;
    }

    const QJsonValue tabs = object.value(KeyTabs);
    if (tabs.isUndefined() || tabs.isNull()) {
        return true;
    }
    if (!tabs.isArray()) {
        *error = QStringLiteral("cell %1 has malformed tabs").arg(cell->id);
        return false;
    }

    const QJsonArray tabArray = tabs.toArray();
    for (const QJsonValue &tabValue : tabArray) {
        Tab tab;
        if (!tabFromJson(tabValue, &tab, error)) {
            return false;
        }
        cell->tabs.append(tab);
    }
    return true;
}
}

QByteArray serialize(const QList<GridCell> &cells)
{
    QJsonArray cellArray;
    for (const GridCell &cell : cells) {
        QJsonObject object;
        object[KeyId] = cell.id;
        object[KeyX] = cell.x;
        object[KeyY] = cell.y;
        object[KeyWidth] = cell.w;
        object[KeyHeight] = cell.h;

        QJsonArray tabArray;
        for (const Tab &tab : cell.tabs) {
            tabArray.append(tabToJson(tab));
        }
        object[KeyTabs] = tabArray;

        cellArray.append(object);
    }
    return QJsonDocument(cellArray).toJson(QJsonDocument::Compact);
}

std::optional<QList<GridCell>> deserialize(const QByteArray &blob, QString *error)
{
    QString message;

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(blob, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        message = parseError.errorString();
    } else if (!document.isArray()) {
        message = QStringLiteral("layout is not an array");
    }

    QList<GridCell> cells;
    if (message.isEmpty()) {
        QSet<QString> cellIds;
        QSet<QString> tabIds;
        const QJsonArray cellArray = document.array();
        for (const QJsonValue &value : cellArray) {
            GridCell cell;
            if (!cellFromJson(value, &cell, &message)) {
                break;
            }
            if (cellIds.contains(cell.id)) {
                message = QStringLiteral("duplicate cell id %1").arg(cell.id);
                break;
            }
            cellIds.insert(cell.id);
            for (const Tab &tab : std::as_const(cell.tabs)) {
                if (tabIds.contains(tab.id)) {
                    message = QStringLiteral("duplicate tab id %1").arg(tab.id);
                    break;
                }
                tabIds.insert(tab.id);
            }
            if (!message.isEmpty()) {
                break;
            }
            cells.append(cell);
        }
    }

    if (!message.isEmpty()) {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    }
    return cells;
}

} // namespace LayoutSerialization
} // namespace Termgrid
