/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "layout/LayoutStore.h"

#include "layout/LayoutSerialization.h"
#include "layout/LayoutStorage.h"
#include "session/SessionRegistry.h"

#include <QLoggingCategory>
#include <QUuid>

#include <utility>

Q_LOGGING_CATEGORY(TermgridLayout, "termgrid.layout", QtInfoMsg)

namespace Termgrid
{

static QString createId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

LayoutStore::LayoutStore(LayoutStorage *storage, SessionRegistry *registry, const WorkspaceConfig &config, QObject *parent)
    : QObject(parent)
    , _storage(storage)
    , _registry(registry)
    , _config(config)
{
}

GridCell LayoutStore::defaultCell(int x, int y) const
{
    Tab tab;
    tab.id = createId();
    tab.title = QStringLiteral("Terminal 1");
    tab.workingDirectory = _config.defaultWorkingDirectory;

    GridCell cell;
    cell.id = createId();
    cell.x = x;
    cell.y = y;
    cell.w = _config.defaultCellWidth;
    cell.h = _config.defaultCellHeight;
    cell.tabs.append(tab);
    return cell;
}

void LayoutStore::clampSize(GridCell &cell) const
{
    const int columns = qMax(_config.minCellWidth, _config.gridColumns);
    cell.w = qMax(_config.minCellWidth, qMin(cell.w, columns));
    cell.x = qMax(0, qMin(cell.x, columns - cell.w));
    cell.h = qMax(_config.minCellHeight, qMin(cell.h, MaxRows));
    cell.y = qMax(0, qMin(cell.y, MaxRows));
}

void LayoutStore::load()
{
    _cells.clear();

    const QByteArray blob = _storage->read();
    if (!blob.trimmed().isEmpty()) {
        QString error;
        const std::optional<QList<GridCell>> parsed = LayoutSerialization::deserialize(blob, &error);
        if (parsed.has_value()) {
            _cells = *parsed;
        } else {
            qCWarning(TermgridLayout) << "LayoutParseError: discarding stored layout:" << error;
        }
    }

    for (GridCell &cell : _cells) {
        clampSize(cell);
        // Sessions from an earlier run are gone
        for (Tab &tab : cell.tabs) {
            tab.sessionId.clear();
        }
    }

    if (_cells.isEmpty()) {
        _cells.append(defaultCell(0, 0));
    }

    qCInfo(TermgridLayout) << "Loaded" << _cells.size() << "cells";
    Q_EMIT layoutLoaded();
}

bool LayoutStore::save()
{
    if (!_storage->write(LayoutSerialization::serialize(_cells))) {
        qCWarning(TermgridLayout) << "Could not write the layout to storage";
        return false;
    }
    return true;
}

QString LayoutStore::addCell()
{
    int y = 0;
    for (const GridCell &existing : std::as_const(_cells)) {
        y = qMax(y, existing.bottom());
    }

    GridCell cell = defaultCell(0, y);
    clampSize(cell);
    _cells.append(cell);
    qCDebug(TermgridLayout) << "Added cell" << cell.id << "at row" << cell.y;

    Q_EMIT cellAdded(cell);
    save();
    return cell.id;
}

bool LayoutStore::removeCell(const QString &cellId)
{
    const int index = indexOf(cellId);
    if (index < 0) {
        return false;
    }

    const GridCell cell = _cells.takeAt(index);
    for (const Tab &tab : cell.tabs) {
        if (tab.hasSession()) {
            _registry->kill(tab.sessionId);
        }
    }
    qCDebug(TermgridLayout) << "Removed cell" << cellId << "with" << cell.tabs.size() << "tabs";

    Q_EMIT cellRemoved(cellId);
    save();
    return true;
}

bool LayoutStore::updateCellGeometry(const QString &cellId, int x, int y, int w, int h)
{
    const int index = indexOf(cellId);
    if (index < 0) {
        return false;
    }

    GridCell &cell = _cells[index];
    GridCell updated = cell;
    updated.x = x;
    updated.y = y;
    updated.w = w;
    updated.h = h;
    clampSize(updated);
    if (updated == cell) {
        return true;
    }

    cell = updated;
    Q_EMIT cellGeometryChanged(cell);
    save();
    return true;
}

void LayoutStore::onTabsChanged(const QString &cellId, const QList<Tab> &tabs)
{
    const int index = indexOf(cellId);
    if (index < 0) {
        qCDebug(TermgridLayout) << "Tabs changed for unknown cell" << cellId;
        return;
    }

    _cells[index].tabs = tabs;
    save();
}

QList<GridCell> LayoutStore::cells() const
{
    return _cells;
}

std::optional<GridCell> LayoutStore::cell(const QString &cellId) const
{
    const int index = indexOf(cellId);
    if (index < 0) {
        return std::nullopt;
    }
    return _cells.at(index);
}

int LayoutStore::indexOf(const QString &cellId) const
{
    for (int i = 0; i < _cells.size(); ++i) {
        if (_cells.at(i).id == cellId) {
            return i;
        }
    }
    return -1;
}

int LayoutStore::count() const
{
    return _cells.size();
}

} // namespace Termgrid

#include "moc_LayoutStore.cpp"
