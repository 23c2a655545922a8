/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTSERIALIZATION_H
#define LAYOUTSERIALIZATION_H

#include <QByteArray>
#include <QList>
#include <QString>

#include <optional>

#include "layout/GridCell.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

/**
 * Grid layout <-> JSON.
 *
 * The blob is a JSON array of cells:
 *   [{"id", "x", "y", "w", "h", "tabs": [{"id", "title", "sessionId", "workingDirectory"}]}]
 * with "sessionId" null for tabs that have no session.
 */
namespace LayoutSerialization
{

TERMGRIDPRIVATE_EXPORT QByteArray serialize(const QList<GridCell> &cells);

/**
 * Parse a blob produced by serialize().  Returns std::nullopt and fills
 * @p error if the blob is not valid JSON or does not have the expected
 * shape.  Session ids are returned exactly as stored.
 */
TERMGRIDPRIVATE_EXPORT std::optional<QList<GridCell>> deserialize(const QByteArray &blob, QString *error = nullptr);

} // namespace LayoutSerialization

} // namespace Termgrid

#endif // LAYOUTSERIALIZATION_H
