/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef LAYOUTSTORAGE_H
#define LAYOUTSTORAGE_H

#include <QByteArray>
#include <QString>

#include "termgridprivate_export.h"

class QSettings;

namespace Termgrid
{

/**
 * A single durable slot holding the serialized layout.
 */
class TERMGRIDPRIVATE_EXPORT LayoutStorage
{
public:
    virtual ~LayoutStorage();

    /** Stored blob, or an empty array if nothing has been stored yet. */
    virtual QByteArray read() const = 0;
    virtual bool write(const QByteArray &blob) = 0;
};

/**
 * LayoutStorage backed by one QSettings key.
 */
class TERMGRIDPRIVATE_EXPORT SettingsLayoutStorage : public LayoutStorage
{
public:
    SettingsLayoutStorage(QSettings *settings, const QString &key);

    QByteArray read() const override;
    bool write(const QByteArray &blob) override;

    QString key() const;

private:
    QSettings *_settings;
    QString _key;
};

} // namespace Termgrid

#endif // LAYOUTSTORAGE_H
