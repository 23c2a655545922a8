/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "layout/LayoutStorage.h"

#include <QSettings>

namespace Termgrid
{

LayoutStorage::~LayoutStorage() = default;

SettingsLayoutStorage::SettingsLayoutStorage(QSettings *settings, const QString &key)
    : _settings(settings)
    , _key(key)
{
}

QByteArray SettingsLayoutStorage::read() const
{
    // Stored as text so the settings file stays readable
    return _settings->value(_key).toString().toUtf8();
}

bool SettingsLayoutStorage::write(const QByteArray &blob)
{
    _settings->setValue(_key, QString::fromUtf8(blob));
    _settings->sync();
    return _settings->status() == QSettings::NoError;
}

QString SettingsLayoutStorage::key() const
{
    return _key;
}

} // namespace Termgrid
