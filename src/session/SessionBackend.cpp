/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "session/SessionBackend.h"

namespace Termgrid
{

SessionBackend::SessionBackend(QObject *parent)
    : QObject(parent)
{
}

SessionBackend::~SessionBackend() = default;

} // namespace Termgrid

#include "moc_SessionBackend.cpp"
