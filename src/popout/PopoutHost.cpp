/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "popout/PopoutHost.h"

namespace Termgrid
{

PopoutHost::PopoutHost(QObject *parent)
    : QObject(parent)
{
}

PopoutHost::~PopoutHost() = default;

} // namespace Termgrid

#include "moc_PopoutHost.cpp"
