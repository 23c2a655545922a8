/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "terminal/TerminalEmulation.h"

namespace Termgrid
{

TerminalEmulation::TerminalEmulation(QObject *parent)
    : QObject(parent)
{
}

TerminalEmulation::~TerminalEmulation() = default;

QWidget *TerminalEmulation::view() const
{
    return nullptr;
}

} // namespace Termgrid

#include "moc_TerminalEmulation.cpp"
