/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALEMULATION_H
#define TERMINALEMULATION_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include "termgridprivate_export.h"

class QWidget;

namespace Termgrid
{

/**
 * Contract of the terminal rendering engine.
 *
 * The engine parses and draws the byte stream it receives; Termgrid only
 * feeds it output, tells it its size, and forwards whatever it emits on
 * sendData() as keyboard input.
 */
class TERMGRIDPRIVATE_EXPORT TerminalEmulation : public QObject
{
    Q_OBJECT
public:
    explicit TerminalEmulation(QObject *parent = nullptr);
    ~TerminalEmulation() override;

    /** Process output from the shell. */
    virtual void receiveData(const QByteArray &data) = 0;

    /** Show a line of text that did not come from the shell. */
    virtual void showNotice(const QString &text) = 0;

    /** Echo input locally while no session is attached. */
    virtual void localEcho(const QByteArray &data) = 0;

    virtual void setImageSize(int lines, int columns) = 0;
    virtual int lines() const = 0;
    virtual int columns() const = 0;

    virtual void focus() = 0;

    /** Widget showing this terminal, or nullptr for headless engines. */
    virtual QWidget *view() const;

Q_SIGNALS:
    /** Bytes produced by the user's keyboard input. */
    void sendData(const QByteArray &data);
};

} // namespace Termgrid

#endif // TERMINALEMULATION_H
