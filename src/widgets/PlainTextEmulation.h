/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PLAINTEXTEMULATION_H
#define PLAINTEXTEMULATION_H

#include <QPlainTextEdit>
#include <QPointer>
#include <QStringDecoder>

#include "terminal/TerminalEmulation.h"
#include "termgridprivate_export.h"

namespace Termgrid
{

/**
 * Read-only text view that turns key presses into terminal input bytes.
 */
class TERMGRIDPRIVATE_EXPORT TerminalTextView : public QPlainTextEdit
{
    Q_OBJECT
public:
    explicit TerminalTextView(QWidget *parent = nullptr);

    static QByteArray keyToBytes(const QKeyEvent *event);

Q_SIGNALS:
    void keyData(const QByteArray &data);

protected:
    void keyPressEvent(QKeyEvent *event) override;
    bool focusNextPrevChild(bool next) override;
};

/**
 * Minimal rendering engine: control and escape sequences are dropped
 * and the remaining text is appended to a TerminalTextView.
 */
class TERMGRIDPRIVATE_EXPORT PlainTextEmulation : public TerminalEmulation
{
    Q_OBJECT
public:
    explicit PlainTextEmulation(QObject *parent = nullptr);
    ~PlainTextEmulation() override;

    void receiveData(const QByteArray &data) override;
    void showNotice(const QString &text) override;
    void localEcho(const QByteArray &data) override;

    void setImageSize(int lines, int columns) override;
    int lines() const override;
    int columns() const override;

    void focus() override;
    QWidget *view() const override;

    /** Printable text left after removing control sequences. */
    QString filter(const QString &text);

private:
    enum class ParserState {
        Ground,
        Escape,
        EscapeIntermediate,
        Csi,
        Osc,
        OscEscape,
    };

    void appendText(const QString &text);

    QPointer<TerminalTextView> _view;
    QStringDecoder _decoder;
    ParserState _state = ParserState::Ground;
    int _lines = 24;
    int _columns = 80;
};

} // namespace Termgrid

#endif // PLAINTEXTEMULATION_H
