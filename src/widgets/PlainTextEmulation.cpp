/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/PlainTextEmulation.h"

#include <QFontDatabase>
#include <QKeyEvent>
#include <QScrollBar>
#include <QTextCursor>

namespace Termgrid
{

static const int MaximumScrollback = 10000;

TerminalTextView::TerminalTextView(QWidget *parent)
    : QPlainTextEdit(parent)
{
    setReadOnly(true);
    setUndoRedoEnabled(false);
    setLineWrapMode(QPlainTextEdit::WidgetWidth);
    setMaximumBlockCount(MaximumScrollback);
    setFont(QFontDatabase::systemFont(QFontDatabase::FixedFont));
    setFocusPolicy(Qt::StrongFocus);
    setTextInteractionFlags(Qt::TextSelectableByMouse | Qt::TextSelectableByKeyboard);
}

QByteArray TerminalTextView::keyToBytes(const QKeyEvent *event)
{
    switch (event->key()) {
    case Qt::Key_Return:
    case Qt::Key_Enter:
        return QByteArrayLiteral("\r");
    case Qt::Key_Backspace:
        return QByteArrayLiteral("\x7f");
    case Qt::Key_Tab:
        return QByteArrayLiteral("\t");
    case Qt::Key_Escape:
        return QByteArrayLiteral("\x1b");
    case Qt::Key_Up:
        return QByteArrayLiteral("\x1b[A");
    case Qt::Key_Down:
        return QByteArrayLiteral("\x1b[B");
    case Qt::Key_Right:
        return QByteArrayLiteral("\x1b[C");
    case Qt::Key_Left:
        return QByteArrayLiteral("\x1b[D");
    case Qt::Key_Home:
        return QByteArrayLiteral("\x1b[H");
    case Qt::Key_End:
        return QByteArrayLiteral("\x1b[F");
    case Qt::Key_Delete:
        return QByteArrayLiteral("\x1b[3~");
    default:
        break;
    }

    if (event->modifiers() & Qt::ControlModifier) {
        const int key = event->key();
        if (key >= Qt::Key_A && key <= Qt::Key_Z) {
            return QByteArray(1, static_cast<char>(key - Qt::Key_A + 1));
        }
    }

    return event->text().toUtf8();
}

void TerminalTextView::keyPressEvent(QKeyEvent *event)
{
    // Let the usual copy shortcut through
    if (event->matches(QKeySequence::Copy) && textCursor().hasSelection()) {
        QPlainTextEdit::keyPressEvent(event);
        return;
    }

    const QByteArray data = keyToBytes(event);
    if (data.isEmpty()) {
        QPlainTextEdit::keyPressEvent(event);
        return;
    }
    Q_EMIT keyData(data);
    event->accept();
}

bool TerminalTextView::focusNextPrevChild(bool next)
{
    Q_UNUSED(next)
    // Tab belongs to the shell
    return false;
}

PlainTextEmulation::PlainTextEmulation(QObject *parent)
    : TerminalEmulation(parent)
    , _view(new TerminalTextView())
    , _decoder(QStringDecoder::Utf8)
{
    connect(_view, &TerminalTextView::keyData, this, &TerminalEmulation::sendData);
}

PlainTextEmulation::~PlainTextEmulation()
{
    delete _view.data();
}

QString PlainTextEmulation::filter(const QString &text)
{
    QString result;
    result.reserve(text.size());

    for (const QChar ch : text) {
        const char16_t c = ch.unicode();
        switch (_state) {
        case ParserState::Ground:
            if (c == 0x1b) {
                _state = ParserState::Escape;
            } else if (c == u'\n' || c == u'\t') {
                result.append(ch);
            } else if (c == u'\b') {
                if (!result.isEmpty()) {
                    result.chop(1);
                }
            } else if (c >= 0x20 && c != 0x7f) {
                result.append(ch);
            }
            break;
        case ParserState::Escape:
            if (c == u'[') {
                _state = ParserState::Csi;
            } else if (c == u']') {
                _state = ParserState::Osc;
            } else if (c >= 0x20 && c <= 0x2f) {
                _state = ParserState::EscapeIntermediate;
            } else {
                _state = ParserState::Ground;
            }
            break;
        case ParserState::EscapeIntermediate:
            // ESC ( B and friends end on a final byte in 0..~
            if (c < 0x20 || c > 0x2f) {
                _state = ParserState::Ground;
            }
            break;
        case ParserState::Csi:
            // Parameters and intermediates run until a final byte in @..~
            if (c >= 0x40 && c <= 0x7e) {
                _state = ParserState::Ground;
            }
            break;
        case ParserState::Osc:
            if (c == 0x07) {
                _state = ParserState::Ground;
            } else if (c == 0x1b) {
                _state = ParserState::OscEscape;
            }
            break;
        case ParserState::OscEscape:
            _state = c == u'\\' ? ParserState::Ground : ParserState::Osc;
            break;
        }
    }
    return result;
}

void PlainTextEmulation::appendText(const QString &text)
{
    if (!_view || text.isEmpty()) {
        return;
    }

    QScrollBar *scrollBar = _view->verticalScrollBar();
    const bool atBottom = scrollBar->value() == scrollBar->maximum();

    QTextCursor cursor(_view->document());
    cursor.movePosition(QTextCursor::End);
    cursor.insertText(text);

    if (atBottom) {
        scrollBar->setValue(scrollBar->maximum());
    }
}

void PlainTextEmulation::receiveData(const QByteArray &data)
{
    appendText(filter(_decoder.decode(data)));
}

void PlainTextEmulation::showNotice(const QString &text)
{
    appendText(QLatin1Char('\n') + text + QLatin1Char('\n'));
}

void PlainTextEmulation::localEcho(const QByteArray &data)
{
    QByteArray echoed = data;
    echoed.replace('\r', "\n");
    appendText(filter(QString::fromUtf8(echoed)));
}

void PlainTextEmulation::setImageSize(int lines, int columns)
{
    _lines = lines;
    _columns = columns;
}

int PlainTextEmulation::lines() const
{
    return _lines;
}

int PlainTextEmulation::columns() const
{
    return _columns;
}

void PlainTextEmulation::focus()
{
    if (_view) {
        _view->setFocus(Qt::OtherFocusReason);
    }
}

QWidget *PlainTextEmulation::view() const
{
    return _view;
}

} // namespace Termgrid

#include "moc_PlainTextEmulation.cpp"
