/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "terminal/TerminalBinding.h"

#include "session/SessionRegistry.h"
#include "terminal/TerminalEmulation.h"

#include <QLoggingCategory>
#include <QPointer>
#include <QTimer>

Q_LOGGING_CATEGORY(TermgridBinding, "termgrid.binding", QtInfoMsg)

namespace Termgrid
{

TerminalBinding::TerminalBinding(SessionRegistry *registry, EmulationFactory factory, const Options &options, QObject *parent)
    : QObject(parent)
    , _registry(registry)
    , _factory(std::move(factory))
    , _options(options)
{
}

TerminalBinding::~TerminalBinding() = default;

void TerminalBinding::mount(int lines, int columns)
{
    if (_emulation) {
        return;
    }

    _lines = qMax(1, lines);
    _columns = qMax(1, columns);

    _emulation = _factory(this);
    _emulation->setImageSize(_lines, _columns);
    connect(_emulation, &TerminalEmulation::sendData, this, &TerminalBinding::onInput);

    // Listen before asking for a session so no early output is missed
    connect(_registry, &SessionRegistry::outputReceived, this, &TerminalBinding::onOutput);
    connect(_registry, &SessionRegistry::sessionExited, this, &TerminalBinding::onExit);

    if (!_options.sessionId.isEmpty()) {
        _sessionId = _options.sessionId;
        _state = State::Bound;
        qCDebug(TermgridBinding) << "Attached to existing session" << _sessionId;
        Q_EMIT bound(_sessionId);
        Q_EMIT stateChanged();
        return;
    }

    if (_options.autoCreate) {
        QTimer::singleShot(0, this, [this]() {
            createSession();
        });
    }
}

bool TerminalBinding::isMounted() const
{
    return _emulation != nullptr;
}

bool TerminalBinding::canCreateSession() const
{
    return _emulation && !_exited && !_released && !_createPending && _state == State::Unbound;
}

bool TerminalBinding::createSession()
{
    if (!canCreateSession()) {
        return false;
    }

    _createPending = true;
    _resizePending = false;
    _errorText.clear();
    Q_EMIT stateChanged();

    QPointer<TerminalBinding> guard(this);
    QPointer<SessionRegistry> registry(_registry);
    _registry->create(_lines, _columns, _options.workingDirectory, [guard, registry](bool success, const QString &result) {
        if (guard) {
            guard->onCreateFinished(success, result);
        } else if (success && registry) {
            // The tab went away while the shell was starting
            registry->kill(result);
        }
    });
    return true;
}

void TerminalBinding::onCreateFinished(bool success, const QString &result)
{
    _createPending = false;

    if (_released) {
        if (success) {
            _registry->kill(result);
        }
        return;
    }

    if (!success) {
        _resizePending = false;
        _errorText = result;
        qCWarning(TermgridBinding) << "SpawnError:" << result;
        _emulation->showNotice(QStringLiteral("SpawnError: %1").arg(result));
        Q_EMIT spawnFailed(result);
        Q_EMIT stateChanged();
        return;
    }

    _sessionId = result;
    _state = State::Bound;
    Q_EMIT bound(_sessionId);
    Q_EMIT stateChanged();

    if (_resizePending) {
        _resizePending = false;
        _registry->resize(_sessionId, _lines, _columns);
    }
}

void TerminalBinding::geometryChanged(int lines, int columns)
{
    if (lines <= 0 || columns <= 0) {
        return;
    }

    const bool changed = lines != _lines || columns != _columns;
    _lines = lines;
    _columns = columns;
    if (_emulation && changed) {
        _emulation->setImageSize(_lines, _columns);
    }

    if (_state == State::Bound) {
        if (changed) {
            _registry->resize(_sessionId, _lines, _columns);
        }
    } else if (_createPending) {
        _resizePending = true;
    }
}

void TerminalBinding::requestFocus()
{
    if (_emulation) {
        _emulation->focus();
    }
    Q_EMIT focusRequested();
}

QString TerminalBinding::release()
{
    disconnect(_registry, nullptr, this, nullptr);
    _released = true;
    _resizePending = false;

    const QString sessionId = _sessionId;
    _sessionId.clear();
    _state = State::Unbound;
    return sessionId;
}

void TerminalBinding::onOutput(const QString &sessionId, const QByteArray &data)
{
    if (_state != State::Bound || sessionId != _sessionId) {
        return;
    }
    _emulation->receiveData(data);
}

void TerminalBinding::onExit(const QString &sessionId, std::optional<int> exitCode)
{
    if (_state != State::Bound || sessionId != _sessionId) {
        return;
    }

    _state = State::Unbound;
    _exited = true;

    if (exitCode.has_value()) {
        _emulation->showNotice(QStringLiteral("[Process exited with code %1]").arg(*exitCode));
    } else {
        _emulation->showNotice(QStringLiteral("[Process terminated]"));
    }

    Q_EMIT sessionExited(sessionId, exitCode);
    Q_EMIT stateChanged();
}

void TerminalBinding::onInput(const QByteArray &data)
{
    if (_state == State::Bound) {
        _registry->write(_sessionId, data);
    } else {
        _emulation->localEcho(data);
    }
}

TerminalBinding::State TerminalBinding::state() const
{
    return _state;
}

QString TerminalBinding::sessionId() const
{
    return _sessionId;
}

bool TerminalBinding::isCreatePending() const
{
    return _createPending;
}

bool TerminalBinding::hasExited() const
{
    return _exited;
}

QString TerminalBinding::errorText() const
{
    return _errorText;
}

QString TerminalBinding::workingDirectory() const
{
    return _options.workingDirectory;
}

int TerminalBinding::lines() const
{
    return _lines;
}

int TerminalBinding::columns() const
{
    return _columns;
}

TerminalEmulation *TerminalBinding::emulation() const
{
    return _emulation;
}

} // namespace Termgrid

#include "moc_TerminalBinding.cpp"
