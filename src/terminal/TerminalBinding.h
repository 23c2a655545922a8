/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TERMINALBINDING_H
#define TERMINALBINDING_H

#include <QByteArray>
#include <QObject>
#include <QString>

#include <functional>
#include <optional>

#include "termgridprivate_export.h"

namespace Termgrid
{

class SessionRegistry;
class TerminalEmulation;

/**
 * Runtime association between one tab, its rendering engine and at most
 * one backend session.
 *
 * A binding starts Unbound and becomes Bound when a session is created
 * for it (or when it is mounted with an existing session id).  Once the
 * bound session exits the binding stays Unbound for good.
 */
class TERMGRIDPRIVATE_EXPORT TerminalBinding : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Unbound,
        Bound,
    };
    Q_ENUM(State)

    using EmulationFactory = std::function<TerminalEmulation *(QObject *parent)>;

    struct Options {
        bool autoCreate = true;
        QString workingDirectory;
        // Attach to this session instead of creating one
        QString sessionId;
    };

    TerminalBinding(SessionRegistry *registry, EmulationFactory factory, const Options &options, QObject *parent = nullptr);
    ~TerminalBinding() override;

    /**
     * Instantiate the rendering engine at the given size and start
     * listening for session events.  With auto-create, the session is
     * requested after the first frame has been drawn.
     */
    void mount(int lines, int columns);
    bool isMounted() const;

    /**
     * Explicitly request a session, e.g. to retry after a spawn failure.
     * Returns false when the binding is already bound, a request is in
     * flight, the previous session has exited, or it is not mounted.
     */
    bool createSession();
    /** True while createSession() would issue a request. */
    bool canCreateSession() const;

    void geometryChanged(int lines, int columns);
    void requestFocus();

    /**
     * Give up the bound session without killing it.  The binding ignores
     * all further session events; a create still in flight is killed
     * when it completes.
     */
    QString release();

    State state() const;
    QString sessionId() const;
    bool isCreatePending() const;
    bool hasExited() const;
    QString errorText() const;
    QString workingDirectory() const;
    int lines() const;
    int columns() const;

    TerminalEmulation *emulation() const;

Q_SIGNALS:
    void bound(const QString &sessionId);
    void sessionExited(const QString &sessionId, std::optional<int> exitCode);
    void spawnFailed(const QString &message);
    void focusRequested();
    // Any change of state(), isCreatePending() or hasExited()
    void stateChanged();

private Q_SLOTS:
    void onOutput(const QString &sessionId, const QByteArray &data);
    void onExit(const QString &sessionId, std::optional<int> exitCode);
    void onInput(const QByteArray &data);

private:
    void onCreateFinished(bool success, const QString &result);

    SessionRegistry *_registry;
    EmulationFactory _factory;
    Options _options;
    TerminalEmulation *_emulation = nullptr;

    State _state = State::Unbound;
    QString _sessionId;
    bool _createPending = false;
    bool _exited = false;
    bool _released = false;
    QString _errorText;

    int _lines = 0;
    int _columns = 0;
    // Geometry changed while a create was in flight
    bool _resizePending = false;
};

} // namespace Termgrid

#endif // TERMINALBINDING_H
