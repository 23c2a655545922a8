/*
    SPDX-FileCopyrightText: 2025 Termgrid contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/CellWidget.h"

#include "tabs/TabController.h"
#include "terminal/TerminalBinding.h"
#include "terminal/TerminalEmulation.h"
#include "widgets/TerminalPageWidget.h"

#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QMouseEvent>
#include <QPainter>
#include <QTabBar>
#include <QTabWidget>
#include <QToolButton>
#include <QVBoxLayout>

namespace Termgrid
{

static const char TabIdProperty[] = "termgridTabId";

namespace
{
const int HandleSize = 12;

// Bottom-right grip; dragging it asks the grid to resize the cell
class CellResizeHandle : public QWidget
{
public:
    explicit CellResizeHandle(CellWidget *cell)
        : QWidget(cell)
        , _cell(cell)
    {
        setObjectName(QStringLiteral("cellResizeHandle"));
        setFixedSize(HandleSize, HandleSize);
        setCursor(Qt::SizeFDiagCursor);
    }

protected:
    void mousePressEvent(QMouseEvent *event) override
    {
        if (event->button() != Qt::LeftButton) {
            QWidget::mousePressEvent(event);
            return;
        }
        _dragging = true;
        _pressPosition = event->globalPosition().toPoint();
        _startSize = _cell->size();
        event->accept();
    }

    void mouseMoveEvent(QMouseEvent *event) override
    {
        if (!_dragging) {
            QWidget::mouseMoveEvent(event);
            return;
        }
        const QPoint delta = event->globalPosition().toPoint() - _pressPosition;
        _cell->requestResize(_startSize + QSize(delta.x(), delta.y()));
        event->accept();
    }

    void mouseReleaseEvent(QMouseEvent *event) override
    {
        _dragging = false;
        QWidget::mouseReleaseEvent(event);
    }

    void paintEvent(QPaintEvent *) override
    {
        QPainter painter(this);
        painter.setPen(palette().color(QPalette::Mid));
        for (int offset = 3; offset < HandleSize; offset += 4) {
            painter.drawLine(offset, HandleSize - 1, HandleSize - 1, offset);
        }
    }

private:
    CellWidget *_cell;
    bool _dragging = false;
    QPoint _pressPosition;
    QSize _startSize;
};
}

CellWidget::CellWidget(TabController *controller, QWidget *parent)
    : QWidget(parent)
    , _controller(controller)
    , _tabWidget(new QTabWidget(this))
    , _newTabButton(new QToolButton(this))
    , _popoutButton(new QToolButton(this))
    , _removeButton(new QToolButton(this))
    , _startButton(new QToolButton(this))
    , _resizeHandle(new CellResizeHandle(this))
{
    _tabWidget->setTabsClosable(true);
    _tabWidget->setMovable(false);
    _tabWidget->setDocumentMode(true);

    _startButton->setObjectName(QStringLiteral("startSessionButton"));
    _startButton->setText(QStringLiteral("▶"));
    _startButton->setToolTip(QStringLiteral("Start a shell in the current tab"));
    _startButton->setAutoRaise(true);
    _newTabButton->setText(QStringLiteral("+"));
    _newTabButton->setToolTip(QStringLiteral("New tab"));
    _newTabButton->setAutoRaise(true);
    _popoutButton->setText(QStringLiteral("↗"));
    _popoutButton->setToolTip(QStringLiteral("Open the current tab in its own window"));
    _popoutButton->setAutoRaise(true);
    _removeButton->setText(QStringLiteral("×"));
    _removeButton->setToolTip(QStringLiteral("Remove panel"));
    _removeButton->setAutoRaise(true);

    auto *corner = new QWidget(this);
    auto *cornerLayout = new QHBoxLayout(corner);
    cornerLayout->setContentsMargins(0, 0, 0, 0);
    cornerLayout->setSpacing(0);
    cornerLayout->addWidget(_startButton);
    cornerLayout->addWidget(_newTabButton);
    cornerLayout->addWidget(_popoutButton);
    cornerLayout->addWidget(_removeButton);
    _tabWidget->setCornerWidget(corner, Qt::TopRightCorner);

    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(1, 1, 1, 1);
    layout->addWidget(_tabWidget);

    connect(_startButton, &QToolButton::clicked, this, &CellWidget::startSession);
    connect(_newTabButton, &QToolButton::clicked, this, [this]() {
        if (_controller) {
            _controller->addTab();
        }
    });
    connect(_popoutButton, &QToolButton::clicked, this, [this]() {
        if (_controller && !_controller->activeTabId().isEmpty()) {
            _controller->popout(_controller->activeTabId());
        }
    });
    connect(_removeButton, &QToolButton::clicked, this, [this]() {
        Q_EMIT removeRequested(cellId());
    });
    connect(_tabWidget, &QTabWidget::tabCloseRequested, this, [this](int index) {
        if (_controller) {
            _controller->closeTab(_tabWidget->widget(index)->property(TabIdProperty).toString());
        }
    });
    connect(_tabWidget, &QTabWidget::tabBarDoubleClicked, this, [this](int index) {
        editTabTitle(index);
    });
    connect(_tabWidget, &QTabWidget::currentChanged, this, &CellWidget::onCurrentChanged);

    connect(controller, &TabController::tabAdded, this, &CellWidget::onTabAdded);
    connect(controller, &TabController::tabRemoved, this, &CellWidget::onTabRemoved);
    connect(controller, &TabController::tabRenamed, this, &CellWidget::onTabRenamed);
    connect(controller, &TabController::activeTabChanged, this, &CellWidget::onActiveTabChanged);

    const QList<Tab> tabs = controller->tabs();
    for (int i = 0; i < tabs.size(); ++i) {
        onTabAdded(tabs.at(i).id, i);
    }
    onActiveTabChanged(controller->activeTabId());
    updateStartButton();
}

TabController *CellWidget::controller() const
{
    return _controller;
}

QString CellWidget::cellId() const
{
    return _controller ? _controller->cellId() : QString();
}

QTabWidget *CellWidget::tabWidget() const
{
    return _tabWidget;
}

QLineEdit *CellWidget::editTabTitle(int index)
{
    if (!_controller || index < 0 || index >= _tabWidget->count()) {
        return nullptr;
    }
    delete _titleEditor.data();

    const QString tabId = _tabWidget->widget(index)->property(TabIdProperty).toString();
    QTabBar *tabBar = _tabWidget->tabBar();

    auto *editor = new QLineEdit(tabBar);
    editor->setObjectName(QStringLiteral("tabTitleEditor"));
    editor->setText(_tabWidget->tabText(index));
    editor->setGeometry(tabBar->tabRect(index));
    editor->selectAll();
    editor->show();
    editor->setFocus(Qt::OtherFocusReason);
    _titleEditor = editor;

    // Return and focus loss both finish the edit; only the first one counts
    connect(editor, &QLineEdit::editingFinished, this, [this, editor, tabId]() {
        disconnect(editor, &QLineEdit::editingFinished, this, nullptr);
        const QString title = editor->text().trimmed();
        if (_controller && !title.isEmpty()) {
            _controller->renameTab(tabId, title);
        }
        editor->hide();
        editor->deleteLater();
    });
    return editor;
}

void CellWidget::requestResize(const QSize &size)
{
    Q_EMIT resizeRequested(cellId(), size);
}

void CellWidget::resizeEvent(QResizeEvent *event)
{
    QWidget::resizeEvent(event);
    _resizeHandle->move(width() - _resizeHandle->width(), height() - _resizeHandle->height());
    _resizeHandle->raise();
}

int CellWidget::pageIndex(const QString &tabId) const
{
    for (int i = 0; i < _tabWidget->count(); ++i) {
        if (_tabWidget->widget(i)->property(TabIdProperty).toString() == tabId) {
            return i;
        }
    }
    return -1;
}

TerminalPageWidget *CellWidget::createPage(const QString &tabId)
{
    TerminalBinding *binding = _controller->binding(tabId);
    QWidget *view = nullptr;
    if (binding && binding->emulation()) {
        view = binding->emulation()->view();
    }
    if (!view) {
        view = new QLabel(QStringLiteral("No terminal view"));
    }

    auto *page = new TerminalPageWidget(view, _tabWidget);
    page->setProperty(TabIdProperty, tabId);

    if (binding) {
        QPointer<TerminalBinding> guard(binding);
        connect(page, &TerminalPageWidget::geometryChanged, this, [guard](int lines, int columns) {
            if (guard) {
                guard->geometryChanged(lines, columns);
            }
        });
        connect(binding, &TerminalBinding::stateChanged, this, &CellWidget::updateStartButton);
    }
    return page;
}

void CellWidget::startSession()
{
    if (!_controller) {
        return;
    }
    if (TerminalBinding *binding = _controller->binding(_controller->activeTabId())) {
        binding->createSession();
    }
    updateStartButton();
}

void CellWidget::updateStartButton()
{
    TerminalBinding *binding = _controller ? _controller->binding(_controller->activeTabId()) : nullptr;
    _startButton->setEnabled(binding && binding->canCreateSession());
}

void CellWidget::onTabAdded(const QString &tabId, int index)
{
    if (!_controller || pageIndex(tabId) >= 0) {
        return;
    }

    const std::optional<Tab> tab = _controller->tab(tabId);
    const QString title = tab.has_value() ? tab->title : QString();

    _syncing = true;
    _tabWidget->insertTab(index, createPage(tabId), title);
    _syncing = false;
}

void CellWidget::onTabRemoved(const QString &tabId)
{
    const int index = pageIndex(tabId);
    if (index < 0) {
        return;
    }

    _syncing = true;
    QWidget *page = _tabWidget->widget(index);
    _tabWidget->removeTab(index);
    page->deleteLater();
    _syncing = false;
}

void CellWidget::onTabRenamed(const QString &tabId, const QString &title)
{
    const int index = pageIndex(tabId);
    if (index >= 0) {
        _tabWidget->setTabText(index, title);
    }
}

void CellWidget::onActiveTabChanged(const QString &tabId)
{
    const int index = pageIndex(tabId);
    _popoutButton->setEnabled(index >= 0);
    updateStartButton();
    if (index < 0 || index == _tabWidget->currentIndex()) {
        return;
    }

    _syncing = true;
    _tabWidget->setCurrentIndex(index);
    _syncing = false;
}

void CellWidget::onCurrentChanged(int index)
{
    if (_syncing || !_controller || index < 0) {
        return;
    }
    _controller->selectTab(_tabWidget->widget(index)->property(TabIdProperty).toString());
}

} // namespace Termgrid

#include "moc_CellWidget.cpp"
