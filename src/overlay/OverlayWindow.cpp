#include "OverlayWindow.hpp"

#include <QAction>
#include <QApplication>
#include <QContextMenuEvent>
#include <QEnterEvent>
#include <QHBoxLayout>
#include <QKeySequence>
#include <QLabel>
#include <QMenu>
#include <QMouseEvent>
#include <QPushButton>
#include <QResizeEvent>
#include <QSizePolicy>
#include <QTimer>
#include <QVBoxLayout>

namespace ft {

    namespace {

        constexpr int     STATUS_VISIBLE_MS = 3000;
        constexpr int     MIN_WIDTH         = 150;
        constexpr int     MIN_HEIGHT        = 100;

        const char* const BUTTON_STYLE = "QPushButton { background-color: rgba(40, 40, 40, 220); border: 2px solid #ffffff; border-radius: 14px;"
                                         " color: #ffffff; font-weight: bold; min-width: 28px; min-height: 28px; }"
                                         " QPushButton:hover { background-color: rgba(80, 80, 80, 240); }"
                                         " QPushButton:pressed { background-color: rgba(120, 120, 120, 255); }"
                                         " QPushButton:disabled { color: #555555; border-color: #555555; }";

    } // namespace

    OverlayWindow::OverlayWindow(TimerController* controller, QWidget* parent) : QWidget(parent), m_controller(controller) {

        setWindowTitle("FloatTime");
        setObjectName("FloatTimeOverlay");
        setWindowFlags(Qt::Tool | Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint);
        setAttribute(Qt::WA_TranslucentBackground);
        setMinimumSize(MIN_WIDTH, MIN_HEIGHT);
        resize(300, 150);

        auto* background = new QWidget(this);
        background->setObjectName("OverlayBackground");
        background->setStyleSheet("#OverlayBackground { background-color: rgba(0, 0, 0, 200); border-radius: 10px; }");

        auto* rootLayout = new QVBoxLayout(this);
        rootLayout->setContentsMargins(0, 0, 0, 0);
        rootLayout->addWidget(background);

        auto* layout = new QVBoxLayout(background);
        layout->setContentsMargins(12, 8, 12, 8);
        layout->setSpacing(2);

        m_titleLabel = new QLabel(background);
        m_titleLabel->setAlignment(Qt::AlignCenter);
        m_titleLabel->setStyleSheet("color: #d1d7d3; font-size: 13px;");
        m_titleLabel->hide();

        m_timerLabel = new QLabel(QString::fromLatin1(timer::IDLE_TEXT), background);
        m_timerLabel->setAlignment(Qt::AlignCenter);
        m_timerLabel->setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Expanding);

        m_nextLabel = new QLabel(background);
        m_nextLabel->setAlignment(Qt::AlignCenter);
        m_nextLabel->setStyleSheet("color: #999; font-size: 11px;");
        m_nextLabel->hide();

        m_statusLabel = new QLabel(background);
        m_statusLabel->setAlignment(Qt::AlignCenter);
        m_statusLabel->setStyleSheet("color: #cc4a4a; font-size: 11px;");
        m_statusLabel->hide();

        m_controlsWidget = new QWidget(background);
        auto* buttonRow  = new QHBoxLayout(m_controlsWidget);
        buttonRow->setContentsMargins(0, 0, 0, 0);
        buttonRow->setSpacing(6);

        m_prevButton              = makeControlButton(QString::fromUtf8("⏮"), "Previous event");
        auto*        startButton  = makeControlButton(QString::fromUtf8("▶"), "Start");
        auto*        pauseButton  = makeControlButton(QString::fromUtf8("⏸"), "Pause");
        auto*        reloadButton = makeControlButton(QString::fromUtf8("↻"), "Reload event");
        auto*        removeButton = makeControlButton(QString::fromUtf8("−1"), "Remove one minute");
        auto*        addButton    = makeControlButton("+1", "Add one minute");
        m_nextButton              = makeControlButton(QString::fromUtf8("⏭"), "Next event");

        m_sessionButtons = {startButton, pauseButton, reloadButton, removeButton, addButton};

        buttonRow->addStretch(1);
        for (QPushButton* button : {m_prevButton, startButton, pauseButton, reloadButton, removeButton, addButton, m_nextButton}) {
            buttonRow->addWidget(button);
        }
        buttonRow->addStretch(1);
        m_controlsWidget->hide();

        layout->addWidget(m_titleLabel);
        layout->addWidget(m_timerLabel, 1);
        layout->addWidget(m_nextLabel);
        layout->addWidget(m_statusLabel);
        layout->addWidget(m_controlsWidget);

        connect(startButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.start(); }); });
        connect(pauseButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.pause(); }); });
        connect(reloadButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.reload(); }); });
        connect(addButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.addMinute(); }); });
        connect(removeButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.removeMinute(); }); });
        connect(m_prevButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.previous(); }); });
        connect(m_nextButton, &QPushButton::clicked, this, [this]() { m_controller->issue([](auto& d) { return d.next(); }); });

        m_blinkAction = new QAction("Blink", this);
        m_blinkAction->setCheckable(true);
        m_controller->bindToggle(m_blinkAction, [](control::IntentDispatcher& d, bool checked) { return d.setBlink(checked); });

        m_blackoutAction = new QAction("Blackout", this);
        m_blackoutAction->setCheckable(true);
        m_controller->bindToggle(m_blackoutAction, [](control::IntentDispatcher& d, bool checked) { return d.setBlackout(checked); });

        m_clockAction = new QAction("Show Clock", this);
        m_clockAction->setCheckable(true);
        m_clockAction->setChecked(m_controller->displayMode() == DisplayMode::Clock);
        connect(m_clockAction, &QAction::toggled, this,
                [this](bool checked) { m_controller->setDisplayMode(checked ? DisplayMode::Clock : DisplayMode::Timer); });

        m_durationAction = new QAction("+/- 1 changes event length", this);
        m_durationAction->setCheckable(true);
        m_durationAction->setChecked(m_controller->addtimeAffectsEventDuration());
        connect(m_durationAction, &QAction::toggled, this, [this](bool checked) { m_controller->setAddtimeAffectsEventDuration(checked); });

        m_quitAction = new QAction("Quit", this);
        m_quitAction->setShortcut(QKeySequence::Quit);
        m_quitAction->setShortcutContext(Qt::ApplicationShortcut);
        connect(m_quitAction, &QAction::triggered, this, []() { QCoreApplication::quit(); });
        addAction(m_quitAction);

        m_statusTimer = new QTimer(this);
        m_statusTimer->setSingleShot(true);
        m_statusTimer->setInterval(STATUS_VISIBLE_MS);
        connect(m_statusTimer, &QTimer::timeout, this, [this]() { m_statusLabel->hide(); });

        connect(m_controller, &TimerController::renderStateChanged, this, [this](const timer::RenderState& state) { applyRenderState(state); });
        connect(m_controller, &TimerController::statusMessage, this, [this](const QString& status) { setStatusText(status); });
        connect(m_controller, &TimerController::controlRejected, this,
                [this](control::IntentResult result) { setStatusText(QStringLiteral("Control rejected: %1").arg(QString::fromLatin1(control::toString(result)))); });

        applyRenderState(m_controller->renderState());
    }

    void OverlayWindow::contextMenuEvent(QContextMenuEvent* event) {
        QMenu menu(this);
        menu.addAction(m_blinkAction);
        menu.addAction(m_blackoutAction);
        menu.addSeparator();
        menu.addAction(m_clockAction);
        menu.addAction(m_durationAction);
        menu.addSeparator();
        menu.addAction(m_quitAction);
        menu.exec(event->globalPos());
    }

    void OverlayWindow::enterEvent(QEnterEvent* event) {
        m_controlsWidget->show();
        QWidget::enterEvent(event);
    }

    void OverlayWindow::leaveEvent(QEvent* event) {
        m_controlsWidget->hide();
        QWidget::leaveEvent(event);
    }

    void OverlayWindow::mouseDoubleClickEvent(QMouseEvent* event) {
        if (event->button() != Qt::LeftButton) {
            QWidget::mouseDoubleClickEvent(event);
            return;
        }

        m_controller->issue([](auto& d) { return d.reloadAndStart(); });
    }

    void OverlayWindow::mousePressEvent(QMouseEvent* event) {
        if (event->button() == Qt::LeftButton) {
            m_dragOffset = event->globalPosition().toPoint() - frameGeometry().topLeft();
        }
        QWidget::mousePressEvent(event);
    }

    void OverlayWindow::mouseMoveEvent(QMouseEvent* event) {
        if (event->buttons() & Qt::LeftButton) {
            move(event->globalPosition().toPoint() - m_dragOffset);
        }
        QWidget::mouseMoveEvent(event);
    }

    void OverlayWindow::resizeEvent(QResizeEvent* event) {
        QWidget::resizeEvent(event);
        updateFontSizes();
    }

    void OverlayWindow::applyRenderState(const timer::RenderState& state) {
        m_timerLabel->setText(state.displayText);

        QColor color = timer::colorFor(state.colorTier);
        if (state.dimmed) {
            color.setAlpha(110);
        }
        m_timerLabel->setStyleSheet(QStringLiteral("color: %1; font-weight: bold;").arg(color.name(QColor::HexArgb)));

        m_titleLabel->setText(state.title);
        m_titleLabel->setVisible(!state.title.isEmpty());
        m_nextLabel->setText(state.nextTitle.isEmpty() ? QString() : QStringLiteral("Next: %1").arg(state.nextTitle));
        m_nextLabel->setVisible(!state.nextTitle.isEmpty());

        m_prevButton->setEnabled(state.prevEnabled);
        m_nextButton->setEnabled(state.nextEnabled);
        for (QPushButton* button : m_sessionButtons) {
            button->setEnabled(state.connected);
        }
        m_blinkAction->setEnabled(state.connected);
        m_blackoutAction->setEnabled(state.connected);

        setToolTip(state.connected ? QString() : QStringLiteral("Not connected to Ontime"));

        // MM:SS and HH:MM:SS need different font sizes to fill the window
        if (state.displayText.size() != m_lastTextLength) {
            m_lastTextLength = state.displayText.size();
            updateFontSizes();
        }
    }

    void OverlayWindow::setStatusText(const QString& text) {
        m_statusLabel->setText(text);
        m_statusLabel->setVisible(!text.isEmpty());
        m_statusTimer->start();
    }

    void OverlayWindow::updateFontSizes() {
        const int characters = qMax(5, m_timerLabel->text().size());
        const int byHeight   = static_cast<int>(m_timerLabel->height() * 0.8);
        const int byWidth    = static_cast<int>(m_timerLabel->width() / (characters * 0.62));

        QFont     font = m_timerLabel->font();
        font.setPixelSize(qMax(10, qMin(byHeight, byWidth)));
        font.setBold(true);
        m_timerLabel->setFont(font);
    }

    QPushButton* OverlayWindow::makeControlButton(const QString& text, const QString& toolTip) {
        auto* button = new QPushButton(text, m_controlsWidget);
        button->setStyleSheet(BUTTON_STYLE);
        button->setToolTip(toolTip);
        button->setCursor(Qt::PointingHandCursor);
        button->setSizePolicy(QSizePolicy::Fixed, QSizePolicy::Fixed);
        return button;
    }

} // namespace ft
