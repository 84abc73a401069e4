#pragma once

#include "../core/TimerController.hpp"

#include <QList>
#include <QPoint>
#include <QWidget>

class QAction;
class QLabel;
class QPushButton;
class QTimer;

namespace ft {

    class OverlayWindow : public QWidget {
        Q_OBJECT

      public:
        explicit OverlayWindow(TimerController* controller, QWidget* parent = nullptr);

      protected:
        void contextMenuEvent(QContextMenuEvent* event) override;
        void enterEvent(QEnterEvent* event) override;
        void leaveEvent(QEvent* event) override;
        void mouseDoubleClickEvent(QMouseEvent* event) override;
        void mousePressEvent(QMouseEvent* event) override;
        void mouseMoveEvent(QMouseEvent* event) override;
        void resizeEvent(QResizeEvent* event) override;

      private:
        void             applyRenderState(const timer::RenderState& state);
        void             setStatusText(const QString& text);
        void             updateFontSizes();
        QPushButton*     makeControlButton(const QString& text, const QString& toolTip);

        TimerController* m_controller = nullptr;

        QWidget*         m_controlsWidget = nullptr;
        QLabel*          m_titleLabel     = nullptr;
        QLabel*          m_timerLabel     = nullptr;
        QLabel*          m_nextLabel      = nullptr;
        QLabel*          m_statusLabel    = nullptr;
        QPushButton*     m_prevButton     = nullptr;
        QPushButton*     m_nextButton     = nullptr;
        QList<QPushButton*> m_sessionButtons;

        QAction*         m_blinkAction    = nullptr;
        QAction*         m_blackoutAction = nullptr;
        QAction*         m_clockAction    = nullptr;
        QAction*         m_durationAction = nullptr;
        QAction*         m_quitAction     = nullptr;

        QTimer*          m_statusTimer    = nullptr;
        QPoint           m_dragOffset;
        int              m_lastTextLength = 0;
    };

} // namespace ft
