#ifndef KIOSKWINDOW_H
#define KIOSKWINDOW_H

#include <QWidget>
#include <QImage>

class WindowEventHandler;

/**
 * @brief The single kiosk window.
 *
 * Shows the last frame presented by the canvas, scaled to the window. Close
 * and the quit keys are reported through quitRequested(); the window itself
 * never decides to exit.
 */
class KioskWindow : public QWidget {
    Q_OBJECT

public:
    explicit KioskWindow(const QSize& screenSize, bool fullscreen, QWidget* parent = nullptr);
    ~KioskWindow() override = default;

    void showFrame(const QImage& frame);
    void showKiosk();

    bool isFullscreenKiosk() const { return m_fullscreen; }

signals:
    void quitRequested();

protected:
    void paintEvent(QPaintEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void closeEvent(QCloseEvent* event) override;
    void changeEvent(QEvent* event) override;

private:
    WindowEventHandler* m_eventHandler;
    QImage m_frame;
    bool m_fullscreen;
};

#endif // KIOSKWINDOW_H
