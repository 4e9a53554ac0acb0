#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include <QImage>
#include <QVector>

#include "tim/TimFile.h"
#include "tim/FrameStrip.h"

class QCheckBox;
class QCloseEvent;
class QComboBox;
class QDoubleSpinBox;
class QLabel;
class QListWidget;
class QPushButton;
class QScrollBar;
class QSlider;
class QSpinBox;
class QTabWidget;

class FrameAnimator;
class ImageViewport;
class ViewportInputController;

/**
 * @brief TIM browser window.
 *
 * Left sidebar: file actions, the Files and CLUTs lists and a status line.
 * Right side: zoom bar, the image viewport with scrollbars and the
 * animation bar. The viewport always shows either the whole rendered
 * sheet or, with Animate on, the current frame of the sliced strip.
 */
class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow() override;

    /**
     * @brief Load TIM files, replacing the current set.
     * @return Number of files loaded.
     */
    int loadTimFiles(const QStringList &paths);

    ImageViewport* viewport() const { return m_viewport; }

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void onLoadTims();
    void onExportImage();
    void onExportIndices();
    void onImportIndices();
    void onSaveTimAs();
    void onShowControls();

    void onFileSelected(int row);
    void onClutSelected(int row);

    void onAnimateToggled(bool enabled);
    void onApplyFrames();
    void onPlay();
    void onScrub(int index);
    void onFrameChanged(int index, const QImage &frame);

    void onZoomSlider(int value);
    void onViewportZoomChanged(qreal zoom);
    void onFit();

    void syncScrollBars();
    void onScrollBarMoved();

private:
    void setupUi();
    QWidget* createSidebar();
    QWidget* createZoomBar();
    QWidget* createAnimationBar();

    void loadSettings();
    void saveSettings();

    TimImage* currentTim();

    /**
     * @brief Re-render the current TIM and rebuild its frames.
     * @param autoDetect Guess the frame layout from the sheet size.
     */
    void rebuildSheetAndFrames(bool autoDetect);
    void rebuildFrames();

    QImage currentViewImage() const;
    void pushCurrentImage(bool recenter, bool force);
    void setStatus(const QString &extra = QString());

    void showError(const QString &title, const QString &message);

    // ===== TIM state =====
    QVector<TimImage> m_tims;
    QVector<TimClut> m_allCluts;
    int m_currentTim = -1;
    QImage m_sheet;
    FrameAnimator *m_animator = nullptr;
    QString m_lastDir;

    // ===== Viewport =====
    ImageViewport *m_viewport = nullptr;
    ViewportInputController *m_input = nullptr;
    QScrollBar *m_hScroll = nullptr;
    QScrollBar *m_vScroll = nullptr;

    // ===== Sidebar =====
    QTabWidget *m_listTabs = nullptr;
    QListWidget *m_filesList = nullptr;
    QListWidget *m_clutList = nullptr;
    QLabel *m_statusLabel = nullptr;

    // ===== Zoom bar =====
    QSlider *m_zoomSlider = nullptr;
    QLabel *m_zoomLabel = nullptr;

    // ===== Animation bar =====
    QCheckBox *m_animateCheck = nullptr;
    QSpinBox *m_frameWidthSpin = nullptr;
    QSpinBox *m_frameHeightSpin = nullptr;
    QComboBox *m_directionCombo = nullptr;
    QDoubleSpinBox *m_fpsSpin = nullptr;
    QCheckBox *m_loopCheck = nullptr;
    QSlider *m_scrubSlider = nullptr;
};

#endif // MAINWINDOW_H
