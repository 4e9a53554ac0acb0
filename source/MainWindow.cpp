#include "MainWindow.h"

#include "core/ViewportTuning.h"
#include "input/ViewportInputController.h"
#include "tim/FrameAnimator.h"
#include "tim/TimIndexEditor.h"
#include "ui/dialogs/ControlsDialog.h"
#include "viewport/ImageViewport.h"

#include <QCheckBox>
#include <QCloseEvent>
#include <QComboBox>
#include <QDir>
#include <QDoubleSpinBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QGridLayout>
#include <QGuiApplication>
#include <QHBoxLayout>
#include <QLabel>
#include <QListWidget>
#include <QMessageBox>
#include <QPushButton>
#include <QScreen>
#include <QScrollBar>
#include <QSettings>
#include <QSlider>
#include <QSpinBox>
#include <QTabWidget>
#include <QVBoxLayout>
#include <QtMath>
#include <QDebug>

namespace {
// Zoom slider works in hundredths
constexpr int ZoomSliderScale = 100;
}

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    setWindowTitle(tr("TimScope"));

    QScreen *screen = QGuiApplication::primaryScreen();
    if (screen) {
        resize(screen->availableGeometry().size() * 0.75);
    }

    m_animator = new FrameAnimator(this);
    connect(m_animator, &FrameAnimator::frameChanged, this, &MainWindow::onFrameChanged);

    setupUi();
    loadSettings();
    setStatus();
}

MainWindow::~MainWindow() = default;

// ============================================================================
// UI Setup
// ============================================================================

void MainWindow::setupUi()
{
    QWidget *central = new QWidget(this);
    QHBoxLayout *rootLayout = new QHBoxLayout(central);
    rootLayout->setContentsMargins(6, 6, 6, 6);
    rootLayout->setSpacing(6);

    rootLayout->addWidget(createSidebar());

    QWidget *right = new QWidget(central);
    QVBoxLayout *rightLayout = new QVBoxLayout(right);
    rightLayout->setContentsMargins(0, 0, 0, 0);
    rightLayout->setSpacing(4);

    rightLayout->addWidget(createZoomBar());

    // ===== Viewport with external scrollbars =====
    QWidget *viewArea = new QWidget(right);
    QGridLayout *grid = new QGridLayout(viewArea);
    grid->setContentsMargins(0, 0, 0, 0);
    grid->setSpacing(0);

    m_viewport = new ImageViewport(viewArea);
    m_hScroll = new QScrollBar(Qt::Horizontal, viewArea);
    m_vScroll = new QScrollBar(Qt::Vertical, viewArea);
    grid->addWidget(m_viewport, 0, 0);
    grid->addWidget(m_vScroll, 0, 1);
    grid->addWidget(m_hScroll, 1, 0);
    rightLayout->addWidget(viewArea, 1);

    m_input = new ViewportInputController(m_viewport, this);

    connect(m_viewport, &ImageViewport::zoomChanged, this, &MainWindow::onViewportZoomChanged);
    connect(m_viewport, &ImageViewport::scrollStateChanged, this, &MainWindow::syncScrollBars);
    connect(m_hScroll, &QScrollBar::valueChanged, this, &MainWindow::onScrollBarMoved);
    connect(m_vScroll, &QScrollBar::valueChanged, this, &MainWindow::onScrollBarMoved);

    rightLayout->addWidget(createAnimationBar());

    rootLayout->addWidget(right, 1);
    setCentralWidget(central);
}

QWidget* MainWindow::createSidebar()
{
    QWidget *sidebar = new QWidget(this);
    sidebar->setFixedWidth(320);
    QVBoxLayout *layout = new QVBoxLayout(sidebar);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    auto addButton = [&](const QString &text, void (MainWindow::*slot)()) {
        QPushButton *button = new QPushButton(text, sidebar);
        connect(button, &QPushButton::clicked, this, slot);
        layout->addWidget(button);
    };
    addButton(tr("Load TIMs…"), &MainWindow::onLoadTims);
    addButton(tr("Export Image…"), &MainWindow::onExportImage);
    addButton(tr("Export Indices…"), &MainWindow::onExportIndices);
    addButton(tr("Import Indices (Resize)…"), &MainWindow::onImportIndices);
    addButton(tr("Save TIM As…"), &MainWindow::onSaveTimAs);

    m_listTabs = new QTabWidget(sidebar);
    m_filesList = new QListWidget(m_listTabs);
    m_clutList = new QListWidget(m_listTabs);
    m_listTabs->addTab(m_filesList, tr("Files"));
    m_listTabs->addTab(m_clutList, tr("CLUTs"));
    layout->addWidget(m_listTabs, 1);

    connect(m_filesList, &QListWidget::currentRowChanged, this, &MainWindow::onFileSelected);
    connect(m_clutList, &QListWidget::currentRowChanged, this, &MainWindow::onClutSelected);

    m_statusLabel = new QLabel(sidebar);
    m_statusLabel->setWordWrap(true);
    layout->addWidget(m_statusLabel);

    return sidebar;
}

QWidget* MainWindow::createZoomBar()
{
    QWidget *bar = new QWidget(this);
    QHBoxLayout *layout = new QHBoxLayout(bar);
    layout->setContentsMargins(0, 0, 0, 0);

    layout->addWidget(new QLabel(tr("Zoom"), bar));

    // Replaced by the stored tuning in loadSettings()
    const ViewportTuning defaults;
    m_zoomSlider = new QSlider(Qt::Horizontal, bar);
    m_zoomSlider->setRange(qRound(defaults.minZoom * ZoomSliderScale),
                           qRound(defaults.maxZoom * ZoomSliderScale));
    m_zoomSlider->setValue(qRound(defaults.initialZoom * ZoomSliderScale));
    connect(m_zoomSlider, &QSlider::valueChanged, this, &MainWindow::onZoomSlider);
    layout->addWidget(m_zoomSlider, 1);

    m_zoomLabel = new QLabel(bar);
    m_zoomLabel->setMinimumWidth(56);
    layout->addWidget(m_zoomLabel);

    QPushButton *fitButton = new QPushButton(tr("Fit"), bar);
    connect(fitButton, &QPushButton::clicked, this, &MainWindow::onFit);
    layout->addWidget(fitButton);

    QPushButton *controlsButton = new QPushButton(tr("Controls"), bar);
    connect(controlsButton, &QPushButton::clicked, this, &MainWindow::onShowControls);
    layout->addWidget(controlsButton);

    return bar;
}

QWidget* MainWindow::createAnimationBar()
{
    QWidget *bar = new QWidget(this);
    QHBoxLayout *layout = new QHBoxLayout(bar);
    layout->setContentsMargins(0, 0, 0, 0);

    m_animateCheck = new QCheckBox(tr("Animate"), bar);
    connect(m_animateCheck, &QCheckBox::toggled, this, &MainWindow::onAnimateToggled);
    layout->addWidget(m_animateCheck);

    layout->addWidget(new QLabel(tr("Frame W"), bar));
    m_frameWidthSpin = new QSpinBox(bar);
    m_frameWidthSpin->setRange(0, 0xFFFF);
    layout->addWidget(m_frameWidthSpin);

    layout->addWidget(new QLabel(tr("Frame H"), bar));
    m_frameHeightSpin = new QSpinBox(bar);
    m_frameHeightSpin->setRange(0, 0xFFFF);
    layout->addWidget(m_frameHeightSpin);

    layout->addWidget(new QLabel(tr("Dir"), bar));
    m_directionCombo = new QComboBox(bar);
    m_directionCombo->addItem(FrameStrip::directionName(FrameStrip::Direction::Horizontal));
    m_directionCombo->addItem(FrameStrip::directionName(FrameStrip::Direction::Vertical));
    layout->addWidget(m_directionCombo);

    layout->addWidget(new QLabel(tr("FPS"), bar));
    m_fpsSpin = new QDoubleSpinBox(bar);
    m_fpsSpin->setRange(FrameAnimator::MinFps, FrameAnimator::MaxFps);
    m_fpsSpin->setSingleStep(1.0);
    m_fpsSpin->setValue(m_animator->fps());
    connect(m_fpsSpin, QOverload<double>::of(&QDoubleSpinBox::valueChanged),
            m_animator, &FrameAnimator::setFps);
    layout->addWidget(m_fpsSpin);

    m_loopCheck = new QCheckBox(tr("Loop"), bar);
    m_loopCheck->setChecked(m_animator->loops());
    connect(m_loopCheck, &QCheckBox::toggled, m_animator, &FrameAnimator::setLoop);
    layout->addWidget(m_loopCheck);

    QPushButton *applyButton = new QPushButton(tr("Apply"), bar);
    connect(applyButton, &QPushButton::clicked, this, &MainWindow::onApplyFrames);
    layout->addWidget(applyButton);

    QPushButton *playButton = new QPushButton(tr("Play"), bar);
    connect(playButton, &QPushButton::clicked, this, &MainWindow::onPlay);
    layout->addWidget(playButton);

    QPushButton *pauseButton = new QPushButton(tr("Pause"), bar);
    connect(pauseButton, &QPushButton::clicked, m_animator, &FrameAnimator::pause);
    layout->addWidget(pauseButton);

    m_scrubSlider = new QSlider(Qt::Horizontal, bar);
    m_scrubSlider->setRange(0, 0);
    connect(m_scrubSlider, &QSlider::valueChanged, this, &MainWindow::onScrub);
    layout->addWidget(m_scrubSlider, 1);

    return bar;
}

// ============================================================================
// Settings
// ============================================================================

void MainWindow::loadSettings()
{
    QSettings settings("TimScope", "App");

    ViewportTuning tuning;
    tuning.load(settings);
    m_viewport->setTuning(tuning);

    m_zoomSlider->blockSignals(true);
    m_zoomSlider->setRange(qRound(tuning.minZoom * ZoomSliderScale),
                           qRound(tuning.maxZoom * ZoomSliderScale));
    m_zoomSlider->blockSignals(false);
    onViewportZoomChanged(m_viewport->zoom());

    m_lastDir = settings.value("lastDir", QDir::homePath()).toString();
    m_fpsSpin->setValue(settings.value("animFps", 8.0).toDouble());
    m_loopCheck->setChecked(settings.value("animLoop", true).toBool());

    const QByteArray geometry = settings.value("windowGeometry").toByteArray();
    if (!geometry.isEmpty()) {
        restoreGeometry(geometry);
    }
}

void MainWindow::saveSettings()
{
    QSettings settings("TimScope", "App");
    settings.setValue("lastDir", m_lastDir);
    settings.setValue("animFps", m_fpsSpin->value());
    settings.setValue("animLoop", m_loopCheck->isChecked());
    settings.setValue("windowGeometry", saveGeometry());
    m_viewport->tuning().save(settings);
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    m_animator->pause();
    saveSettings();
    event->accept();
}

// ============================================================================
// Loading and selection
// ============================================================================

void MainWindow::onLoadTims()
{
    const QStringList paths = QFileDialog::getOpenFileNames(
        this, tr("Select TIM files"), m_lastDir,
        tr("PlayStation TIM (*.tim *.TIM);;All files (*)"));
    if (paths.isEmpty()) {
        return;
    }
    m_lastDir = QFileInfo(paths.first()).absolutePath();
    loadTimFiles(paths);
}

int MainWindow::loadTimFiles(const QStringList &paths)
{
    QVector<TimImage> loaded;
    QVector<TimClut> cluts;
    QStringList errors;

    for (const QString &path : paths) {
        TimFile::ParseResult result = TimFile::load(path);
        if (!result.success) {
            qWarning() << "MainWindow::loadTimFiles:" << path << result.errorMessage;
            errors << QStringLiteral("%1: %2").arg(QFileInfo(path).fileName(), result.errorMessage);
            continue;
        }
        cluts += TimFile::extractCluts(result.tim);
        loaded.append(result.tim);
    }

    if (loaded.isEmpty()) {
        showError(tr("No TIMs loaded"),
                  tr("Could not load any TIM files.\n\n") + errors.mid(0, 20).join('\n'));
        return 0;
    }

    m_animator->pause();
    m_currentTim = -1;
    m_tims = loaded;
    m_allCluts = cluts;

    m_filesList->blockSignals(true);
    m_clutList->blockSignals(true);
    m_filesList->clear();
    for (const TimImage &tim : m_tims) {
        m_filesList->addItem(QStringLiteral("%1 [%2]").arg(QFileInfo(tim.path).fileName(), tim.bppName()));
    }
    m_clutList->clear();
    for (const TimClut &clut : m_allCluts) {
        m_clutList->addItem(clut.label());
    }
    m_clutList->blockSignals(false);
    m_filesList->blockSignals(false);

    m_filesList->setCurrentRow(0);

    QString message = tr("Loaded %1 TIM(s), %2 CLUT row(s).").arg(m_tims.size()).arg(m_allCluts.size());
    if (!errors.isEmpty()) {
        message += tr("  (%1 failed)").arg(errors.size());
    }
    m_statusLabel->setText(message);

    if (!errors.isEmpty()) {
        QMessageBox::warning(this, tr("Some files failed"), errors.mid(0, 25).join('\n'));
    }
    return m_tims.size();
}

TimImage* MainWindow::currentTim()
{
    if (m_currentTim < 0 || m_currentTim >= m_tims.size()) {
        return nullptr;
    }
    return &m_tims[m_currentTim];
}

void MainWindow::onFileSelected(int row)
{
    if (row < 0 || row >= m_tims.size()) {
        return;
    }
    m_currentTim = row;
    TimImage *tim = currentTim();

    // Indexed files show their own first palette until another is picked
    if (tim->isIndexed() && !tim->hasAppliedClut) {
        const QVector<TimClut> own = TimFile::extractCluts(*tim);
        if (!own.isEmpty()) {
            tim->appliedClut = own.first();
            tim->hasAppliedClut = true;
        }
    }

    rebuildSheetAndFrames(true);
    setStatus();
}

void MainWindow::onClutSelected(int row)
{
    TimImage *tim = currentTim();
    if (!tim || row < 0 || row >= m_allCluts.size()) {
        return;
    }

    if (!tim->isIndexed()) {
        QMessageBox::information(this, tr("No CLUT needed"),
                                 tr("This TIM is 16bpp (direct color). CLUTs do not apply."));
        return;
    }

    tim->appliedClut = m_allCluts.at(row);
    tim->hasAppliedClut = true;
    rebuildSheetAndFrames(false);
    setStatus();
}

// ============================================================================
// Sheet, frames and animation
// ============================================================================

void MainWindow::rebuildSheetAndFrames(bool autoDetect)
{
    m_animator->pause();
    TimImage *tim = currentTim();
    if (!tim) {
        return;
    }

    const TimFile::RenderResult render = TimFile::render(*tim, tim->hasAppliedClut ? &tim->appliedClut : nullptr);
    if (!render.success) {
        showError(tr("Render error"), render.errorMessage);
        return;
    }
    m_sheet = render.image;

    if (autoDetect) {
        const FrameStrip::Layout layout = FrameStrip::autoDetect(m_sheet.width(), m_sheet.height());
        if (layout.frameCount > 1 || m_frameWidthSpin->value() == 0 || m_frameHeightSpin->value() == 0) {
            m_frameWidthSpin->setValue(layout.frameWidth);
            m_frameHeightSpin->setValue(layout.frameHeight);
            m_directionCombo->setCurrentText(FrameStrip::directionName(layout.direction));
            m_animator->blockSignals(true);
            m_animator->scrub(0);
            m_animator->blockSignals(false);
        }
    }

    rebuildFrames();
}

void MainWindow::rebuildFrames()
{
    if (m_sheet.isNull()) {
        m_animator->setFrames(QVector<QImage>());
        m_scrubSlider->blockSignals(true);
        m_scrubSlider->setRange(0, 0);
        m_scrubSlider->blockSignals(false);
        pushCurrentImage(true, true);
        return;
    }

    int fw = m_frameWidthSpin->value();
    int fh = m_frameHeightSpin->value();
    FrameStrip::Direction direction = FrameStrip::directionFromName(m_directionCombo->currentText());
    if (fw <= 0 || fh <= 0) {
        const FrameStrip::Layout layout = FrameStrip::autoDetect(m_sheet.width(), m_sheet.height());
        fw = layout.frameWidth;
        fh = layout.frameHeight;
        direction = layout.direction;
    }

    m_animator->setFrames(FrameStrip::slice(m_sheet, fw, fh, direction));

    m_scrubSlider->blockSignals(true);
    m_scrubSlider->setRange(0, qMax(0, m_animator->frameCount() - 1));
    m_scrubSlider->setValue(m_animator->currentIndex());
    m_scrubSlider->blockSignals(false);

    pushCurrentImage(true, true);
    setStatus();
}

void MainWindow::onAnimateToggled(bool enabled)
{
    if (!enabled) {
        m_animator->pause();
    }
    pushCurrentImage(false, true);
    setStatus();
}

void MainWindow::onApplyFrames()
{
    m_animator->pause();
    rebuildFrames();
}

void MainWindow::onPlay()
{
    if (!m_animateCheck->isChecked()) {
        m_animateCheck->setChecked(true);
    }
    m_animator->setFps(m_fpsSpin->value());
    m_animator->setLoop(m_loopCheck->isChecked());
    m_animator->play();
}

void MainWindow::onScrub(int index)
{
    m_animator->scrub(index);
}

void MainWindow::onFrameChanged(int index, const QImage &frame)
{
    m_scrubSlider->blockSignals(true);
    m_scrubSlider->setValue(index);
    m_scrubSlider->blockSignals(false);

    if (m_animateCheck->isChecked()) {
        m_viewport->setImage(frame, false, true);
    }
}

QImage MainWindow::currentViewImage() const
{
    if (m_animateCheck->isChecked() && m_animator->frameCount() > 0) {
        return m_animator->currentFrame();
    }
    return m_sheet;
}

void MainWindow::pushCurrentImage(bool recenter, bool force)
{
    m_viewport->setImage(currentViewImage(), recenter, force);
}

void MainWindow::setStatus(const QString &extra)
{
    const TimImage *tim = currentTim();
    if (!tim) {
        m_statusLabel->setText(tr("Load TIMs to begin."));
        return;
    }

    const QString palette = tim->hasAppliedClut ? tim->appliedClut.label() : tr("(no CLUT)");
    QString frames;
    if (m_animateCheck->isChecked() && m_animator->frameCount() > 0) {
        frames = tr(" | frames %1").arg(m_animator->frameCount());
    }
    m_statusLabel->setText(QStringLiteral("%1 | %2 | %3x%4%5 | CLUT: %6%7")
                               .arg(QFileInfo(tim->path).fileName(), tim->bppName())
                               .arg(tim->pixelWidth())
                               .arg(tim->imgHeight)
                               .arg(frames, palette, extra));
}

// ============================================================================
// File actions
// ============================================================================

void MainWindow::onExportImage()
{
    const TimImage *tim = currentTim();
    if (!tim) {
        QMessageBox::information(this, tr("Nothing to export"), tr("Load and select a TIM first."));
        return;
    }

    QImage image = m_sheet;
    int frameIndex = -1;
    if (m_animateCheck->isChecked() && m_animator->frameCount() > 0) {
        image = m_animator->currentFrame();
        frameIndex = m_animator->currentIndex();
    }

    const QString suggested = QFileInfo(tim->path).dir().filePath(
        TimIndexEditor::suggestedImageName(tim->path, frameIndex));
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Export Image"), suggested, tr("PNG image (*.png);;BMP image (*.bmp)"));
    if (path.isEmpty()) {
        return;
    }

    const TimIndexEditor::ImageExportResult result = TimIndexEditor::exportImage(image, path);
    if (!result.success) {
        showError(tr("Export failed"), result.errorMessage);
        return;
    }

    setStatus(tr(" | Exported image"));
    QMessageBox::information(this, tr("Exported"), tr("Saved:\n%1").arg(path));
}

void MainWindow::onExportIndices()
{
    const TimImage *tim = currentTim();
    if (!tim) {
        QMessageBox::information(this, tr("No TIM selected"), tr("Select a TIM first."));
        return;
    }
    if (!tim->isIndexed()) {
        QMessageBox::information(this, tr("Not indexed"), tr("This TIM is not indexed (4bpp/8bpp)."));
        return;
    }

    const QFileInfo info(tim->path);
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Export Indices PNG"), info.dir().filePath(info.completeBaseName() + "_index.png"),
        tr("PNG image (*.png)"));
    if (path.isEmpty()) {
        return;
    }

    const TimIndexEditor::ExportResult result = TimIndexEditor::exportIndices(*tim, path);
    if (!result.success) {
        showError(tr("Export indices failed"), result.errorMessage);
        return;
    }

    setStatus(tr(" | Exported index+meta"));
    QMessageBox::information(this, tr("Exported"),
        tr("Saved:\n%1\n%2\n\nEdit in indexed mode. You may upscale; import will resize the TIM.")
            .arg(result.pngPath, result.metaPath));
}

void MainWindow::onImportIndices()
{
    TimImage *tim = currentTim();
    if (!tim) {
        QMessageBox::information(this, tr("No TIM selected"), tr("Select a TIM first."));
        return;
    }
    if (!tim->isIndexed()) {
        QMessageBox::information(this, tr("Not indexed"), tr("This TIM is not indexed (4bpp/8bpp)."));
        return;
    }

    const QString pngPath = QFileDialog::getOpenFileName(
        this, tr("Select edited index PNG (can be uprezzed)"), QFileInfo(tim->path).absolutePath(),
        tr("PNG image (*.png);;All files (*)"));
    if (pngPath.isEmpty()) {
        return;
    }

    const QString metaGuess = TimIndexEditor::metaPathFor(pngPath);
    const QString metaPath = QFileInfo::exists(metaGuess) ? metaGuess : QString();

    const TimIndexEditor::ImportResult result = TimIndexEditor::importIndices(*tim, pngPath, metaPath);
    if (!result.success) {
        showError(tr("Import indices failed"), result.errorMessage);
        return;
    }

    rebuildSheetAndFrames(true);
    setStatus(tr(" | Imported+resized"));
    QMessageBox::information(this, tr("Imported"),
        tr("Imported indices and resized the TIM in memory.\nUse 'Save TIM As…' to write a new TIM file."));
}

void MainWindow::onSaveTimAs()
{
    const TimImage *tim = currentTim();
    if (!tim) {
        QMessageBox::information(this, tr("No TIM selected"), tr("Select a TIM first."));
        return;
    }

    const QFileInfo info(tim->path);
    const QString path = QFileDialog::getSaveFileName(
        this, tr("Save TIM As"), info.dir().filePath(info.completeBaseName() + "_edited.tim"),
        tr("TIM (*.tim);;All files (*)"));
    if (path.isEmpty()) {
        return;
    }

    const TimFile::EncodeResult result = TimFile::save(*tim, path);
    if (!result.success) {
        showError(tr("Save failed"), result.errorMessage);
        return;
    }

    setStatus(tr(" | Saved"));
    QMessageBox::information(this, tr("Saved"), tr("Wrote:\n%1").arg(path));
}

void MainWindow::onShowControls()
{
    ControlsDialog dialog(this);
    dialog.exec();
}

void MainWindow::showError(const QString &title, const QString &message)
{
    qWarning() << "MainWindow:" << title << "-" << message;
    QMessageBox::critical(this, title, message);
}

// ============================================================================
// Zoom and scrolling
// ============================================================================

void MainWindow::onZoomSlider(int value)
{
    m_viewport->setZoom(value / qreal(ZoomSliderScale), false, false);
}

void MainWindow::onViewportZoomChanged(qreal zoom)
{
    m_zoomSlider->blockSignals(true);
    m_zoomSlider->setValue(qRound(zoom * ZoomSliderScale));
    m_zoomSlider->blockSignals(false);
    m_zoomLabel->setText(QStringLiteral("%1x").arg(zoom, 0, 'f', 2));
    syncScrollBars();
}

void MainWindow::onFit()
{
    m_viewport->zoomFit();
}

void MainWindow::syncScrollBars()
{
    const QPointF maxScroll = m_viewport->maxScroll();
    const QPointF scroll = m_viewport->scrollOffset();

    m_hScroll->blockSignals(true);
    m_hScroll->setRange(0, qCeil(maxScroll.x()));
    m_hScroll->setPageStep(qMax(1, m_viewport->width()));
    m_hScroll->setSingleStep(16);
    m_hScroll->setValue(qRound(scroll.x()));
    m_hScroll->blockSignals(false);

    m_vScroll->blockSignals(true);
    m_vScroll->setRange(0, qCeil(maxScroll.y()));
    m_vScroll->setPageStep(qMax(1, m_viewport->height()));
    m_vScroll->setSingleStep(16);
    m_vScroll->setValue(qRound(scroll.y()));
    m_vScroll->blockSignals(false);
}

void MainWindow::onScrollBarMoved()
{
    // Keep the fractional part on the axis that did not move
    QPointF offset = m_viewport->scrollOffset();
    if (m_hScroll->value() != qRound(offset.x())) {
        offset.setX(m_hScroll->value());
    }
    if (m_vScroll->value() != qRound(offset.y())) {
        offset.setY(m_vScroll->value());
    }
    m_viewport->setScrollOffset(offset);
}
