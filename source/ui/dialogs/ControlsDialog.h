#ifndef CONTROLSDIALOG_H
#define CONTROLSDIALOG_H

/**
 * @file ControlsDialog.h
 * @brief Read-only summary of the viewer's mouse and keyboard bindings.
 */

#include <QDialog>

class QLabel;

/**
 * @brief Modal dialog listing pan, zoom, fit and animation controls.
 *
 * Usage:
 * @code
 * ControlsDialog dialog(this);
 * dialog.exec();
 * @endcode
 */
class ControlsDialog : public QDialog
{
    Q_OBJECT

public:
    explicit ControlsDialog(QWidget* parent = nullptr);

    /**
     * @brief The bindings text shown in the dialog, one binding per line.
     */
    static QString controlsText();

private:
    void setupUi();

    QLabel* m_textLabel = nullptr;
};

#endif // CONTROLSDIALOG_H
