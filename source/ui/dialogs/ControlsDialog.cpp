#include "ControlsDialog.h"

#include <QDialogButtonBox>
#include <QLabel>
#include <QVBoxLayout>

// ============================================================================
// Construction
// ============================================================================

ControlsDialog::ControlsDialog(QWidget* parent)
    : QDialog(parent)
{
    setWindowTitle(tr("Controls"));
    setModal(true);
    setupUi();
}

QString ControlsDialog::controlsText()
{
    return tr("Pan: Hold Space + Left-drag\n"
              "Pan (alt): Middle-drag\n"
              "Zoom: Mouse wheel (zooms at the cursor)\n"
              "Fit: Fit button\n"
              "Animation: enable Animate, set Frame W/H and Dir, then Apply and Play");
}

// ============================================================================
// UI Setup
// ============================================================================

void ControlsDialog::setupUi()
{
    QVBoxLayout* mainLayout = new QVBoxLayout(this);
    mainLayout->setSpacing(12);
    mainLayout->setContentsMargins(20, 20, 20, 20);

    m_textLabel = new QLabel(controlsText());
    m_textLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    mainLayout->addWidget(m_textLabel);

    QDialogButtonBox* buttons = new QDialogButtonBox(QDialogButtonBox::Close);
    connect(buttons, &QDialogButtonBox::rejected, this, &QDialog::reject);
    mainLayout->addWidget(buttons);
}
