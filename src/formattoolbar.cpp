#include "formattoolbar.h"
#include <QComboBox>
#include <QEvent>
#include <QFrame>
#include <QHBoxLayout>
#include <QPushButton>
#include <QSizePolicy>

namespace {
QString buttonStyle()
{
    return QString(
        "QPushButton {"
        "  background-color: #ffffff;"
        "  color: #1f2328;"
        "  border: 1px solid #d0d7de;"
        "  border-radius: 6px;"
        "  padding: 4px 8px;"
        "  min-width: 22px;"
        "}"
        "QPushButton:hover { background-color: #f6f8fa; }"
        "QPushButton:pressed { background-color: #1f6feb; color: white; border-color: #1f6feb; }"
        "QPushButton:disabled { color: #9ca3af; }"
    );
}

QFrame *separator(QWidget *parent)
{
    QFrame *line = new QFrame(parent);
    line->setFrameShape(QFrame::VLine);
    line->setStyleSheet("color: #d0d7de;");
    return line;
}
}

FormatToolbar::FormatToolbar(QWidget *parent)
    : QWidget(parent)
{
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
    setStyleSheet("background: #f4f6fb;");

    QHBoxLayout *layout = new QHBoxLayout(this);
    layout->setContentsMargins(10, 6, 10, 6);
    layout->setSpacing(4);

    layout->addWidget(addButton("Undo", PageEditorView::Undo, tr("Undo")));
    layout->addWidget(addButton("Redo", PageEditorView::Redo, tr("Redo")));
    layout->addWidget(separator(this));

    layout->addWidget(addButton("B", PageEditorView::Bold, tr("Bold")));
    layout->addWidget(addButton("I", PageEditorView::Italic, tr("Italic")));
    layout->addWidget(addButton("U", PageEditorView::Underline, tr("Underline")));
    layout->addWidget(separator(this));

    layout->addWidget(addButton(QString::fromUtf8("•"), PageEditorView::BulletList, tr("Bulleted list")));
    layout->addWidget(addButton("1.", PageEditorView::NumberedList, tr("Numbered list")));
    layout->addWidget(addButton("<<", PageEditorView::Outdent, tr("Decrease indent")));
    layout->addWidget(addButton(">>", PageEditorView::Indent, tr("Increase indent")));
    layout->addWidget(separator(this));

    layout->addWidget(addButton("Left", PageEditorView::AlignLeft, tr("Align left")));
    layout->addWidget(addButton("Center", PageEditorView::AlignCenter, tr("Align centre")));
    layout->addWidget(addButton("Right", PageEditorView::AlignRight, tr("Align right")));
    layout->addWidget(separator(this));

    const QStringList families = { "Arial", "Times New Roman", "Georgia", "Courier New", "Verdana" };
    const QStringList sizes = { "8", "9", "10", "11", "12", "14", "16", "18", "24", "32" };
    const QStringList spacings = { "1.0", "1.15", "1.5", "2.0" };
    layout->addWidget(addCombo(families, PageEditorView::FontFamily, tr("Font")));
    layout->addWidget(addCombo(sizes, PageEditorView::FontSize, tr("Font size")));
    layout->addWidget(addCombo(spacings, PageEditorView::LineSpacing, tr("Line spacing")));

    layout->addStretch();
}

void FormatToolbar::setPageView(PageEditorView *pageView)
{
    disconnect(m_commandConnection);
    m_pageView = pageView;
    if (m_pageView) {
        m_commandConnection = connect(this, &FormatToolbar::commandRequested, m_pageView,
                [this](PageEditorView::Command command, const QVariant &value) {
            if (m_pageView) {
                m_pageView->applyCommand(command, value);
            }
        });
    }
}

void FormatToolbar::setPreviewMode(bool enabled)
{
    for (QWidget *control : m_controls) {
        control->setEnabled(!enabled);
    }
}

bool FormatToolbar::eventFilter(QObject *watched, QEvent *event)
{
    // Opening a combo moves focus away from the page; remember the caret first
    if (m_pageView && (event->type() == QEvent::MouseButtonPress || event->type() == QEvent::KeyPress)
        && qobject_cast<QComboBox *>(watched)) {
        m_pageView->saveSelection();
    }
    return QWidget::eventFilter(watched, event);
}

QPushButton *FormatToolbar::addButton(const QString &text, PageEditorView::Command command, const QString &toolTip)
{
    QPushButton *button = new QPushButton(text, this);
    button->setToolTip(toolTip);
    button->setFocusPolicy(Qt::NoFocus);
    button->setStyleSheet(buttonStyle());
    connect(button, &QPushButton::clicked, this, [this, command]() {
        emit commandRequested(command, QVariant());
    });
    m_controls.append(button);
    return button;
}

QComboBox *FormatToolbar::addCombo(const QStringList &items, PageEditorView::Command command, const QString &toolTip)
{
    QComboBox *combo = new QComboBox(this);
    combo->addItems(items);
    combo->setToolTip(toolTip);
    combo->setCurrentIndex(-1);
    combo->installEventFilter(this);
    connect(combo, qOverload<int>(&QComboBox::activated), this, [this, combo, command](int index) {
        if (index < 0) {
            return;
        }
        const QString text = combo->itemText(index);
        const QVariant value = command == PageEditorView::FontFamily ? QVariant(text) : QVariant(text.toDouble());
        emit commandRequested(command, value);
    });
    m_controls.append(combo);
    return combo;
}
