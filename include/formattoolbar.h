#pragma once
#include <QWidget>
#include <QVariant>
#include "pageeditorview.h"

class QComboBox;
class QPushButton;

// Formatting controls for the page editor. Combo boxes take keyboard focus
// when opened, so they save the editor's selection before they do.
class FormatToolbar : public QWidget {
    Q_OBJECT
public:
    explicit FormatToolbar(QWidget *parent = nullptr);
    void setPageView(PageEditorView *pageView);
    void setPreviewMode(bool enabled);

signals:
    void commandRequested(PageEditorView::Command command, const QVariant &value);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    QPushButton *addButton(const QString &text, PageEditorView::Command command, const QString &toolTip);
    QComboBox *addCombo(const QStringList &items, PageEditorView::Command command, const QString &toolTip);

    QVector<QWidget *> m_controls;
    PageEditorView *m_pageView = nullptr;
    QMetaObject::Connection m_commandConnection;
};
