#pragma once
#include <QTextEdit>
#include <QString>
#include "pagelayout.h"

class QFocusEvent;

// Editable surface for one page's content area. The page view owns the
// page frame; this widget is exactly the margin box and never scrolls.
class PageTextEdit : public QTextEdit {
    Q_OBJECT
public:
    PageTextEdit(const PageLayout &layout, const QString &pageId, QWidget *parent = nullptr);

    QString pageId() const { return m_pageId; }
    void setPageId(const QString &pageId) { m_pageId = pageId; }

    // Body markup of the document, without the <html>/<head> wrapper Qt adds
    QString content() const;
    // Replaces the document without emitting contentEdited. The caret keeps
    // its block/offset where that still exists.
    void setContent(const QString &html);

    // True when `html` is what this editor was last given or currently holds
    bool showsContent(const QString &html) const;

    bool isAtEnd() const;

signals:
    void contentEdited(const QString &pageId, const QString &html);
    void focused(const QString &pageId);
    // Emitted before the focus change is processed; the selection is intact
    void focusLeaving(const QString &pageId);

protected:
    void focusInEvent(QFocusEvent *e) override;
    void focusOutEvent(QFocusEvent *e) override;

private:
    static QString bodyOf(const QString &documentHtml);

    PageLayout m_layout;
    QString m_pageId;
    QString m_syncedContent;
    bool m_settingContent = false;
};
