#include "pagetextedit.h"
#include "contentmeasurer.h"
#include <QDebug>
#include <QFocusEvent>
#include <QFrame>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextDocument>

PageTextEdit::PageTextEdit(const PageLayout &layout, const QString &pageId, QWidget *parent)
    : QTextEdit(parent), m_layout(layout), m_pageId(pageId)
{
    setObjectName("pageTextEdit");
    setAcceptRichText(true);

    TextDocumentMeasurer::configureDocument(document(), m_layout, m_layout.contentWidthPx());
    setFont(document()->defaultFont());

    // Wrap at the print content width, independent of widget geometry
    setLineWrapMode(QTextEdit::FixedPixelWidth);
    setLineWrapColumnOrWidth(m_layout.contentWidthPx());
    setViewportMargins(0, 0, 0, 0);

    // The page view paints the page; overflow is moved, never scrolled to
    setFrameStyle(QFrame::NoFrame);
    setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    setFixedSize(m_layout.contentWidthPx(), m_layout.capacityPx());

    QPalette pal = palette();
    pal.setColor(QPalette::Base, Qt::transparent);
    pal.setColor(QPalette::Text, Qt::black);
    setPalette(pal);
    setAutoFillBackground(false);
    viewport()->setAutoFillBackground(false);

    TextDocumentMeasurer::applyDefaultLineHeight(document(), m_layout.lineHeight);

    connect(this, &QTextEdit::textChanged, this, [this] {
        if (m_settingContent) {
            return;
        }
        // New blocks typed by the user pick up the page line height
        m_settingContent = true;
        TextDocumentMeasurer::applyDefaultLineHeight(document(), m_layout.lineHeight);
        m_settingContent = false;
        m_syncedContent = content();
        emit contentEdited(m_pageId, m_syncedContent);
    });
}

QString PageTextEdit::content() const
{
    if (document()->isEmpty()) {
        return QString();
    }
    return bodyOf(toHtml());
}

void PageTextEdit::setContent(const QString &html)
{
    const QTextCursor old = textCursor();
    const int blockNumber = old.block().blockNumber();
    const int offset = old.positionInBlock();

    m_syncedContent = html;
    m_settingContent = true;
    const bool undoEnabled = document()->isUndoRedoEnabled();
    document()->setUndoRedoEnabled(false);
    setHtml(html);
    TextDocumentMeasurer::applyDefaultLineHeight(document(), m_layout.lineHeight);
    document()->setUndoRedoEnabled(undoEnabled);
    m_settingContent = false;

    const QTextBlock block = document()->findBlockByNumber(blockNumber);
    QTextCursor cursor(document());
    if (block.isValid()) {
        cursor.setPosition(block.position() + qMin(offset, block.length() - 1));
    } else {
        cursor.movePosition(QTextCursor::End);
    }
    setTextCursor(cursor);
}

bool PageTextEdit::showsContent(const QString &html) const
{
    return html == m_syncedContent || html == content();
}

bool PageTextEdit::isAtEnd() const
{
    const QTextCursor cursor = textCursor();
    return !cursor.hasSelection() && cursor.atEnd();
}

void PageTextEdit::focusInEvent(QFocusEvent *e)
{
    QTextEdit::focusInEvent(e);
    emit focused(m_pageId);
}

void PageTextEdit::focusOutEvent(QFocusEvent *e)
{
    emit focusLeaving(m_pageId);
    QTextEdit::focusOutEvent(e);
}

QString PageTextEdit::bodyOf(const QString &documentHtml)
{
    const int bodyOpen = documentHtml.indexOf(QLatin1String("<body"), 0, Qt::CaseInsensitive);
    if (bodyOpen < 0) {
        return documentHtml;
    }
    const int contentStart = documentHtml.indexOf(QLatin1Char('>'), bodyOpen) + 1;
    const int bodyClose = documentHtml.lastIndexOf(QLatin1String("</body>"), -1, Qt::CaseInsensitive);
    if (contentStart <= 0 || bodyClose < contentStart) {
        return documentHtml;
    }
    return documentHtml.mid(contentStart, bodyClose - contentStart).trimmed();
}
