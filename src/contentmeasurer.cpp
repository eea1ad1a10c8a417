#include "contentmeasurer.h"

#include <QAbstractTextDocumentLayout>
#include <QDebug>
#include <QFont>
#include <QGuiApplication>
#include <QTextBlock>
#include <QTextBlockFormat>
#include <QTextCursor>
#include <QTextDocument>
#include <cmath>

TextDocumentMeasurer::TextDocumentMeasurer(const PageLayout &layout)
    : m_layout(layout)
{
}

bool TextDocumentMeasurer::isAvailable() const
{
    // Font metrics need a running GUI application
    return qobject_cast<QGuiApplication *>(QCoreApplication::instance()) != nullptr;
}

int TextDocumentMeasurer::measureHeight(const QString &markup, int widthPx) const
{
    if (!isAvailable() || widthPx <= 0) {
        return -1;
    }

    QTextDocument doc;
    doc.setUndoRedoEnabled(false);
    configureDocument(&doc, m_layout, widthPx);
    doc.setHtml(markup);
    applyDefaultLineHeight(&doc, m_layout.lineHeight);

    return static_cast<int>(std::ceil(doc.documentLayout()->documentSize().height()));
}

void TextDocumentMeasurer::configureDocument(QTextDocument *doc, const PageLayout &layout, int widthPx)
{
    QFont font(layout.fontFamily);
    font.setPointSizeF(layout.fontPointSize);
    doc->setDefaultFont(font);
    doc->setDocumentMargin(0);
    doc->setTextWidth(widthPx);
}

void TextDocumentMeasurer::applyDefaultLineHeight(QTextDocument *doc, double lineHeight)
{
    QTextCursor cursor(doc);
    cursor.beginEditBlock();
    for (QTextBlock block = doc->begin(); block.isValid(); block = block.next()) {
        QTextBlockFormat fmt = block.blockFormat();
        if (fmt.lineHeightType() != QTextBlockFormat::SingleHeight) {
            continue;
        }
        fmt.setLineHeight(lineHeight * 100.0, QTextBlockFormat::ProportionalHeight);
        cursor.setPosition(block.position());
        cursor.setBlockFormat(fmt);
    }
    cursor.endEditBlock();
}
