#include "printrenderer.h"

#include "contentmeasurer.h"
#include "htmlsanitizer.h"
#include "markup.h"

#include <QDebug>
#include <QFont>
#include <QMarginsF>
#include <QPageLayout>
#include <QPageSize>
#include <QPainter>
#include <QPdfWriter>
#include <QTextDocument>

namespace PrintRenderer {

namespace {

QString mm(double value)
{
    return QString::number(value, 'f', 2) + QStringLiteral("mm");
}

QString px(int value)
{
    return QString::number(value) + QStringLiteral("px");
}

QString styleSheet(const PageLayout &layout)
{
    QString css;
    css += QStringLiteral("@page { size: %1 %2; margin: 0; }\n")
               .arg(mm(layout.pageWidthMm), mm(layout.pageHeightMm));
    css += QStringLiteral("html, body { margin: 0; padding: 0; background: #ffffff; }\n");
    css += QStringLiteral(".page { position: relative; box-sizing: border-box; overflow: hidden; "
                          "width: %1; height: %2; }\n")
               .arg(px(layout.pageWidthPx()), px(layout.pageHeightPx()));
    css += QStringLiteral(".page + .page { page-break-before: always; break-before: page; }\n");
    css += QStringLiteral(".content { position: absolute; overflow: hidden; top: %1; left: %2; "
                          "width: %3; height: %4; font-family: '%5'; font-size: %6pt; "
                          "line-height: %7; }\n")
               .arg(px(layout.marginTopPx() + layout.headerReservePx))
               .arg(px(layout.marginLeftPx()))
               .arg(px(layout.contentWidthPx()))
               .arg(px(layout.capacityPx()))
               .arg(layout.fontFamily)
               .arg(layout.fontPointSize)
               .arg(layout.lineHeight);
    css += QStringLiteral(".content > :first-child { margin-top: 0; }\n");
    css += QStringLiteral(".page-number { position: absolute; left: 0; right: 0; bottom: %1; "
                          "text-align: center; font-family: '%2'; font-size: 9pt; }\n")
               .arg(px(layout.marginBottomPx() / 2))
               .arg(layout.fontFamily);
    return css;
}

bool isBlank(const QString &content)
{
    return Markup::plainText(content).trimmed().isEmpty()
        && !content.contains(QLatin1String("<hr"), Qt::CaseInsensitive);
}

} // namespace

QString renderHtml(const QVector<Page> &pages, const PageLayout &layout)
{
    QString html;
    html += QStringLiteral("<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n");
    html += QStringLiteral("<title>Document</title>\n<style>\n");
    html += styleSheet(layout);
    html += QStringLiteral("</style>\n</head>\n<body>\n");

    const int total = pages.size();
    for (int i = 0; i < total; ++i) {
        const QString content = HtmlSanitizer::sanitize(pages.at(i).content);
        html += QStringLiteral("<div class=\"page\" data-page=\"%1\">\n").arg(i + 1);
        html += QStringLiteral("<div class=\"content\">");
        html += isBlank(content) ? QStringLiteral("&nbsp;") : content;
        html += QStringLiteral("</div>\n");
        html += QStringLiteral("<div class=\"page-number\">%1</div>\n").arg(i + 1);
        html += QStringLiteral("</div>\n");
    }

    html += QStringLiteral("</body>\n</html>\n");
    qDebug() << "[PrintRenderer] Rendered" << total << "pages to HTML";
    return html;
}

bool exportToPdf(const QVector<Page> &pages, const PageLayout &layout, const QString &filePath,
                 const Settings &settings)
{
    if (!layout.isValid() || filePath.isEmpty()) {
        qWarning() << "[PrintRenderer] Refusing PDF export: invalid layout or empty path";
        return false;
    }

    QPdfWriter writer(filePath);
    writer.setPageSize(QPageSize(QSizeF(layout.pageWidthMm, layout.pageHeightMm),
                                 QPageSize::Millimeter, QString(), QPageSize::ExactMatch));
    writer.setPageMargins(QMarginsF(0, 0, 0, 0), QPageLayout::Millimeter);
    writer.setResolution(settings.resolutionDpi);

    QPainter painter;
    if (!painter.begin(&writer)) {
        qWarning() << "[PrintRenderer] Cannot open PDF target" << filePath;
        return false;
    }

    // Everything below is laid out in 96 DPI page pixels
    const qreal scale = static_cast<qreal>(settings.resolutionDpi) / PageLayout::CSS_DPI;
    const int widthPx = layout.contentWidthPx();
    const int totalPages = qMax(1, pages.size());

    for (int pageNum = 0; pageNum < totalPages; ++pageNum) {
        if (pageNum > 0) {
            writer.newPage();
        }

        painter.save();
        painter.scale(scale, scale);

        const QString content = pageNum < pages.size()
            ? HtmlSanitizer::sanitize(pages.at(pageNum).content)
            : QString();
        QTextDocument doc;
        doc.setUndoRedoEnabled(false);
        TextDocumentMeasurer::configureDocument(&doc, layout, widthPx);
        doc.setHtml(content);
        TextDocumentMeasurer::applyDefaultLineHeight(&doc, layout.lineHeight);

        painter.save();
        painter.translate(layout.marginLeftPx(), layout.marginTopPx() + layout.headerReservePx);
        doc.drawContents(&painter, QRectF(0, 0, widthPx, layout.capacityPx()));
        painter.restore();

        QFont pageNumFont(layout.fontFamily);
        pageNumFont.setPointSizeF(settings.pageNumberPointSize);
        painter.setFont(pageNumFont);
        painter.setPen(Qt::black);
        // Same box as the HTML footer: bottom edge at half the bottom margin
        const QRectF pageNumRect(0,
                                 layout.pageHeightPx() - layout.marginBottomPx() / 2
                                     - settings.pageNumberHeightPx,
                                 layout.pageWidthPx(),
                                 settings.pageNumberHeightPx);
        painter.drawText(pageNumRect, Qt::AlignHCenter | Qt::AlignBottom, QString::number(pageNum + 1));

        painter.restore();
    }

    painter.end();
    qDebug() << "[PrintRenderer] Exported" << totalPages << "pages to" << filePath;
    return true;
}

} // namespace PrintRenderer
