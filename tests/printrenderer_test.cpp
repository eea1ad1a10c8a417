#include <QTest>
#include <QObject>
#include <QFile>
#include <QTemporaryDir>
#include "htmlsanitizer.h"
#include "pagelayout.h"
#include "pagemodel.h"
#include "printrenderer.h"

class PrintRendererTests : public QObject {
    Q_OBJECT

private:
    QVector<Page> pagesOf(const QStringList &contents) {
        QVector<Page> pages;
        for (const QString &content : contents) {
            Page page;
            page.id = Page::newId();
            page.content = content;
            pages.append(page);
        }
        return pages;
    }

private slots:
    void defaultLayoutIsA4At96Dpi() {
        PageLayout layout;
        QVERIFY(layout.isValid());
        QCOMPARE(layout.pageWidthPx(), 794);
        QCOMPARE(layout.pageHeightPx(), 1123);
        QCOMPARE(layout.marginTopPx(), 76);
        QCOMPARE(layout.contentWidthPx(), 642);
        QCOMPARE(layout.contentHeightPx(), 971);
        QCOMPARE(layout.capacityPx(), 971);

        layout.footerReservePx = 40;
        QCOMPARE(layout.capacityPx(), 931);
    }

    void renderEmitsOneFixedSizeBlockPerPage() {
        PageLayout layout;
        const QString html = PrintRenderer::renderHtml(pagesOf({ "<p>first</p>", "<p>second</p>" }), layout);

        QVERIFY(html.startsWith("<!DOCTYPE html>"));
        QCOMPARE(html.count("<div class=\"page\""), 2);
        QVERIFY(html.contains("width: 794px; height: 1123px;"));
        QVERIFY(html.contains("top: 76px; left: 76px; width: 642px; height: 971px;"));
        QVERIFY(html.contains("page-break-before: always"));
        QVERIFY(html.contains("@page { size: 210.00mm 297.00mm; margin: 0; }"));
        QVERIFY(html.contains("<div class=\"content\"><p>first</p></div>"));
        QVERIFY(html.contains("<div class=\"content\"><p>second</p></div>"));
        QVERIFY(html.contains("<div class=\"page-number\">2</div>"));
        QVERIFY(html.indexOf("first") < html.indexOf("second"));
    }

    void headerReserveShiftsContent() {
        PageLayout layout;
        layout.headerReservePx = 24;
        const QString html = PrintRenderer::renderHtml(pagesOf({ "x" }), layout);
        QVERIFY(html.contains("top: 100px;"));
        QVERIFY(html.contains("height: 947px;"));
    }

    void emptyPageStillOccupiesAPage() {
        PageLayout layout;
        const QString html = PrintRenderer::renderHtml(pagesOf({ "<p>text</p>", "", "<p> </p>" }), layout);
        QCOMPARE(html.count("<div class=\"page\""), 3);
        QCOMPARE(html.count("<div class=\"content\">&nbsp;</div>"), 2);
    }

    void renderSanitizesContent() {
        PageLayout layout;
        const QString html = PrintRenderer::renderHtml(
            pagesOf({ "<p onclick=\"steal()\">Hi</p><script>alert(1)</script>" }), layout);
        QVERIFY(!html.contains("script"));
        QVERIFY(!html.contains("onclick"));
        QVERIFY(html.contains("<p>Hi</p>"));
    }

    void sanitizerDropsScriptsAndHandlers() {
        QCOMPARE(HtmlSanitizer::sanitize("<p onclick=\"x()\">Hi</p><script>alert('<p>')</script>"),
                 QString("<p>Hi</p>"));
        QCOMPARE(HtmlSanitizer::sanitize("<style>p { color: red }</style>text"), QString("text"));
        QCOMPARE(HtmlSanitizer::sanitize("<iframe src=\"x\">fallback</iframe>after"), QString("after"));
    }

    void sanitizerFiltersLinks() {
        QCOMPARE(HtmlSanitizer::sanitize("<a href=\"javascript:alert(1)\">x</a>"), QString("<a>x</a>"));
        QCOMPARE(HtmlSanitizer::sanitize("<a href=\"https://example.com\" target=\"_blank\" id=\"k\">x</a>"),
                 QString("<a href=\"https://example.com\" target=\"_blank\">x</a>"));
    }

    void sanitizerUnwrapsUnknownElements() {
        QCOMPARE(HtmlSanitizer::sanitize("<table><tr><td>cell</td></tr></table>"), QString("cell"));
        QCOMPARE(HtmlSanitizer::sanitize("<font face=\"Arial\"><b>bold</b></font>"), QString("<b>bold</b>"));
    }

    void sanitizerRemovesCommentsAndEscapesStrayBrackets() {
        QCOMPARE(HtmlSanitizer::sanitize("a<!-- note -->b"), QString("ab"));
        QCOMPARE(HtmlSanitizer::sanitize("1 < 2"), QString("1 &lt; 2"));
    }

    void sanitizerFiltersStyles() {
        QCOMPARE(HtmlSanitizer::sanitize("<span style=\"color: red\">t</span>"),
                 QString("<span style=\"color: red\">t</span>"));
        QCOMPARE(HtmlSanitizer::sanitize("<span style=\"background: url(x.png)\">t</span>"),
                 QString("<span>t</span>"));
        QCOMPARE(HtmlSanitizer::sanitize("<span class='a\"b'>t</span>"),
                 QString("<span class=\"a&quot;b\">t</span>"));
    }

    void safeUriRules() {
        QVERIFY(HtmlSanitizer::isSafeUri("https://example.com"));
        QVERIFY(HtmlSanitizer::isSafeUri("http://example.com"));
        QVERIFY(HtmlSanitizer::isSafeUri("mailto:someone@example.com"));
        QVERIFY(HtmlSanitizer::isSafeUri("/relative/path"));
        QVERIFY(HtmlSanitizer::isSafeUri("page.html"));
        QVERIFY(HtmlSanitizer::isSafeUri("#anchor"));
        QVERIFY(!HtmlSanitizer::isSafeUri("javascript:alert(1)"));
        QVERIFY(!HtmlSanitizer::isSafeUri("JavaScript:alert(1)"));
        QVERIFY(!HtmlSanitizer::isSafeUri("java\tscript:alert(1)"));
        QVERIFY(!HtmlSanitizer::isSafeUri("data:text/html,<p>"));
    }

    void exportWritesPdf() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.filePath("out.pdf");

        PrintRenderer::Settings settings;
        settings.resolutionDpi = 96;
        QVERIFY(PrintRenderer::exportToPdf(pagesOf({ "<p>one</p>", "<p>two</p>" }), PageLayout(), path, settings));

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        QVERIFY(file.read(4) == QByteArray("%PDF"));
    }

    void exportFailsForUnwritablePath() {
        QTemporaryDir dir;
        const QString path = dir.filePath("missing/dir/out.pdf");
        QVERIFY(!PrintRenderer::exportToPdf(pagesOf({ "x" }), PageLayout(), path));
        QVERIFY(!QFile::exists(path));
    }

    void exportRejectsInvalidLayout() {
        QTemporaryDir dir;
        PageLayout layout;
        layout.marginLeftMm = 200.0;
        QVERIFY(!layout.isValid());
        QVERIFY(!PrintRenderer::exportToPdf(pagesOf({ "x" }), layout, dir.filePath("out.pdf")));
        QVERIFY(!PrintRenderer::exportToPdf(pagesOf({ "x" }), PageLayout(), QString()));
    }
};

QTEST_MAIN(PrintRendererTests)
#include "printrenderer_test.moc"
