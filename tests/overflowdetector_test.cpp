#include <QTest>
#include <QObject>
#include <QStringList>
#include "contentmeasurer.h"
#include "fakemeasurer.h"
#include "markup.h"
#include "overflowdetector.h"
#include "pagemodel.h"

class OverflowDetectorTests : public QObject {
    Q_OBJECT

private:
    // 4-letter words: a 20-column line holds exactly four of them
    QString words(int count, int first = 0) {
        QStringList list;
        for (int i = first; i < first + count; ++i) {
            list.append(QString("w%1").arg(i, 3, 10, QLatin1Char('0')));
        }
        return list.join(' ');
    }

    QString allContent(const PageModel &model) {
        QString out;
        for (const Page &page : model.pages()) {
            out += page.content;
        }
        return out;
    }

    QStringList contents(const PageModel &model) {
        QStringList out;
        for (const Page &page : model.pages()) {
            out.append(page.content);
        }
        return out;
    }

private slots:
    void fittingPageIsLeftAlone() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(8));

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QVERIFY(result.measured);
        QVERIFY(!result.changed());
        QCOMPARE(model.pageCount(), 1);
        QCOMPARE(model.pageAt(0).content, words(8));
    }

    void overflowCreatesPageWithOverflowWords() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        const QString firstId = model.pageAt(0).id;
        model.updateContent(firstId, words(10));

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QCOMPARE(result.splits, 1);
        QCOMPARE(result.pagesCreated, 1);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(0).content, words(8) + " ");
        QCOMPARE(model.pageAt(1).content, words(2, 8));
        QCOMPARE(model.activePageId(), firstId);
    }

    void overflowIsPrependedToExistingNextPage() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(9));
        model.appendPage("tail");

        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(1).content, words(1, 8) + "tail");
    }

    void secondPassIsIdempotent() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(30));

        detector.reflowAll(&model);
        const QStringList settled = contents(model);

        const OverflowDetector::Result again = detector.reflowAll(&model);
        QVERIFY(!again.changed());
        QCOMPARE(contents(model), settled);
    }

    void splitsOnlyAtWordBoundaries() {
        LineMeasurer measurer(23);
        OverflowDetector detector(&measurer, layoutWithLines(3));
        PageModel model;
        const QString text = "the quick brown fox jumps over the lazy dog while seven "
                             "wizards quietly judge boxing matches near the river";
        model.updateContent(model.pageAt(0).id, text);

        detector.reflow(&model, 0);
        QVERIFY(model.pageCount() > 1);
        QCOMPARE(allContent(model), text);

        for (int i = 0; i + 1 < model.pageCount(); ++i) {
            const QString fitting = model.pageAt(i).content;
            const QString next = model.pageAt(i + 1).content;
            QVERIFY2(fitting.endsWith(' '), qPrintable("page ends mid-word: " + fitting));
            QVERIFY2(!next.at(0).isSpace(), qPrintable("page starts with whitespace: " + next));
        }
    }

    void cascadeTerminatesWithinPageBound() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        // 8 words per page, 40 words total
        model.updateContent(model.pageAt(0).id, words(40));

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 5);
        QCOMPARE(result.pagesCreated, 4);
        QCOMPARE(result.splits, 4);
        QCOMPARE(allContent(model).simplified(), words(40));
    }

    void cascadeThroughExistingPages() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(8));
        model.appendPage(words(8, 8));
        model.appendPage(words(4, 16));

        // Inserting two words at the top pushes everything down by two words
        model.updateContent(model.pageAt(0).id, "new1 new2 " + words(8));
        const OverflowDetector::Result result = detector.reflow(&model, 0);

        QCOMPARE(result.splits, 2);
        QCOMPARE(result.pagesCreated, 0);
        QCOMPARE(model.pageCount(), 3);
        QCOMPARE(measurer.lineCount(model.pageAt(2).content), 2);
    }

    void pageLimitStopsGrowth() {
        LineMeasurer measurer;
        PageLayout layout = layoutWithLines(2);
        layout.maxPages = 2;
        OverflowDetector detector(&measurer, layout);
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(40));

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QVERIFY(result.hitPageLimit);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(allContent(model).simplified(), words(40));
    }

    void structuralElementMovesWhole() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(3));
        PageModel model;
        const QString table = "<table><tr><td>a</td></tr><tr><td>b</td></tr><tr><td>c</td></tr></table>";
        model.updateContent(model.pageAt(0).id, "<p>intro</p>" + table);

        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(0).content, QString("<p>intro</p>"));
        QCOMPARE(model.pageAt(1).content, table);
    }

    void oversizedElementStaysOnItsPage() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        const QString table = "<table><tr><td>a</td></tr><tr><td>b</td></tr><tr><td>c</td></tr></table>";
        model.updateContent(model.pageAt(0).id, table + "after");

        const OverflowDetector::Split split = detector.split(table + "after");
        QVERIFY(split.overflowed);
        QVERIFY(split.oversized);
        QCOMPARE(split.fitting, table);
        QCOMPARE(split.overflow, QString("after"));

        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(0).content, table);

        // The oversized page is settled: a later pass does not loop on it
        const OverflowDetector::Result again = detector.reflowAll(&model);
        QVERIFY(!again.changed());
        QCOMPARE(model.pageCount(), 2);
    }

    void tallParagraphAloneIsSplitInside() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, "<p style=\"color: red\">" + words(10) + "</p>");

        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(0).content, "<p style=\"color: red\">" + words(8) + " </p>");
        QCOMPARE(model.pageAt(1).content, "<p style=\"color: red\">" + words(2, 8) + "</p>");
    }

    void blankParagraphsAreContent() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        const QString content = "<p></p><p></p><p></p><p></p><p></p>";
        model.updateContent(model.pageAt(0).id, content);

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QVERIFY(result.changed());
        QCOMPARE(model.pageCount(), 3);
        for (const Page &page : model.pages()) {
            QVERIFY2(detector.heightOf(page.content) <= detector.capacityPx(), qPrintable(page.content));
        }
        QCOMPARE(model.pageAt(0).content, QString("<p></p><p></p>"));
        QCOMPARE(allContent(model), content);
    }

    void textAfterBlankParagraphIsNotForced() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        const OverflowDetector::Split split = detector.split("<p></p>" + words(10));

        QVERIFY(split.overflowed);
        QVERIFY(!split.oversized);
        QCOMPARE(split.fitting, "<p></p>" + words(4) + " ");
        QCOMPARE(split.overflow, words(6, 4));
        QVERIFY(detector.heightOf(split.fitting) <= detector.capacityPx());
    }

    void imageBeforeTallElementPushesItForward() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(3));
        PageModel model;
        const QString image = "<img src=\"logo.png\">";
        const QString table = "<table><tr><td>a</td></tr><tr><td>b</td></tr><tr><td>c</td></tr></table>";
        model.updateContent(model.pageAt(0).id, image + table);

        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);
        QCOMPARE(model.pageAt(0).content, image);
        QCOMPARE(model.pageAt(1).content, table);
    }

    void whitespaceOnlyOverflowStaysOnPage() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        const QString content = "<p>" + words(8) + "</p>\n";
        model.updateContent(model.pageAt(0).id, content);
        QVERIFY(detector.heightOf(content) > detector.capacityPx());

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QVERIFY(!result.changed());
        QCOMPARE(model.pageCount(), 1);
        QCOMPARE(model.pageAt(0).content, content);
    }

    void unavailableMeasurementSkipsPass() {
        LineMeasurer measurer;
        measurer.setAvailable(false);
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(40));

        const OverflowDetector::Result result = detector.reflow(&model, 0);
        QVERIFY(!result.measured);
        QVERIFY(!result.changed());
        QCOMPARE(model.pageCount(), 1);
        QCOMPARE(model.pageAt(0).content, words(40));

        measurer.setAvailable(true);
        QVERIFY(detector.reflow(&model, 0).changed());
    }

    void shrinkingNeverMergesPages() {
        LineMeasurer measurer;
        OverflowDetector detector(&measurer, layoutWithLines(2));
        PageModel model;
        model.updateContent(model.pageAt(0).id, words(10));
        detector.reflow(&model, 0);
        QCOMPARE(model.pageCount(), 2);

        model.updateContent(model.pageAt(1).id, QString());
        model.updateContent(model.pageAt(0).id, "short");
        detector.reflowAll(&model);
        QCOMPARE(model.pageCount(), 2);
        QVERIFY(model.pageAt(1).content.isEmpty());
    }

    void documentMeasurerGrowsWithContent() {
        PageLayout layout;
        TextDocumentMeasurer measurer(layout);
        QVERIFY(measurer.isAvailable());

        const int one = measurer.measureHeight("<p>one</p>", layout.contentWidthPx());
        const int three = measurer.measureHeight("<p>one</p><p>two</p><p>three</p>", layout.contentWidthPx());
        QVERIFY(one > 0);
        QVERIFY(three > one);
        QCOMPARE(measurer.measureHeight("<p>one</p>", 0), -1);
    }

    void documentMeasurerPagesLongDocument() {
        PageLayout layout;
        TextDocumentMeasurer measurer(layout);
        OverflowDetector detector(&measurer, layout);
        PageModel model;

        QString content;
        for (int i = 0; i < 120; ++i) {
            content += QString("<p>Paragraph %1 with a few words of body text.</p>").arg(i);
        }
        model.updateContent(model.pageAt(0).id, content);

        const OverflowDetector::Result result = detector.reflowAll(&model);
        QVERIFY(result.measured);
        QVERIFY(model.pageCount() > 1);
        for (const Page &page : model.pages()) {
            QVERIFY(detector.heightOf(page.content) <= detector.capacityPx());
        }
        QCOMPARE(Markup::plainText(allContent(model)), Markup::plainText(content));
    }
};

QTEST_MAIN(OverflowDetectorTests)
#include "overflowdetector_test.moc"
