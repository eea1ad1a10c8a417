#include <QTest>
#include <QObject>
#include <QSignalSpy>
#include "documentsession.h"
#include "fakemeasurer.h"
#include "pageserializer.h"

class DocumentSessionTests : public QObject {
    Q_OBJECT

private:
    QString joinPages(const QStringList &contents) {
        return contents.join(PageSerializer::SENTINEL);
    }

    QString words(int count) {
        QStringList list;
        for (int i = 0; i < count; ++i) {
            list.append(QString("w%1").arg(i, 3, 10, QLatin1Char('0')));
        }
        return list.join(' ');
    }

private slots:
    void initialValueIsPaginated() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B" }));
        QCOMPARE(session.model()->pageCount(), 2);
        QCOMPARE(session.model()->pageAt(0).content, QString("A"));
        QCOMPARE(session.model()->pageAt(1).content, QString("B"));
        QCOMPARE(session.value(), joinPages({ "A", "B" }));
    }

    void externalEmptyValueLeavesOneEmptyPage() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B" }));

        QVERIFY(session.setValue(QString()));
        QCOMPARE(session.model()->pageCount(), 1);
        QVERIFY(session.model()->pageAt(0).content.isEmpty());
    }

    void echoOfInitialValueIsIgnored() {
        LineMeasurer measurer;
        const QString initial = joinPages({ "A", "B" });
        DocumentSession session(layoutWithLines(2), &measurer, initial);
        const QString firstId = session.model()->pageAt(0).id;

        QSignalSpy pagesSpy(session.model(), &PageModel::pagesChanged);
        QVERIFY(!session.setValue(initial));
        QCOMPARE(pagesSpy.count(), 0);
        QCOMPARE(session.model()->pageAt(0).id, firstId);
    }

    void echoOfEmittedValueIsIgnored() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer);
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        const QString pageId = session.model()->pageAt(0).id;
        QVERIFY(session.updatePageContent(pageId, "<p>draft</p>"));
        QCOMPARE(valueSpy.count(), 1);
        const QString emitted = valueSpy.takeFirst().at(0).toString();
        QCOMPARE(emitted, QString("<p>draft</p>"));
        QCOMPARE(session.lastEmittedValue(), emitted);

        // The host echoing the latest emission back changes nothing
        session.updatePageContent(pageId, "<p>draft two</p>");
        QSignalSpy pagesSpy(session.model(), &PageModel::pagesChanged);
        valueSpy.clear();
        QVERIFY(!session.setValue("<p>draft two</p>"));
        QCOMPARE(pagesSpy.count(), 0);
        QCOMPARE(session.model()->pageAt(0).content, QString("<p>draft two</p>"));
    }

    void externalValueReplacesPagesAndKeepsIds() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B" }));
        const QString firstId = session.model()->pageAt(0).id;
        const QString secondId = session.model()->pageAt(1).id;

        QVERIFY(session.setValue(joinPages({ "A2", "B2", "C2" })));
        QCOMPARE(session.model()->pageCount(), 3);
        QCOMPARE(session.model()->pageAt(0).id, firstId);
        QCOMPARE(session.model()->pageAt(1).id, secondId);
        QVERIFY(session.model()->pageAt(2).id != firstId);
        QCOMPARE(session.model()->pageAt(2).content, QString("C2"));
    }

    void externalValueDoesNotEmit() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer);
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        session.setValue(joinPages({ "X", "Y" }));
        QCOMPARE(valueSpy.count(), 0);
    }

    void externalOverflowIsRepaginated() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, "A");
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        QVERIFY(session.setValue(words(40)));
        QCOMPARE(session.model()->pageCount(), 1);

        QTRY_COMPARE(session.model()->pageCount(), 5);
        QCOMPARE(valueSpy.count(), 1);
        QCOMPARE(valueSpy.first().at(0).toString().count(PageSerializer::SENTINEL), 4);

        // The host echoing the paginated value back is a no-op
        QVERIFY(!session.setValue(valueSpy.first().at(0).toString()));
    }

    void oneValueChangePerMutation() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer);
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        const QString newId = session.addPage();
        QCOMPARE(valueSpy.count(), 1);
        QCOMPARE(session.model()->activePageId(), newId);

        session.updatePageContent(newId, "text");
        QCOMPARE(valueSpy.count(), 2);

        // Unchanged content is not a mutation
        session.updatePageContent(newId, "text");
        QCOMPARE(valueSpy.count(), 2);

        QVERIFY(session.deletePage(newId));
        QCOMPARE(valueSpy.count(), 3);
        QCOMPARE(valueSpy.last().at(0).toString(), QString());
    }

    void reflowEmitsOnceForCascade() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer);
        const QString pageId = session.model()->pageAt(0).id;
        session.updatePageContent(pageId, words(40));

        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);
        const OverflowDetector::Result result = session.reflowFrom(pageId);
        QCOMPARE(result.splits, 4);
        QCOMPARE(session.model()->pageCount(), 5);
        QCOMPARE(valueSpy.count(), 1);
        QCOMPARE(valueSpy.first().at(0).toString(), session.value());
        QCOMPARE(session.value().count(PageSerializer::SENTINEL), 4);
    }

    void settledReflowDoesNotEmit() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B" }));
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        QVERIFY(!session.reflowAll().changed());
        QCOMPARE(valueSpy.count(), 0);
    }

    void clearingLastPageKeepsIt() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B" }));
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        session.updatePageContent(session.model()->pageAt(1).id, QString());
        QCOMPARE(session.model()->pageCount(), 2);
        QCOMPARE(valueSpy.count(), 1);
        QCOMPARE(valueSpy.first().at(0).toString(), QString("A") + PageSerializer::SENTINEL);

        // Round trip through the host keeps the empty page
        QVERIFY(!session.setValue(session.lastEmittedValue()));
        QCOMPARE(session.model()->pageCount(), 2);
    }

    void pageNavigationStopsAtEnds() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, joinPages({ "A", "B", "C" }));
        QCOMPARE(session.model()->activePageIndex(), 0);

        session.activatePreviousPage();
        QCOMPARE(session.model()->activePageIndex(), 0);

        session.activateNextPage();
        session.activateNextPage();
        session.activateNextPage();
        QCOMPARE(session.model()->activePageIndex(), 2);

        session.activatePreviousPage();
        QCOMPARE(session.model()->activePageIndex(), 1);
    }

    void previewNeedsContent() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, "A");
        QSignalSpy modeSpy(&session, &DocumentSession::previewModeChanged);

        session.setPreviewMode(true);
        QVERIFY(!session.isPreviewMode());
        QCOMPARE(modeSpy.count(), 0);

        session.setPreviewContent(joinPages({ "Dear Ann", "Regards" }));
        session.setPreviewMode(true);
        QVERIFY(session.isPreviewMode());
        QCOMPARE(modeSpy.count(), 1);
        QCOMPARE(session.displayPages().size(), 2);
        QCOMPARE(session.displayPages().at(0).content, QString("Dear Ann"));

        // Dropping the preview content leaves preview mode
        session.setPreviewContent(QString());
        QVERIFY(!session.isPreviewMode());
        QCOMPARE(modeSpy.count(), 2);
        QCOMPARE(session.displayPages().at(0).content, QString("A"));
    }

    void previewIgnoresMutations() {
        LineMeasurer measurer;
        DocumentSession session(layoutWithLines(2), &measurer, "A");
        session.setPreviewContent("Resolved A");
        session.setPreviewMode(true);
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        const QString pageId = session.model()->pageAt(0).id;
        QVERIFY(!session.updatePageContent(pageId, "edited"));
        QVERIFY(session.addPage().isEmpty());
        QVERIFY(!session.deletePage(pageId));
        QVERIFY(!session.setValue(joinPages({ "X", "Y" })));
        QVERIFY(!session.reflowAll().changed());

        QCOMPARE(valueSpy.count(), 0);
        QCOMPARE(session.model()->pageCount(), 1);
        QCOMPARE(session.model()->pageAt(0).content, QString("A"));

        session.setPreviewMode(false);
        QVERIFY(session.updatePageContent(pageId, "edited"));
    }

    void unavailableMeasurementLeavesPages() {
        LineMeasurer measurer;
        measurer.setAvailable(false);
        DocumentSession session(layoutWithLines(2), &measurer, words(40));
        QSignalSpy valueSpy(&session, &DocumentSession::valueChanged);

        const OverflowDetector::Result result = session.reflowAll();
        QVERIFY(!result.measured);
        QCOMPARE(session.model()->pageCount(), 1);
        QCOMPARE(valueSpy.count(), 0);
    }
};

QTEST_MAIN(DocumentSessionTests)
#include "documentsession_test.moc"
