#pragma once

#include "overflowdetector.h"
#include "pagelayout.h"
#include "pagemodel.h"

#include <QObject>
#include <QString>
#include <QVector>

class ContentMeasurer;

// One open document: owns its pages and the bookkeeping that keeps the
// serialized value in step with the host. Create one per open document.
class DocumentSession : public QObject {
    Q_OBJECT
public:
    DocumentSession(const PageLayout &layout, const ContentMeasurer *measurer,
                    const QString &initialValue = QString(), QObject *parent = nullptr);

    PageModel *model() { return &m_model; }
    const PageModel *model() const { return &m_model; }
    const PageLayout &layout() const { return m_layout; }
    const OverflowDetector &overflowDetector() const { return m_detector; }

    QString value() const;
    QString lastEmittedValue() const { return m_lastEmittedValue; }

    // External value from the host. Returns false when the value was our own
    // echo (or identical to the current pages) and nothing was re-parsed.
    bool setValue(const QString &value);

    bool updatePageContent(const QString &pageId, const QString &content);
    QString addPage(int afterIndex = -1);
    bool deletePage(const QString &pageId);

    OverflowDetector::Result reflowFrom(const QString &pageId);
    OverflowDetector::Result reflowAll();

    void activatePreviousPage();
    void activateNextPage();

    // Read-only preview of a resolved document (placeholders filled in by a
    // collaborator). While previewing, every mutation is ignored.
    void setPreviewContent(const QString &value);
    bool hasPreviewContent() const { return !m_previewPages.isEmpty(); }
    void setPreviewMode(bool enabled);
    bool isPreviewMode() const { return m_previewMode; }
    QVector<Page> displayPages() const;

signals:
    void valueChanged(const QString &value);
    void previewModeChanged(bool enabled);

private:
    void beginUpdate();
    void endUpdate();
    void markPending();
    void scheduleReflowAll();

    PageLayout m_layout;
    PageModel m_model;
    OverflowDetector m_detector;
    QString m_lastEmittedValue;
    bool m_pendingUpdate = false;
    int m_updateDepth = 0;
    bool m_reflowScheduled = false;
    bool m_previewMode = false;
    QVector<Page> m_previewPages;
};
