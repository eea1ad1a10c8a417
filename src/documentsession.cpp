#include "documentsession.h"

#include "pageserializer.h"

#include <QDebug>
#include <QTimer>

DocumentSession::DocumentSession(const PageLayout &layout, const ContentMeasurer *measurer,
                                 const QString &initialValue, QObject *parent)
    : QObject(parent),
      m_layout(layout),
      m_detector(measurer, layout)
{
    m_model.initialize(initialValue);
    // The host already holds this value; echoing it back must be a no-op
    m_lastEmittedValue = initialValue;
    qDebug() << "[DocumentSession] Opened with" << m_model.pageCount() << "pages";
}

QString DocumentSession::value() const
{
    return PageSerializer::serialize(m_model.pages());
}

bool DocumentSession::setValue(const QString &value)
{
    if (value == m_lastEmittedValue) {
        return false;
    }
    m_lastEmittedValue = value;

    if (m_previewMode) {
        qDebug() << "[DocumentSession] External value ignored while previewing";
        return false;
    }
    if (value == this->value()) {
        return false;
    }

    // Authoritative: any local edit not yet emitted is discarded
    m_model.replacePages(PageSerializer::deserialize(value, m_model.pages()));
    qDebug() << "[DocumentSession] Re-synced from external value," << m_model.pageCount() << "pages";
    // The host's pages were not necessarily measured with this layout
    scheduleReflowAll();
    return true;
}

bool DocumentSession::updatePageContent(const QString &pageId, const QString &content)
{
    if (m_previewMode) {
        return false;
    }
    beginUpdate();
    const bool changed = m_model.updateContent(pageId, content);
    if (changed) {
        markPending();
    }
    endUpdate();
    return changed;
}

QString DocumentSession::addPage(int afterIndex)
{
    if (m_previewMode) {
        return QString();
    }
    beginUpdate();
    const QString id = m_model.addPage(afterIndex);
    markPending();
    endUpdate();
    return id;
}

bool DocumentSession::deletePage(const QString &pageId)
{
    if (m_previewMode) {
        return false;
    }
    beginUpdate();
    const bool deleted = m_model.deletePage(pageId);
    if (deleted) {
        markPending();
    }
    endUpdate();
    return deleted;
}

OverflowDetector::Result DocumentSession::reflowFrom(const QString &pageId)
{
    const int index = m_model.indexOf(pageId);
    if (m_previewMode || index < 0) {
        return OverflowDetector::Result();
    }

    beginUpdate();
    const OverflowDetector::Result result = m_detector.reflow(&m_model, index);
    if (result.changed()) {
        markPending();
    }
    endUpdate();
    return result;
}

OverflowDetector::Result DocumentSession::reflowAll()
{
    if (m_previewMode) {
        return OverflowDetector::Result();
    }

    beginUpdate();
    const OverflowDetector::Result result = m_detector.reflowAll(&m_model);
    if (result.changed()) {
        markPending();
    }
    endUpdate();
    return result;
}

void DocumentSession::activatePreviousPage()
{
    const int index = m_model.activePageIndex();
    if (index > 0) {
        m_model.setActivePage(m_model.pageAt(index - 1).id);
    }
}

void DocumentSession::activateNextPage()
{
    const int index = m_model.activePageIndex();
    if (index >= 0 && index + 1 < m_model.pageCount()) {
        m_model.setActivePage(m_model.pageAt(index + 1).id);
    }
}

void DocumentSession::setPreviewContent(const QString &value)
{
    m_previewPages = value.isEmpty() ? QVector<Page>() : PageSerializer::deserialize(value);
    if (m_previewMode && m_previewPages.isEmpty()) {
        setPreviewMode(false);
    }
}

void DocumentSession::setPreviewMode(bool enabled)
{
    if (enabled && m_previewPages.isEmpty()) {
        qDebug() << "[DocumentSession] No preview content, staying in edit mode";
        return;
    }
    if (m_previewMode == enabled) {
        return;
    }
    m_previewMode = enabled;
    qDebug() << "[DocumentSession] Preview mode:" << enabled;
    emit previewModeChanged(enabled);
}

QVector<Page> DocumentSession::displayPages() const
{
    return m_previewMode ? m_previewPages : m_model.pages();
}

void DocumentSession::beginUpdate()
{
    ++m_updateDepth;
}

void DocumentSession::endUpdate()
{
    if (--m_updateDepth > 0 || !m_pendingUpdate) {
        return;
    }
    m_pendingUpdate = false;
    m_lastEmittedValue = value();
    emit valueChanged(m_lastEmittedValue);
}

void DocumentSession::markPending()
{
    m_pendingUpdate = true;
}

void DocumentSession::scheduleReflowAll()
{
    if (m_reflowScheduled) {
        return;
    }
    m_reflowScheduled = true;

    // Run once the new pages are on screen
    QTimer::singleShot(0, this, [this]() {
        m_reflowScheduled = false;
        const OverflowDetector::Result result = reflowAll();
        if (result.changed()) {
            qDebug() << "[DocumentSession] Re-paginated external value:" << result.splits << "splits,"
                     << result.pagesCreated << "pages created";
        }
    });
}
