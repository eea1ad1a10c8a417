#include "pagemodel.h"
#include "pageserializer.h"

#include <QDebug>
#include <QUuid>

QString Page::newId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces);
}

PageModel::PageModel(QObject *parent)
    : QObject(parent)
{
    ensureNotEmpty();
    m_activePageId = m_pages.first().id;
}

void PageModel::initialize(const QString &serializedValue)
{
    m_pages = PageSerializer::deserialize(serializedValue);
    ensureNotEmpty();
    m_activePageId = m_pages.first().id;
    qDebug() << "[PageModel] Initialized with" << m_pages.size() << "pages";
    emit pagesChanged();
    emit activePageChanged(m_activePageId);
}

int PageModel::indexOf(const QString &pageId) const
{
    for (int i = 0; i < m_pages.size(); ++i) {
        if (m_pages[i].id == pageId) {
            return i;
        }
    }
    return -1;
}

void PageModel::setActivePage(const QString &pageId)
{
    if (pageId == m_activePageId || !contains(pageId)) {
        return;
    }
    m_activePageId = pageId;
    emit activePageChanged(m_activePageId);
}

bool PageModel::updateContent(const QString &pageId, const QString &newContent)
{
    const int index = indexOf(pageId);
    if (index < 0) {
        return false;
    }
    if (m_pages[index].content == newContent) {
        return false;
    }
    m_pages[index].content = newContent;
    emit pagesChanged();
    return true;
}

QString PageModel::addPage(int afterIndex)
{
    Page page;
    page.id = Page::newId();

    int insertAt = m_pages.size();
    if (afterIndex >= 0 && afterIndex < m_pages.size()) {
        insertAt = afterIndex + 1;
    }
    m_pages.insert(insertAt, page);
    qDebug() << "[PageModel] Added page at index" << insertAt << "count:" << m_pages.size();

    m_activePageId = page.id;
    emit pagesChanged();
    emit activePageChanged(m_activePageId);
    return page.id;
}

bool PageModel::deletePage(const QString &pageId)
{
    if (m_pages.size() <= 1) {
        qDebug() << "[PageModel] Refusing to delete the last page";
        return false;
    }

    const int deletedIndex = indexOf(pageId);
    if (deletedIndex < 0) {
        return false;
    }

    const bool wasActive = (pageId == m_activePageId);
    m_pages.removeAt(deletedIndex);
    qDebug() << "[PageModel] Deleted page at index" << deletedIndex << "count:" << m_pages.size();

    emit pagesChanged();
    if (wasActive) {
        const int newActive = qMin(deletedIndex, m_pages.size() - 1);
        m_activePageId = m_pages[newActive].id;
        emit activePageChanged(m_activePageId);
    }
    return true;
}

void PageModel::prependContent(int index, const QString &markup)
{
    if (index < 0 || index >= m_pages.size() || markup.isEmpty()) {
        return;
    }
    m_pages[index].content.prepend(markup);
    emit pagesChanged();
}

QString PageModel::appendPage(const QString &content)
{
    Page page;
    page.id = Page::newId();
    page.content = content;
    m_pages.append(page);
    emit pagesChanged();
    return page.id;
}

void PageModel::replacePages(const QVector<Page> &pages)
{
    m_pages = pages;
    ensureNotEmpty();
    emit pagesChanged();

    if (!contains(m_activePageId)) {
        m_activePageId = m_pages.first().id;
        emit activePageChanged(m_activePageId);
    }
}

void PageModel::ensureNotEmpty()
{
    if (m_pages.isEmpty()) {
        Page page;
        page.id = Page::newId();
        m_pages.append(page);
    }
}
