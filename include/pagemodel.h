#pragma once

#include <QObject>
#include <QString>
#include <QVector>

struct Page {
    QString id;
    QString content;

    static QString newId();
};

// Ordered page list of one open document. A document never has fewer than
// one page; every operation is total and unknown ids are ignored.
class PageModel : public QObject {
    Q_OBJECT
public:
    explicit PageModel(QObject *parent = nullptr);

    void initialize(const QString &serializedValue);

    const QVector<Page> &pages() const { return m_pages; }
    int pageCount() const { return m_pages.size(); }
    const Page &pageAt(int index) const { return m_pages.at(index); }
    int indexOf(const QString &pageId) const;
    bool contains(const QString &pageId) const { return indexOf(pageId) >= 0; }

    QString activePageId() const { return m_activePageId; }
    int activePageIndex() const { return indexOf(m_activePageId); }
    void setActivePage(const QString &pageId);

    bool updateContent(const QString &pageId, const QString &newContent);
    QString addPage(int afterIndex = -1);
    bool deletePage(const QString &pageId);

    // Used by overflow resolution; neither changes the active page.
    void prependContent(int index, const QString &markup);
    QString appendPage(const QString &content);

    // Swaps in a freshly deserialized list. Keeps the active page when its id
    // survived, otherwise activates the first page.
    void replacePages(const QVector<Page> &pages);

signals:
    void pagesChanged();
    void activePageChanged(const QString &pageId);

private:
    void ensureNotEmpty();

    QVector<Page> m_pages;
    QString m_activePageId;
};
