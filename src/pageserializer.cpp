#include "pageserializer.h"

#include <QRegularExpression>
#include <QStringList>

namespace PageSerializer {

const QString SENTINEL = QStringLiteral("<!-- PAGE_BREAK -->");

namespace {

// "<!--" + N tildes + " PAGE_BREAK -->". Escaping adds one tilde and
// unescaping removes one, so escaped content never holds the bare sentinel.
const QRegularExpression &escapablePattern()
{
    static const QRegularExpression re(QStringLiteral("<!--(~*) PAGE_BREAK -->"));
    return re;
}

const QRegularExpression &escapedPattern()
{
    static const QRegularExpression re(QStringLiteral("<!--~(~*) PAGE_BREAK -->"));
    return re;
}

} // namespace

QString escapeContent(const QString &content)
{
    if (!content.contains(QLatin1String(" PAGE_BREAK -->"))) {
        return content;
    }
    QString escaped = content;
    escaped.replace(escapablePattern(), QStringLiteral("<!--~\\1 PAGE_BREAK -->"));
    return escaped;
}

QString unescapeContent(const QString &content)
{
    if (!content.contains(QLatin1String(" PAGE_BREAK -->"))) {
        return content;
    }
    QString unescaped = content;
    unescaped.replace(escapedPattern(), QStringLiteral("<!--\\1 PAGE_BREAK -->"));
    return unescaped;
}

QString serialize(const QVector<Page> &pages)
{
    QStringList parts;
    parts.reserve(pages.size());
    for (const Page &page : pages) {
        parts.append(escapeContent(page.content));
    }
    return parts.join(SENTINEL);
}

QVector<Page> deserialize(const QString &value, const QVector<Page> &previousPages)
{
    // Whitespace is preserved exactly; "" is a single empty page.
    const QStringList parts = value.split(SENTINEL);

    QVector<Page> pages;
    pages.reserve(parts.size());
    for (int i = 0; i < parts.size(); ++i) {
        Page page;
        page.id = (i < previousPages.size() && !previousPages[i].id.isEmpty())
            ? previousPages[i].id
            : Page::newId();
        page.content = unescapeContent(parts[i]);
        pages.append(page);
    }
    return pages;
}

} // namespace PageSerializer
