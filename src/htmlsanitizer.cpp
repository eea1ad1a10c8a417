#include "htmlsanitizer.h"

#include "markup.h"

#include <QDebug>
#include <QRegularExpression>
#include <QSet>

namespace HtmlSanitizer {

namespace {

// Elements dropped together with everything inside them.
bool isDroppedWithContent(const QString &tagName)
{
    static const QSet<QString> dropped = {
        "script", "style", "iframe", "object", "embed", "template",
        "noscript", "textarea", "title", "svg", "math", "select"
    };
    return dropped.contains(tagName);
}

QString escapeAttribute(const QString &value)
{
    QString escaped = value;
    escaped.replace(QLatin1Char('&'), QStringLiteral("&amp;"));
    escaped.replace(QLatin1Char('"'), QStringLiteral("&quot;"));
    escaped.replace(QLatin1Char('<'), QStringLiteral("&lt;"));
    escaped.replace(QLatin1Char('>'), QStringLiteral("&gt;"));
    return escaped;
}

bool isSafeStyle(const QString &style)
{
    const QString lowered = style.toLower();
    return !lowered.contains(QLatin1String("expression("))
        && !lowered.contains(QLatin1String("javascript:"))
        && !lowered.contains(QLatin1String("url("));
}

QString rebuildTag(const Markup::Tag &tag)
{
    if (tag.kind == Markup::Tag::Close) {
        return QStringLiteral("</%1>").arg(tag.name);
    }

    QString out = QLatin1Char('<') + tag.name;
    for (const auto &attribute : tag.attributes) {
        const QString &name = attribute.first;
        const QString &value = attribute.second;
        if (!isAllowedAttribute(name)) {
            continue;
        }
        if (name == QLatin1String("href") && !isSafeUri(value)) {
            qDebug() << "[HtmlSanitizer] Dropped unsafe href";
            continue;
        }
        if (name == QLatin1String("style") && !isSafeStyle(value)) {
            continue;
        }
        out += QStringLiteral(" %1=\"%2\"").arg(name, escapeAttribute(value));
    }
    out += QLatin1Char('>');
    return out;
}

} // namespace

bool isAllowedTag(const QString &tagName)
{
    static const QSet<QString> allowed = {
        "p", "br", "div", "span", "strong", "b", "em", "i", "u", "s", "strike",
        "ul", "ol", "li", "h1", "h2", "h3", "h4", "h5", "h6", "a", "hr"
    };
    return allowed.contains(tagName.toLower());
}

bool isAllowedAttribute(const QString &attributeName)
{
    static const QSet<QString> allowed = { "href", "target", "rel", "style", "class" };
    return allowed.contains(attributeName.toLower());
}

bool isSafeUri(const QString &uri)
{
    // Browsers ignore whitespace and control characters inside a scheme
    QString compact;
    compact.reserve(uri.size());
    for (const QChar ch : uri) {
        if (!ch.isSpace() && ch.category() != QChar::Other_Control) {
            compact += ch;
        }
    }
    if (compact.isEmpty()) {
        return true;
    }

    static const QRegularExpression allowed(
        QStringLiteral("^(?:(?:https?|mailto):|[^a-z]|[a-z+.\\-]+(?:[^a-z+.\\-:]|$))"),
        QRegularExpression::CaseInsensitiveOption);
    return allowed.match(compact).hasMatch();
}

QString sanitize(const QString &html)
{
    QString out;
    out.reserve(html.size());

    int pos = 0;
    const int n = html.size();
    while (pos < n) {
        const QChar ch = html[pos];
        if (ch != QLatin1Char('<')) {
            out += ch;
            ++pos;
            continue;
        }

        const int len = Markup::tagLengthAt(html, pos);
        if (len == 0) {
            out += QStringLiteral("&lt;");
            ++pos;
            continue;
        }

        // Comments, doctypes and processing instructions never survive
        if (html[pos + 1] == QLatin1Char('!') || html[pos + 1] == QLatin1Char('?')) {
            pos += len;
            continue;
        }

        const Markup::Tag tag = Markup::parseTag(html.mid(pos, len));
        if (!tag.valid) {
            pos += len;
            continue;
        }

        if (isDroppedWithContent(tag.name)) {
            pos += tag.kind == Markup::Tag::Open ? Markup::elementLengthAt(html, pos) : len;
            continue;
        }

        if (isAllowedTag(tag.name)) {
            out += rebuildTag(tag);
        }
        // Disallowed but harmless elements are unwrapped: children stay
        pos += len;
    }

    return out;
}

} // namespace HtmlSanitizer
