#include "markup.h"

#include <QSet>

namespace Markup {

namespace {

bool isNameChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('-') || ch == QLatin1Char(':') || ch == QLatin1Char('_');
}

bool isRawTextElement(const QString &tagName)
{
    return tagName == QLatin1String("script") || tagName == QLatin1String("style")
        || tagName == QLatin1String("textarea") || tagName == QLatin1String("title");
}

bool isBlockElement(const QString &tagName)
{
    static const QSet<QString> blocks = {
        "p", "div", "li", "ul", "ol", "h1", "h2", "h3", "h4", "h5", "h6", "table", "tr", "hr"
    };
    return blocks.contains(tagName);
}

bool startsWithAt(const QString &html, int pos, QLatin1String token)
{
    return html.mid(pos, token.size()).compare(token, Qt::CaseInsensitive) == 0;
}

QString tagNameAt(const QString &html, int pos)
{
    int i = pos + 1;
    if (i < html.size() && html[i] == QLatin1Char('/')) {
        ++i;
    }
    const int start = i;
    while (i < html.size() && isNameChar(html[i])) {
        ++i;
    }
    return html.mid(start, i - start).toLower();
}

// Skips past the closing tag of a raw-text element whose content starts at
// `from`. Returns html.size() when it is never closed.
int skipRawText(const QString &html, int from, const QString &tagName)
{
    const QString closing = QStringLiteral("</") + tagName;
    const int closeAt = html.indexOf(closing, from, Qt::CaseInsensitive);
    if (closeAt < 0) {
        return html.size();
    }
    const int len = tagLengthAt(html, closeAt);
    return closeAt + (len > 0 ? len : closing.size());
}

// End offset (exclusive) of the element whose start tag ends at `from`.
int elementEnd(const QString &html, int from, const QString &rootName)
{
    if (isRawTextElement(rootName)) {
        return skipRawText(html, from, rootName);
    }

    QVector<QString> open;
    open.append(rootName);

    int pos = from;
    while (pos < html.size()) {
        if (html[pos] != QLatin1Char('<')) {
            ++pos;
            continue;
        }
        const int len = tagLengthAt(html, pos);
        if (len == 0) {
            ++pos;
            continue;
        }
        if (html[pos + 1] == QLatin1Char('!')) {
            pos += len;
            continue;
        }

        const QString name = tagNameAt(html, pos);
        if (html[pos + 1] == QLatin1Char('/')) {
            const int match = open.lastIndexOf(name);
            if (match >= 0) {
                open.resize(match);
                if (open.isEmpty()) {
                    return pos + len;
                }
            }
            pos += len;
            continue;
        }

        const bool selfClosing = html[pos + len - 2] == QLatin1Char('/');
        pos += len;
        if (selfClosing || isVoidElement(name)) {
            continue;
        }
        if (isRawTextElement(name)) {
            pos = skipRawText(html, pos, name);
            continue;
        }
        open.append(name);
    }
    return html.size();
}

} // namespace

bool isVoidElement(const QString &tagName)
{
    static const QSet<QString> voids = {
        "area", "base", "br", "col", "embed", "hr", "img", "input",
        "link", "meta", "param", "source", "track", "wbr"
    };
    return voids.contains(tagName);
}

int tagLengthAt(const QString &html, int pos)
{
    if (pos < 0 || pos + 1 >= html.size() || html[pos] != QLatin1Char('<')) {
        return 0;
    }

    const QChar next = html[pos + 1];
    if (next == QLatin1Char('!')) {
        if (startsWithAt(html, pos, QLatin1String("<!--"))) {
            const int end = html.indexOf(QLatin1String("-->"), pos + 4);
            return end < 0 ? html.size() - pos : end + 3 - pos;
        }
        const int end = html.indexOf(QLatin1Char('>'), pos + 2);
        return end < 0 ? 0 : end + 1 - pos;
    }

    int i = pos + 1;
    if (next == QLatin1Char('/')) {
        ++i;
    }
    if (i >= html.size() || !html[i].isLetter()) {
        return 0;
    }

    QChar quote;
    for (; i < html.size(); ++i) {
        const QChar ch = html[i];
        if (!quote.isNull()) {
            if (ch == quote) {
                quote = QChar();
            }
        } else if (ch == QLatin1Char('"') || ch == QLatin1Char('\'')) {
            quote = ch;
        } else if (ch == QLatin1Char('>')) {
            return i + 1 - pos;
        }
    }
    return 0;
}

QVector<Node> topLevelNodes(const QString &html)
{
    QVector<Node> nodes;
    int pos = 0;
    const int n = html.size();

    while (pos < n) {
        const int len = html[pos] == QLatin1Char('<') ? tagLengthAt(html, pos) : 0;
        if (len > 0) {
            Node node;
            if (html[pos + 1] == QLatin1Char('!')) {
                node.kind = Node::Comment;
                node.markup = html.mid(pos, len);
                pos += len;
            } else if (html[pos + 1] == QLatin1Char('/')) {
                node.kind = Node::Element;
                node.tagName = tagNameAt(html, pos);
                node.markup = html.mid(pos, len);
                pos += len;
            } else {
                node.kind = Node::Element;
                node.tagName = tagNameAt(html, pos);
                const int elementLen = elementLengthAt(html, pos);
                node.markup = html.mid(pos, elementLen);
                pos += elementLen;
            }
            nodes.append(node);
            continue;
        }

        const int start = pos;
        ++pos;
        while (pos < n && !(html[pos] == QLatin1Char('<') && tagLengthAt(html, pos) > 0)) {
            ++pos;
        }
        Node text;
        text.kind = Node::Text;
        text.markup = html.mid(start, pos - start);
        nodes.append(text);
    }

    return nodes;
}

int elementLengthAt(const QString &html, int pos)
{
    const int len = tagLengthAt(html, pos);
    if (len == 0 || html[pos + 1] == QLatin1Char('!') || html[pos + 1] == QLatin1Char('/')) {
        return len;
    }
    const QString name = tagNameAt(html, pos);
    const bool selfClosing = html[pos + len - 2] == QLatin1Char('/');
    if (selfClosing || isVoidElement(name)) {
        return len;
    }
    return elementEnd(html, pos + len, name) - pos;
}

Tag parseTag(const QString &tagMarkup)
{
    Tag tag;
    const int n = tagMarkup.size();
    if (n < 3 || tagMarkup[0] != QLatin1Char('<') || tagMarkup[n - 1] != QLatin1Char('>')) {
        return tag;
    }

    int i = 1;
    if (tagMarkup[i] == QLatin1Char('/')) {
        tag.kind = Tag::Close;
        ++i;
    }
    const int nameStart = i;
    while (i < n && isNameChar(tagMarkup[i])) {
        ++i;
    }
    tag.name = tagMarkup.mid(nameStart, i - nameStart).toLower();
    if (tag.name.isEmpty()) {
        return tag;
    }

    const int end = n - 1;
    while (i < end) {
        const QChar ch = tagMarkup[i];
        if (ch.isSpace() || ch == QLatin1Char('/')) {
            ++i;
            continue;
        }

        const int attrStart = i;
        while (i < end && !tagMarkup[i].isSpace() && tagMarkup[i] != QLatin1Char('=')
               && tagMarkup[i] != QLatin1Char('>') && tagMarkup[i] != QLatin1Char('/')) {
            ++i;
        }
        const QString attrName = tagMarkup.mid(attrStart, i - attrStart).toLower();

        while (i < end && tagMarkup[i].isSpace()) {
            ++i;
        }
        QString value;
        if (i < end && tagMarkup[i] == QLatin1Char('=')) {
            ++i;
            while (i < end && tagMarkup[i].isSpace()) {
                ++i;
            }
            if (i < end && (tagMarkup[i] == QLatin1Char('"') || tagMarkup[i] == QLatin1Char('\''))) {
                const QChar quote = tagMarkup[i];
                const int valueStart = ++i;
                while (i < end && tagMarkup[i] != quote) {
                    ++i;
                }
                value = tagMarkup.mid(valueStart, i - valueStart);
                ++i;
            } else {
                const int valueStart = i;
                while (i < end && !tagMarkup[i].isSpace()) {
                    ++i;
                }
                value = tagMarkup.mid(valueStart, i - valueStart);
            }
        }
        if (!attrName.isEmpty()) {
            tag.attributes.append(qMakePair(attrName, decodeEntities(value)));
        }
    }

    if (tag.kind != Tag::Close && n >= 2 && tagMarkup[n - 2] == QLatin1Char('/')) {
        tag.kind = Tag::SelfClosing;
    }
    tag.valid = true;
    return tag;
}

QString plainText(const QString &html)
{
    QString text;
    int pos = 0;
    int textStart = 0;
    const int n = html.size();

    while (pos < n) {
        const int len = html[pos] == QLatin1Char('<') ? tagLengthAt(html, pos) : 0;
        if (len == 0) {
            ++pos;
            continue;
        }

        text += decodeEntities(html.mid(textStart, pos - textStart));
        if (html[pos + 1] != QLatin1Char('!')) {
            const QString name = tagNameAt(html, pos);
            const bool closing = html[pos + 1] == QLatin1Char('/');
            if (name == QLatin1String("br") || (closing && isBlockElement(name))) {
                text += QLatin1Char('\n');
            }
            if (!closing && isRawTextElement(name)) {
                pos = skipRawText(html, pos + len, name);
                textStart = pos;
                continue;
            }
        }
        pos += len;
        textStart = pos;
    }
    text += decodeEntities(html.mid(textStart));
    return text;
}

QString decodeEntities(const QString &text)
{
    if (!text.contains(QLatin1Char('&'))) {
        return text;
    }

    QString out;
    out.reserve(text.size());
    int i = 0;
    while (i < text.size()) {
        if (text[i] != QLatin1Char('&')) {
            out += text[i++];
            continue;
        }
        const int semi = text.indexOf(QLatin1Char(';'), i + 1);
        if (semi < 0 || semi - i > 10) {
            out += text[i++];
            continue;
        }

        const QString entity = text.mid(i + 1, semi - i - 1);
        QString decoded;
        if (entity == QLatin1String("amp")) {
            decoded = QStringLiteral("&");
        } else if (entity == QLatin1String("lt")) {
            decoded = QStringLiteral("<");
        } else if (entity == QLatin1String("gt")) {
            decoded = QStringLiteral(">");
        } else if (entity == QLatin1String("quot")) {
            decoded = QStringLiteral("\"");
        } else if (entity == QLatin1String("apos")) {
            decoded = QStringLiteral("'");
        } else if (entity == QLatin1String("nbsp")) {
            decoded = QString(QChar(0x00A0));
        } else if (entity.startsWith(QLatin1Char('#'))) {
            bool ok = false;
            const uint code = (entity.size() > 1 && (entity[1] == QLatin1Char('x') || entity[1] == QLatin1Char('X')))
                ? entity.mid(2).toUInt(&ok, 16)
                : entity.mid(1).toUInt(&ok, 10);
            if (ok && code > 0 && code <= 0x10FFFF) {
                if (QChar::requiresSurrogates(code)) {
                    decoded = QString(QChar(QChar::highSurrogate(code))) + QChar(QChar::lowSurrogate(code));
                } else {
                    decoded = QString(QChar(static_cast<ushort>(code)));
                }
            }
        }

        if (decoded.isNull()) {
            out += text[i++];
            continue;
        }
        out += decoded;
        i = semi + 1;
    }
    return out;
}

} // namespace Markup
