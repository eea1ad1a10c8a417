#pragma once

#include <QPair>
#include <QString>
#include <QVector>

// Lightweight tokenizer for the rich-text fragments stored in pages. It never
// rewrites input: joining the markup of every node returns the source string.
namespace Markup {

struct Node {
    enum Kind {
        Text,
        Element,
        Comment
    };

    Kind kind = Text;
    QString tagName;   // lower case, elements only
    QString markup;    // exact source slice

    bool isText() const { return kind == Text; }
};

// A single tag as found in the source, used by the sanitizer.
struct Tag {
    enum Kind {
        Open,
        Close,
        SelfClosing
    };

    Kind kind = Open;
    QString name;
    QVector<QPair<QString, QString>> attributes;
    bool valid = false;
};

bool isVoidElement(const QString &tagName);

// Top-level nodes of a fragment. Elements include their whole subtree;
// stray end tags become their own element node.
QVector<Node> topLevelNodes(const QString &html);

// Length of the tag starting at html[pos] (which must be '<'), or 0 when the
// '<' does not open a tag and is plain text.
int tagLengthAt(const QString &html, int pos);

// Length of the whole element (start tag, subtree, end tag) starting at
// html[pos], or 0 when no tag starts there.
int elementLengthAt(const QString &html, int pos);

Tag parseTag(const QString &tagMarkup);

// Text with tags and comments removed, entities decoded.
QString plainText(const QString &html);

QString decodeEntities(const QString &text);

} // namespace Markup
