#pragma once

#include "pagemodel.h"

#include <QString>
#include <QVector>

// Single-string form of a page list shared with the hosting application.
namespace PageSerializer {

// Reserved marker between two pages. An HTML comment, so hosts that render
// the raw value show nothing at page boundaries.
extern const QString SENTINEL;

QString escapeContent(const QString &content);
QString unescapeContent(const QString &content);

QString serialize(const QVector<Page> &pages);

// Positional id reuse: part i keeps previousPages[i].id when present.
QVector<Page> deserialize(const QString &value, const QVector<Page> &previousPages = {});

} // namespace PageSerializer
