#pragma once

#include <QString>

// Allow-list sanitizer for user markup that leaves the editor (print, PDF).
namespace HtmlSanitizer {

bool isAllowedTag(const QString &tagName);
bool isAllowedAttribute(const QString &attributeName);
bool isSafeUri(const QString &uri);

QString sanitize(const QString &html);

} // namespace HtmlSanitizer
