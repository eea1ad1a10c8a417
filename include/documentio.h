#pragma once

class QString;

// Reads and writes the serialized document value. ".html"/".htm" files hold
// the raw value; anything else is a .folio JSON envelope.
namespace DocumentIO {

constexpr int FORMAT_VERSION = 1;

bool saveDocument(const QString &value, const QString &filePath);
bool loadDocument(const QString &filePath, QString &value);

} // namespace DocumentIO
