#include "documentio.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

namespace {

bool isRawHtml(const QString &filePath)
{
    const QString extension = QFileInfo(filePath).suffix().toLower();
    return extension == QStringLiteral("html") || extension == QStringLiteral("htm");
}

bool writeAll(const QString &filePath, const QByteArray &data)
{
    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[DocumentIO] Cannot open" << filePath << "for writing:" << file.errorString();
        return false;
    }
    if (file.write(data) != data.size()) {
        qWarning() << "[DocumentIO] Short write to" << filePath << file.errorString();
        file.cancelWriting();
        return false;
    }
    return file.commit();
}

bool saveAsFolioFile(const QString &value, const QString &filePath)
{
    QJsonObject root;
    root["version"] = DocumentIO::FORMAT_VERSION;
    root["value"] = value;

    QJsonDocument jsonDoc(root);
    return writeAll(filePath, jsonDoc.toJson());
}

bool loadFolioFile(const QByteArray &data, QString &value)
{
    QJsonParseError error;
    QJsonDocument jsonDoc = QJsonDocument::fromJson(data, &error);
    if (jsonDoc.isNull() || !jsonDoc.isObject()) {
        qWarning() << "[DocumentIO] Not a document file:" << error.errorString();
        return false;
    }

    const QJsonObject root = jsonDoc.object();
    const int version = root.value("version").toInt();
    if (version < 1 || version > DocumentIO::FORMAT_VERSION) {
        qWarning() << "[DocumentIO] Unsupported document version" << version;
        return false;
    }
    if (!root.value("value").isString()) {
        qWarning() << "[DocumentIO] Document has no value";
        return false;
    }

    value = root.value("value").toString();
    return true;
}

} // namespace

namespace DocumentIO {

bool saveDocument(const QString &value, const QString &filePath)
{
    qDebug() << "[DocumentIO] Saving to:" << filePath;
    if (isRawHtml(filePath)) {
        return writeAll(filePath, value.toUtf8());
    }
    return saveAsFolioFile(value, filePath);
}

bool loadDocument(const QString &filePath, QString &value)
{
    qDebug() << "[DocumentIO] Loading from:" << filePath;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[DocumentIO] Cannot open" << filePath << file.errorString();
        return false;
    }
    const QByteArray data = file.readAll();
    file.close();

    if (isRawHtml(filePath)) {
        value = QString::fromUtf8(data);
        return true;
    }
    return loadFolioFile(data, value);
}

} // namespace DocumentIO
