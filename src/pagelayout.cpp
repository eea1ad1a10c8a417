#include "pagelayout.h"

#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <cmath>

namespace {

void readDouble(const QJsonObject &obj, const char *key, double &target)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isDouble()) {
        target = v.toDouble();
    }
}

void readInt(const QJsonObject &obj, const char *key, int &target)
{
    const QJsonValue v = obj.value(QLatin1String(key));
    if (v.isDouble()) {
        target = v.toInt();
    }
}

} // namespace

int PageLayout::mmToPx(double mm)
{
    return static_cast<int>(std::lround(mm / MM_PER_INCH * CSS_DPI));
}

bool PageLayout::isValid() const
{
    if (pageWidthMm <= 0.0 || pageHeightMm <= 0.0) {
        return false;
    }
    if (marginTopMm < 0.0 || marginRightMm < 0.0 || marginBottomMm < 0.0 || marginLeftMm < 0.0) {
        return false;
    }
    if (headerReservePx < 0 || footerReservePx < 0) {
        return false;
    }
    if (fontFamily.trimmed().isEmpty() || fontPointSize <= 0.0 || lineHeight <= 0.0) {
        return false;
    }
    return contentWidthPx() > 0 && capacityPx() > 0 && maxPages >= 1;
}

bool PageLayout::loadFromFile(const QString &filePath)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[PageLayout] Cannot open layout file:" << filePath;
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (doc.isNull() || !doc.isObject()) {
        qWarning() << "[PageLayout] Invalid layout JSON:" << parseError.errorString();
        return false;
    }

    const QJsonObject root = doc.object();
    PageLayout candidate = *this;

    readDouble(root, "pageWidthMm", candidate.pageWidthMm);
    readDouble(root, "pageHeightMm", candidate.pageHeightMm);

    // "marginMm" sets all four sides, per-side keys refine it
    double uniformMargin = -1.0;
    readDouble(root, "marginMm", uniformMargin);
    if (uniformMargin >= 0.0) {
        candidate.marginTopMm = uniformMargin;
        candidate.marginRightMm = uniformMargin;
        candidate.marginBottomMm = uniformMargin;
        candidate.marginLeftMm = uniformMargin;
    }
    readDouble(root, "marginTopMm", candidate.marginTopMm);
    readDouble(root, "marginRightMm", candidate.marginRightMm);
    readDouble(root, "marginBottomMm", candidate.marginBottomMm);
    readDouble(root, "marginLeftMm", candidate.marginLeftMm);

    readInt(root, "headerReservePx", candidate.headerReservePx);
    readInt(root, "footerReservePx", candidate.footerReservePx);

    const QJsonValue family = root.value(QLatin1String("fontFamily"));
    if (family.isString()) {
        candidate.fontFamily = family.toString();
    }
    readDouble(root, "fontPointSize", candidate.fontPointSize);
    readDouble(root, "lineHeight", candidate.lineHeight);
    readInt(root, "maxPages", candidate.maxPages);

    if (!candidate.isValid()) {
        qWarning() << "[PageLayout] Layout file yields invalid geometry, keeping defaults:" << filePath;
        return false;
    }

    *this = candidate;
    qDebug() << "[PageLayout] Loaded" << filePath << "page:" << pageWidthPx() << "x" << pageHeightPx()
             << "content:" << contentWidthPx() << "x" << capacityPx();
    return true;
}
