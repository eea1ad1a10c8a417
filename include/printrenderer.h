#pragma once

#include "pagelayout.h"
#include "pagemodel.h"

#include <QString>
#include <QVector>

namespace PrintRenderer {

struct Settings {
    int resolutionDpi = 300;
    double pageNumberPointSize = 9.0;
    int pageNumberHeightPx = 20;
};

// Standalone HTML document, one fixed-size .page block per page, sanitized
// content, hard page breaks between pages.
QString renderHtml(const QVector<Page> &pages, const PageLayout &layout);

bool exportToPdf(const QVector<Page> &pages, const PageLayout &layout, const QString &filePath,
                 const Settings &settings = Settings());

} // namespace PrintRenderer
