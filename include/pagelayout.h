#pragma once

#include <QString>

// Page geometry shared by the live editing surface and the print renderer.
// Millimetres are the source of truth; pixel values are derived at 96 DPI.
struct PageLayout {
    static constexpr double CSS_DPI = 96.0;
    static constexpr double MM_PER_INCH = 25.4;

    // A4 portrait
    double pageWidthMm = 210.0;
    double pageHeightMm = 297.0;

    double marginTopMm = 20.0;
    double marginRightMm = 20.0;
    double marginBottomMm = 20.0;
    double marginLeftMm = 20.0;

    // Space kept free inside the margin box for letterhead header/footer
    int headerReservePx = 0;
    int footerReservePx = 0;

    QString fontFamily = QStringLiteral("Arial");
    double fontPointSize = 11.0;
    double lineHeight = 1.5;

    // Upper bound on the page count the overflow detector may grow to
    int maxPages = 500;

    static int mmToPx(double mm);

    int pageWidthPx() const { return mmToPx(pageWidthMm); }
    int pageHeightPx() const { return mmToPx(pageHeightMm); }
    int marginTopPx() const { return mmToPx(marginTopMm); }
    int marginRightPx() const { return mmToPx(marginRightMm); }
    int marginBottomPx() const { return mmToPx(marginBottomMm); }
    int marginLeftPx() const { return mmToPx(marginLeftMm); }

    int contentWidthPx() const { return pageWidthPx() - marginLeftPx() - marginRightPx(); }
    int contentHeightPx() const { return pageHeightPx() - marginTopPx() - marginBottomPx(); }

    // Height available to flowing text once header/footer space is reserved
    int capacityPx() const { return contentHeightPx() - headerReservePx - footerReservePx; }

    bool isValid() const;

    // Reads overrides from a JSON object file. Keys that are missing keep
    // their current value. Returns false (leaving *this untouched) when the
    // file cannot be read or yields an invalid layout.
    bool loadFromFile(const QString &filePath);
};
