#pragma once

#include "pagelayout.h"

#include <QString>

class QTextDocument;

// Rendered-height oracle the overflow detector depends on. Hosts and tests
// substitute their own implementation.
class ContentMeasurer {
public:
    virtual ~ContentMeasurer() = default;
    virtual bool isAvailable() const = 0;
    // Height in px of `markup` laid out at `widthPx`, or -1 when it cannot
    // be measured.
    virtual int measureHeight(const QString &markup, int widthPx) const = 0;
};

// Lays markup out with QTextDocument using the same font, line height and
// zero document margin as the page editors, so measured and displayed
// heights agree.
class TextDocumentMeasurer final : public ContentMeasurer {
public:
    explicit TextDocumentMeasurer(const PageLayout &layout);

    bool isAvailable() const override;
    int measureHeight(const QString &markup, int widthPx) const override;

    // Shared with the page editors: zero margin, base font, wrap width.
    static void configureDocument(QTextDocument *doc, const PageLayout &layout, int widthPx);
    // Gives blocks without an explicit line height the layout's factor.
    static void applyDefaultLineHeight(QTextDocument *doc, double lineHeight);

private:
    PageLayout m_layout;
};
