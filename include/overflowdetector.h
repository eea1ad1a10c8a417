#pragma once

#include "pagelayout.h"

#include <QString>

class ContentMeasurer;
class PageModel;

// Keeps every page's rendered height within the layout's capacity by moving
// overflowing content forward. Content is relocated, never rewritten.
class OverflowDetector {
public:
    struct Split {
        bool overflowed = false;
        QString fitting;
        QString overflow;
        // The first node (or word) alone is taller than a page and was kept
        // on the page anyway.
        bool oversized = false;
    };

    struct Result {
        bool measured = true;   // false when the measurer was unavailable
        int splits = 0;
        int pagesCreated = 0;
        bool hitPageLimit = false;

        bool changed() const { return splits > 0; }
    };

    OverflowDetector(const ContentMeasurer *measurer, const PageLayout &layout);

    int capacityPx() const { return m_layout.capacityPx(); }
    int widthPx() const { return m_layout.contentWidthPx(); }

    // -1 when the content cannot be measured
    int heightOf(const QString &markup) const;

    Split split(const QString &content) const;

    // Settles the page at startIndex and every page its overflow reaches.
    Result reflow(PageModel *model, int startIndex) const;
    Result reflowAll(PageModel *model) const;

private:
    // Markup that surrounds a candidate fragment while it is measured
    struct Context {
        QString before;
        QString after;
        bool atPageStart = true;   // no node precedes `before` on the page
    };

    bool fits(const QString &markup) const;
    int fitTextPrefix(const Context &ctx, const QString &text, bool force, bool *oversized) const;
    bool splitNodes(const Context &ctx, const QString &content, Split *out) const;

    const ContentMeasurer *m_measurer;
    PageLayout m_layout;
};
