#include "overflowdetector.h"

#include "contentmeasurer.h"
#include "markup.h"
#include "pagemodel.h"

#include <QDebug>
#include <QSet>
#include <QVector>

namespace {

// Offsets where a word starts right after whitespace. Cutting a text node at
// one of these never breaks a word; the whitespace stays with the prefix.
QVector<int> wordBoundaries(const QString &text)
{
    QVector<int> cuts;
    for (int i = 1; i < text.size(); ++i) {
        if (!text[i].isSpace() && text[i - 1].isSpace()) {
            cuts.append(i);
        }
    }
    return cuts;
}

bool isSplittable(const QString &tagName)
{
    static const QSet<QString> splittable = {
        "p", "div", "blockquote", "ul", "ol", "li", "h1", "h2", "h3", "h4", "h5", "h6",
        "span", "strong", "b", "em", "i", "u", "s", "strike", "a", "font"
    };
    return splittable.contains(tagName);
}

// Matching end tag at the very end of an element's markup, or empty when the
// element was left unclosed.
QString closingTagOf(const Markup::Node &node)
{
    const QString &markup = node.markup;
    const int lt = markup.lastIndexOf(QLatin1String("</"));
    if (lt <= 0 || !markup.endsWith(QLatin1Char('>'))) {
        return QString();
    }
    const QString tail = markup.mid(lt);
    const Markup::Tag tag = Markup::parseTag(tail);
    if (!tag.valid || tag.kind != Markup::Tag::Close || tag.name != node.tagName) {
        return QString();
    }
    return tail;
}

} // namespace

OverflowDetector::OverflowDetector(const ContentMeasurer *measurer, const PageLayout &layout)
    : m_measurer(measurer), m_layout(layout)
{
}

int OverflowDetector::heightOf(const QString &markup) const
{
    if (!m_measurer || !m_measurer->isAvailable()) {
        return -1;
    }
    return m_measurer->measureHeight(markup, widthPx());
}

bool OverflowDetector::fits(const QString &markup) const
{
    const int h = heightOf(markup);
    return h >= 0 && h <= capacityPx();
}

int OverflowDetector::fitTextPrefix(const Context &ctx, const QString &text, bool force, bool *oversized) const
{
    const QVector<int> cuts = wordBoundaries(text);

    // Height grows with the prefix, so search for the last cut that fits
    int lo = 0;
    int hi = cuts.size() - 1;
    int best = -1;
    while (lo <= hi) {
        const int mid = (lo + hi) / 2;
        if (fits(ctx.before + text.left(cuts[mid]) + ctx.after)) {
            best = mid;
            lo = mid + 1;
        } else {
            hi = mid - 1;
        }
    }

    if (best >= 0) {
        return cuts[best];
    }
    if (!force) {
        return 0;
    }

    // Nothing fits on an otherwise empty page: keep the first word so the
    // page still makes progress.
    if (oversized) {
        *oversized = true;
    }
    return cuts.isEmpty() ? text.size() : cuts.first();
}

bool OverflowDetector::splitNodes(const Context &ctx, const QString &content, Split *out) const
{
    const QVector<Markup::Node> nodes = Markup::topLevelNodes(content);

    QString fitting;
    for (int i = 0; i < nodes.size(); ++i) {
        const Markup::Node &node = nodes[i];
        const QString candidate = fitting + node.markup;
        const int h = heightOf(ctx.before + candidate + ctx.after);
        if (h < 0) {
            return false;
        }
        if (h <= capacityPx()) {
            fitting = candidate;
            continue;
        }

        // Any earlier node counts, blank paragraphs and images included;
        // only bare whitespace between nodes does not
        const bool pageEmpty = ctx.atPageStart && fitting.trimmed().isEmpty();
        const Context inner = { ctx.before + fitting, ctx.after, pageEmpty };

        QString overflowStart;
        bool placed = false;
        if (node.isText()) {
            const int cut = fitTextPrefix(inner, node.markup, pageEmpty, &out->oversized);
            fitting += node.markup.left(cut);
            overflowStart = node.markup.mid(cut);
            placed = true;
        } else if (pageEmpty && node.kind == Markup::Node::Element && isSplittable(node.tagName)) {
            // Alone on the page and still too tall: break inside the element,
            // both halves keep its tags
            const int openLen = Markup::tagLengthAt(node.markup, 0);
            const QString openTag = node.markup.left(openLen);
            const QString closeTag = closingTagOf(node);
            const QString body = node.markup.mid(openLen, node.markup.size() - openLen - closeTag.size());
            const QString closeForMeasure = closeTag.isEmpty() ? QStringLiteral("</%1>").arg(node.tagName) : closeTag;

            Split sub;
            const Context nested = { inner.before + openTag, closeForMeasure + ctx.after, true };
            if (!splitNodes(nested, body, &sub)) {
                return false;
            }
            if (sub.overflowed && !sub.fitting.trimmed().isEmpty()) {
                fitting += openTag + sub.fitting + closeTag;
                overflowStart = openTag + sub.overflow + closeTag;
                out->oversized = out->oversized || sub.oversized;
                placed = true;
            }
        }

        if (!placed) {
            if (pageEmpty) {
                fitting = candidate;
                out->oversized = true;
            } else {
                overflowStart = node.markup;
            }
        }

        QString overflow = overflowStart;
        for (int j = i + 1; j < nodes.size(); ++j) {
            overflow += nodes[j].markup;
        }

        out->overflowed = true;
        out->fitting = fitting;
        out->overflow = overflow;
        return true;
    }

    out->overflowed = false;
    out->fitting = content;
    return true;
}

OverflowDetector::Split OverflowDetector::split(const QString &content) const
{
    Split result;
    if (!splitNodes(Context(), content, &result)) {
        return Split();
    }
    return result;
}

OverflowDetector::Result OverflowDetector::reflow(PageModel *model, int startIndex) const
{
    Result result;
    if (!model) {
        return result;
    }
    if (!m_measurer || !m_measurer->isAvailable()) {
        qWarning() << "[OverflowDetector] Measurement unavailable, skipping overflow check";
        result.measured = false;
        return result;
    }

    // Indices only move forward, so each page is visited at most once
    QVector<int> workList;
    workList.append(startIndex);

    while (!workList.isEmpty()) {
        const int index = workList.takeFirst();
        if (index < 0 || index >= model->pageCount()) {
            continue;
        }

        const Page page = model->pageAt(index);
        const int height = heightOf(page.content);
        if (height < 0) {
            qWarning() << "[OverflowDetector] Measurement failed on page" << index + 1;
            result.measured = false;
            break;
        }
        if (height <= capacityPx()) {
            continue;
        }

        const Split split = this->split(page.content);
        if (!split.overflowed) {
            continue;
        }
        // A whitespace-only tail stays on the page rather than opening a blank one
        if (split.overflow.trimmed().isEmpty()) {
            qDebug() << "[OverflowDetector] Page" << index + 1 << "overflow is whitespace only, kept on page";
            continue;
        }

        const bool hasNext = index + 1 < model->pageCount();
        if (!hasNext && model->pageCount() >= m_layout.maxPages) {
            qWarning() << "[OverflowDetector] Page limit" << m_layout.maxPages << "reached, page" << index + 1 << "left over capacity";
            result.hitPageLimit = true;
            continue;
        }
        if (split.oversized) {
            qWarning() << "[OverflowDetector] Page" << index + 1 << "holds content taller than a page";
        }

        qDebug() << "[OverflowDetector] Page" << index + 1 << "height" << height << ">" << capacityPx()
                 << "moving" << split.overflow.size() << "chars forward";

        model->updateContent(page.id, split.fitting);
        if (hasNext) {
            model->prependContent(index + 1, split.overflow);
        } else {
            model->appendPage(split.overflow);
            ++result.pagesCreated;
        }
        ++result.splits;
        workList.append(index + 1);
    }

    return result;
}

OverflowDetector::Result OverflowDetector::reflowAll(PageModel *model) const
{
    Result total;
    if (!model) {
        return total;
    }
    for (int i = 0; i < model->pageCount(); ++i) {
        const Result pass = reflow(model, i);
        total.splits += pass.splits;
        total.pagesCreated += pass.pagesCreated;
        total.hitPageLimit = total.hitPageLimit || pass.hitPageLimit;
        if (!pass.measured) {
            total.measured = false;
            break;
        }
    }
    return total;
}
