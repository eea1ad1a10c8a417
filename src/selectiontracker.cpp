#include "selectiontracker.h"

#include <QDebug>
#include <QTextBlock>
#include <QTextCursor>
#include <QTextDocument>

namespace {

bool positionInside(QTextDocument *doc, int position)
{
    return position >= 0 && position < doc->characterCount();
}

// Absolute document position for a (run, offset) pair, or -1 when the run
// no longer exists or has become too short.
int resolvePosition(QTextDocument *doc, int run, int offset)
{
    const QTextBlock block = doc->findBlockByNumber(run);
    if (!block.isValid() || offset < 0 || offset >= block.length()) {
        return -1;
    }
    return block.position() + offset;
}

} // namespace

void SelectionTracker::setSurface(QTextEdit *surface)
{
    m_surface = surface;
}

void SelectionTracker::save()
{
    if (!m_surface) {
        return;
    }

    QTextDocument *doc = m_surface->document();
    const QTextCursor cursor = m_surface->textCursor();
    if (cursor.isNull() || cursor.document() != doc) {
        return;
    }
    if (!positionInside(doc, cursor.anchor()) || !positionInside(doc, cursor.position())) {
        return;
    }

    const QTextBlock anchorBlock = doc->findBlock(cursor.anchor());
    const QTextBlock focusBlock = doc->findBlock(cursor.position());

    m_snapshot.anchorRun = anchorBlock.blockNumber();
    m_snapshot.anchorOffset = cursor.anchor() - anchorBlock.position();
    m_snapshot.focusRun = focusBlock.blockNumber();
    m_snapshot.focusOffset = cursor.position() - focusBlock.position();
    m_snapshot.collapsed = !cursor.hasSelection();
    m_snapshotSurface = m_surface;
    m_hasSnapshot = true;
}

bool SelectionTracker::restore()
{
    if (!m_hasSnapshot) {
        return false;
    }

    const SelectionSnapshot snap = m_snapshot;
    QTextEdit *target = m_snapshotSurface;
    clear();

    if (!target || target != m_surface) {
        qDebug() << "[SelectionTracker] Saved selection belongs to a surface that is gone";
        return false;
    }

    QTextDocument *doc = target->document();
    const int anchor = resolvePosition(doc, snap.anchorRun, snap.anchorOffset);
    const int focus = resolvePosition(doc, snap.focusRun, snap.focusOffset);
    if (anchor < 0 || focus < 0) {
        qDebug() << "[SelectionTracker] Saved selection is no longer attached";
        return false;
    }

    QTextCursor cursor(doc);
    cursor.setPosition(anchor);
    cursor.setPosition(focus, QTextCursor::KeepAnchor);
    target->setTextCursor(cursor);
    return true;
}

void SelectionTracker::clear()
{
    m_hasSnapshot = false;
    m_snapshotSurface.clear();
    m_snapshot = SelectionSnapshot();
}
