#pragma once

#include <QPointer>
#include <QTextEdit>

// Block-relative position inside an editable surface's document.
struct SelectionSnapshot {
    int anchorRun = 0;
    int anchorOffset = 0;
    int focusRun = 0;
    int focusOffset = 0;
    bool collapsed = true;
};

// Remembers where the user's selection was before something else (a combo
// box, a dialog, a re-render) took focus, and puts it back for the command
// that follows.
class SelectionTracker {
public:
    void setSurface(QTextEdit *surface);
    QTextEdit *surface() const { return m_surface; }

    void save();
    bool restore();

    bool hasSnapshot() const { return m_hasSnapshot; }
    SelectionSnapshot snapshot() const { return m_snapshot; }
    void clear();

private:
    QPointer<QTextEdit> m_surface;
    QPointer<QTextEdit> m_snapshotSurface;
    SelectionSnapshot m_snapshot;
    bool m_hasSnapshot = false;
};
