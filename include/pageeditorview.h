#pragma once
#include <QWidget>
#include <QRect>
#include <QString>
#include <QVariant>
#include <QVector>
#include "pagelayout.h"
#include "selectiontracker.h"

class DocumentSession;
class PageTextEdit;

// Stack of fixed-size pages, one PageTextEdit per page, kept in step with a
// DocumentSession. The session is not owned and must outlive the view.
class PageEditorView : public QWidget {
    Q_OBJECT
public:
    enum Command {
        Undo = 0,
        Redo,
        Bold,
        Italic,
        Underline,
        BulletList,
        NumberedList,
        AlignLeft,
        AlignCenter,
        AlignRight,
        Indent,
        Outdent,
        FontFamily,   // value: family name
        FontSize,     // value: point size
        LineSpacing,  // value: factor, e.g. 1.5
        CommandCount
    };

    explicit PageEditorView(DocumentSession *session, QWidget *parent = nullptr);

    DocumentSession *session() const { return m_session; }
    int pageCount() const { return m_editors.size(); }
    int pageGapPx() const { return PAGE_GAP_PX; }
    PageTextEdit *editorAt(int index) const;
    PageTextEdit *activeEditor() const;
    QRect pageRect(int index) const;
    SelectionTracker *selectionTracker() { return &m_selection; }

    // Operations for collaborators outside the editor (drafting panels etc.)
    void insertAtCursor(const QString &text);
    void focusEditor();
    QString selectedText() const;
    QString surroundingContent() const;
    void replaceSelection(const QString &text);

    void saveSelection();
    bool applyCommand(Command command, const QVariant &value = QVariant());

    void setPlaceholderText(const QString &text);
    QString placeholderText() const { return m_placeholderText; }

    bool printToHtml(const QString &filePath) const;
    bool exportToPdf(const QString &filePath) const;

public slots:
    void addPage();
    void deleteActivePage();
    void activatePreviousPage();
    void activateNextPage();
    void scrollToActivePage();

protected:
    void paintEvent(QPaintEvent *event) override;
    void resizeEvent(QResizeEvent *event) override;

private:
    void syncEditors();
    void layoutPages();
    void updatePlaceholder();
    void onContentEdited(const QString &pageId, const QString &html);
    void onEditorFocused(const QString &pageId);
    void onEditorFocusLeaving(const QString &pageId);
    void onActivePageChanged(const QString &pageId);
    void scheduleReflow(const QString &pageId);
    void runReflow();
    PageTextEdit *createEditor(const QString &pageId);
    int pageYOffset(int pageIndex) const;
    int pageXOffset() const;

    static constexpr int PAGE_GAP_PX = 30;
    static constexpr int PAGE_PADDING_PX = 20;
    static constexpr int WIDGET_HORIZONTAL_PADDING = 40;
    static constexpr int WIDGET_VERTICAL_PADDING = 40;

    static constexpr int BG_GRAY_VALUE = 226;
    static constexpr int BORDER_GRAY_VALUE = 190;
    static constexpr int ACTIVE_BORDER_R = 31;
    static constexpr int ACTIVE_BORDER_G = 111;
    static constexpr int ACTIVE_BORDER_B = 235;

    static constexpr int PAGE_NUM_FONT_SIZE = 9;
    static constexpr int PAGE_NUM_HEIGHT = 20;
    static constexpr int PAGE_LABEL_FONT_SIZE = 8;
    static constexpr int PAGE_LABEL_OFFSET = 8;

    static constexpr int SCROLL_X_MARGIN = 40;
    static constexpr int SCROLL_Y_MARGIN = 120;

    DocumentSession *m_session;
    PageLayout m_layout;
    QVector<PageTextEdit *> m_editors;
    SelectionTracker m_selection;
    QString m_placeholderText;
    QString m_reflowPageId;
    bool m_syncing = false;          // Guard against re-entrant editor updates
    bool m_reflowScheduled = false;
};
