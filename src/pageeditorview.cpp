#include "pageeditorview.h"
#include "documentsession.h"
#include "pagetextedit.h"
#include "printrenderer.h"
#include <QDebug>
#include <QFile>
#include <QPainter>
#include <QScrollArea>
#include <QTextBlock>
#include <QTextCharFormat>
#include <QTextCursor>
#include <QTextList>
#include <QTextListFormat>
#include <QTextStream>
#include <QTimer>

namespace {

QTextListFormat::Style listStyleFor(PageEditorView::Command command)
{
    return command == PageEditorView::NumberedList ? QTextListFormat::ListDecimal
                                                   : QTextListFormat::ListDisc;
}

void toggleList(QTextCursor &cursor, QTextListFormat::Style style)
{
    QTextList *list = cursor.currentList();
    if (list && list->format().style() == style) {
        // Same list type again: turn the selected blocks back into paragraphs
        const int start = cursor.selectionStart();
        const int end = cursor.selectionEnd();
        QTextBlock block = cursor.document()->findBlock(start);
        while (block.isValid() && block.position() <= end) {
            if (QTextList *blockList = block.textList()) {
                blockList->remove(block);
                QTextCursor blockCursor(block);
                QTextBlockFormat fmt = block.blockFormat();
                fmt.setIndent(0);
                blockCursor.setBlockFormat(fmt);
            }
            block = block.next();
        }
        return;
    }

    if (list) {
        QTextListFormat fmt = list->format();
        fmt.setStyle(style);
        list->setFormat(fmt);
        return;
    }

    QTextListFormat fmt;
    fmt.setStyle(style);
    fmt.setIndent(1);
    cursor.createList(fmt);
}

void changeIndent(QTextCursor &cursor, int delta)
{
    if (QTextList *list = cursor.currentList()) {
        QTextListFormat fmt = list->format();
        fmt.setIndent(qMax(1, fmt.indent() + delta));
        list->setFormat(fmt);
        return;
    }
    QTextBlockFormat fmt = cursor.blockFormat();
    fmt.setIndent(qMax(0, fmt.indent() + delta));
    cursor.mergeBlockFormat(fmt);
}

QString toPlainLines(QString text)
{
    text.replace(QChar::ParagraphSeparator, QLatin1Char('\n'));
    text.replace(QChar::LineSeparator, QLatin1Char('\n'));
    return text;
}

} // namespace

PageEditorView::PageEditorView(DocumentSession *session, QWidget *parent)
    : QWidget(parent), m_session(session), m_layout(session->layout())
{
    qDebug() << "[PageEditorView] Constructor starting";

    PageModel *model = m_session->model();
    connect(model, &PageModel::pagesChanged, this, &PageEditorView::syncEditors);
    connect(model, &PageModel::activePageChanged, this, &PageEditorView::onActivePageChanged);
    connect(m_session, &DocumentSession::previewModeChanged, this, [this](bool enabled) {
        qDebug() << "[PageEditorView] Preview mode changed:" << enabled;
        m_selection.clear();
        syncEditors();
    });

    syncEditors();
    qDebug() << "[PageEditorView] Constructor complete, page count:" << pageCount();
}

PageTextEdit *PageEditorView::editorAt(int index) const
{
    return (index >= 0 && index < m_editors.size()) ? m_editors[index] : nullptr;
}

PageTextEdit *PageEditorView::activeEditor() const
{
    const QString activeId = m_session->model()->activePageId();
    for (PageTextEdit *editor : m_editors) {
        if (editor->pageId() == activeId) {
            return editor;
        }
    }
    return m_editors.isEmpty() ? nullptr : m_editors.first();
}

QRect PageEditorView::pageRect(int index) const
{
    return QRect(pageXOffset(), pageYOffset(index), m_layout.pageWidthPx(), m_layout.pageHeightPx());
}

void PageEditorView::insertAtCursor(const QString &text)
{
    PageTextEdit *editor = activeEditor();
    if (!editor || editor->isReadOnly()) {
        return;
    }

    if (!editor->hasFocus() && !m_selection.restore()) {
        // The editor keeps its caret while unfocused
        qDebug() << "[PageEditorView] No saved selection, inserting at the editor caret";
    }
    editor->insertPlainText(text);
    editor->setFocus(Qt::OtherFocusReason);
}

void PageEditorView::focusEditor()
{
    PageTextEdit *editor = activeEditor();
    if (!editor) {
        return;
    }
    editor->setFocus(Qt::OtherFocusReason);
    scrollToActivePage();
}

QString PageEditorView::selectedText() const
{
    const PageTextEdit *editor = activeEditor();
    return editor ? toPlainLines(editor->textCursor().selectedText()) : QString();
}

QString PageEditorView::surroundingContent() const
{
    const PageTextEdit *editor = activeEditor();
    return editor ? editor->toPlainText() : QString();
}

void PageEditorView::replaceSelection(const QString &text)
{
    PageTextEdit *editor = activeEditor();
    if (!editor || editor->isReadOnly()) {
        return;
    }
    if (!editor->hasFocus()) {
        m_selection.restore();
    }
    QTextCursor cursor = editor->textCursor();
    cursor.insertText(text);
    editor->setTextCursor(cursor);
}

void PageEditorView::saveSelection()
{
    m_selection.save();
}

bool PageEditorView::applyCommand(Command command, const QVariant &value)
{
    PageTextEdit *editor = activeEditor();
    if (!editor || m_session->isPreviewMode()) {
        return false;
    }

    // A failed restore is not an error: the command targets the live caret
    if (!m_selection.restore()) {
        qDebug() << "[PageEditorView] No saved selection, using current caret";
    }
    QTextCursor cursor = editor->textCursor();

    switch (command) {
    case Undo:
        editor->undo();
        break;
    case Redo:
        editor->redo();
        break;
    case Bold: {
        QTextCharFormat fmt;
        fmt.setFontWeight(cursor.charFormat().fontWeight() > QFont::Normal ? QFont::Normal : QFont::Bold);
        editor->mergeCurrentCharFormat(fmt);
        break;
    }
    case Italic: {
        QTextCharFormat fmt;
        fmt.setFontItalic(!cursor.charFormat().fontItalic());
        editor->mergeCurrentCharFormat(fmt);
        break;
    }
    case Underline: {
        QTextCharFormat fmt;
        fmt.setFontUnderline(!cursor.charFormat().fontUnderline());
        editor->mergeCurrentCharFormat(fmt);
        break;
    }
    case BulletList:
    case NumberedList:
        cursor.beginEditBlock();
        toggleList(cursor, listStyleFor(command));
        cursor.endEditBlock();
        break;
    case AlignLeft:
        editor->setAlignment(Qt::AlignLeft | Qt::AlignAbsolute);
        break;
    case AlignCenter:
        editor->setAlignment(Qt::AlignHCenter);
        break;
    case AlignRight:
        editor->setAlignment(Qt::AlignRight | Qt::AlignAbsolute);
        break;
    case Indent:
    case Outdent:
        cursor.beginEditBlock();
        changeIndent(cursor, command == Indent ? 1 : -1);
        cursor.endEditBlock();
        break;
    case FontFamily: {
        const QString family = value.toString();
        if (!cursor.hasSelection() || family.isEmpty()) {
            return false;
        }
        QTextCharFormat fmt;
        fmt.setFontFamilies(QStringList{ family });
        cursor.mergeCharFormat(fmt);
        break;
    }
    case FontSize: {
        const double size = value.toDouble();
        if (!cursor.hasSelection() || size <= 0.0) {
            return false;
        }
        QTextCharFormat fmt;
        fmt.setFontPointSize(size);
        cursor.mergeCharFormat(fmt);
        break;
    }
    case LineSpacing: {
        const double factor = value.toDouble();
        if (factor <= 0.0) {
            return false;
        }
        QTextBlockFormat fmt;
        fmt.setLineHeight(factor * 100.0, QTextBlockFormat::ProportionalHeight);
        cursor.mergeBlockFormat(fmt);
        break;
    }
    default:
        return false;
    }

    editor->setFocus(Qt::OtherFocusReason);
    return true;
}

void PageEditorView::setPlaceholderText(const QString &text)
{
    m_placeholderText = text;
    updatePlaceholder();
}

bool PageEditorView::printToHtml(const QString &filePath) const
{
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        qWarning() << "[PageEditorView] Cannot write printable HTML:" << filePath << file.errorString();
        return false;
    }
    QTextStream out(&file);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    out.setCodec("UTF-8");
#endif
    out << PrintRenderer::renderHtml(m_session->displayPages(), m_layout);
    out.flush();
    return out.status() == QTextStream::Ok;
}

bool PageEditorView::exportToPdf(const QString &filePath) const
{
    return PrintRenderer::exportToPdf(m_session->displayPages(), m_layout, filePath);
}

void PageEditorView::addPage()
{
    const int index = m_session->model()->activePageIndex();
    if (m_session->addPage(index).isEmpty()) {
        return;
    }
    focusEditor();
}

void PageEditorView::deleteActivePage()
{
    if (m_session->deletePage(m_session->model()->activePageId())) {
        focusEditor();
    }
}

void PageEditorView::activatePreviousPage()
{
    m_session->activatePreviousPage();
    focusEditor();
}

void PageEditorView::activateNextPage()
{
    m_session->activateNextPage();
    focusEditor();
}

void PageEditorView::scrollToActivePage()
{
    QWidget *p = parentWidget();
    QScrollArea *sa = nullptr;
    while (p && !sa) {
        sa = qobject_cast<QScrollArea *>(p);
        p = p->parentWidget();
    }
    PageTextEdit *editor = activeEditor();
    if (!sa || !editor) {
        return;
    }

    const QPoint center = editor->mapTo(this, editor->cursorRect().center());
    sa->ensureVisible(center.x(), center.y(), SCROLL_X_MARGIN, SCROLL_Y_MARGIN);
}

void PageEditorView::paintEvent(QPaintEvent *event)
{
    Q_UNUSED(event);
    QPainter p(this);
    p.fillRect(rect(), QColor(BG_GRAY_VALUE, BG_GRAY_VALUE, BG_GRAY_VALUE));

    const int total = m_editors.size();
    const QString activeId = m_session->isPreviewMode() ? QString() : m_session->model()->activePageId();

    for (int i = 0; i < total; ++i) {
        const QRect page = pageRect(i);
        p.fillRect(page, Qt::white);

        const bool active = m_editors[i]->pageId() == activeId;
        p.setPen(active ? QPen(QColor(ACTIVE_BORDER_R, ACTIVE_BORDER_G, ACTIVE_BORDER_B), 2)
                        : QPen(QColor(BORDER_GRAY_VALUE, BORDER_GRAY_VALUE, BORDER_GRAY_VALUE)));
        p.drawRect(page.adjusted(0, 0, -1, -1));

        // Footer number sits where the printed one does
        QFont pageNumFont(m_layout.fontFamily);
        pageNumFont.setPointSize(PAGE_NUM_FONT_SIZE);
        p.setFont(pageNumFont);
        p.setPen(Qt::black);
        const QRect pageNumRect(page.left(),
                                page.bottom() + 1 - m_layout.marginBottomPx() / 2 - PAGE_NUM_HEIGHT,
                                page.width(), PAGE_NUM_HEIGHT);
        p.drawText(pageNumRect, Qt::AlignHCenter | Qt::AlignBottom, QString::number(i + 1));

        QFont labelFont(m_layout.fontFamily);
        labelFont.setPointSize(PAGE_LABEL_FONT_SIZE);
        p.setFont(labelFont);
        p.setPen(QColor(BORDER_GRAY_VALUE / 2, BORDER_GRAY_VALUE / 2, BORDER_GRAY_VALUE / 2));
        const QRect labelRect = page.adjusted(0, PAGE_LABEL_OFFSET, -PAGE_LABEL_OFFSET * 2, 0);
        p.drawText(labelRect, Qt::AlignTop | Qt::AlignRight,
                   tr("Page %1 of %2").arg(i + 1).arg(total));
    }
}

void PageEditorView::resizeEvent(QResizeEvent *event)
{
    Q_UNUSED(event);
    layoutPages();
}

void PageEditorView::syncEditors()
{
    if (m_syncing) {
        return;
    }
    m_syncing = true;

    const QVector<Page> pages = m_session->displayPages();
    const bool readOnly = m_session->isPreviewMode();

    while (m_editors.size() > pages.size()) {
        PageTextEdit *editor = m_editors.takeLast();
        editor->hide();
        editor->deleteLater();
    }
    while (m_editors.size() < pages.size()) {
        PageTextEdit *editor = createEditor(pages[m_editors.size()].id);
        m_editors.append(editor);
        editor->show();
    }

    for (int i = 0; i < pages.size(); ++i) {
        PageTextEdit *editor = m_editors[i];
        editor->setPageId(pages[i].id);
        editor->setReadOnly(readOnly);
        if (!editor->showsContent(pages[i].content)) {
            editor->setContent(pages[i].content);
        }
    }

    m_selection.setSurface(activeEditor());
    updatePlaceholder();
    layoutPages();
    update();

    m_syncing = false;
}

void PageEditorView::layoutPages()
{
    const int x = pageXOffset();
    for (int i = 0; i < m_editors.size(); ++i) {
        const int y = pageYOffset(i);
        m_editors[i]->move(x + m_layout.marginLeftPx(), y + m_layout.marginTopPx() + m_layout.headerReservePx);
    }

    const int count = qMax(1, m_editors.size());
    const int totalPageHeight = m_layout.pageHeightPx() * count + PAGE_GAP_PX * (count - 1);
    setMinimumWidth(m_layout.pageWidthPx() + WIDGET_HORIZONTAL_PADDING);
    setMaximumWidth(QWIDGETSIZE_MAX);
    setMinimumHeight(totalPageHeight + WIDGET_VERTICAL_PADDING);
    setMaximumHeight(totalPageHeight + WIDGET_VERTICAL_PADDING);
    setSizePolicy(QSizePolicy::Expanding, QSizePolicy::Fixed);
}

void PageEditorView::updatePlaceholder()
{
    for (int i = 0; i < m_editors.size(); ++i) {
        const bool show = i == 0 && m_editors.size() == 1 && !m_session->isPreviewMode();
        m_editors[i]->setPlaceholderText(show ? m_placeholderText : QString());
    }
}

void PageEditorView::onContentEdited(const QString &pageId, const QString &html)
{
    if (m_syncing || m_session->isPreviewMode()) {
        return;
    }
    if (m_session->updatePageContent(pageId, html)) {
        scheduleReflow(pageId);
    }
}

void PageEditorView::onEditorFocused(const QString &pageId)
{
    // Back in the editor: the live selection is authoritative again
    m_selection.clear();
    if (m_session->isPreviewMode()) {
        return;
    }
    m_session->model()->setActivePage(pageId);
}

void PageEditorView::onEditorFocusLeaving(const QString &pageId)
{
    if (pageId == m_session->model()->activePageId()) {
        m_selection.save();
    }
}

void PageEditorView::onActivePageChanged(const QString &pageId)
{
    Q_UNUSED(pageId);
    m_selection.setSurface(activeEditor());
    update();
}

void PageEditorView::scheduleReflow(const QString &pageId)
{
    // Keep the earliest page; reflow moves forward from it
    const PageModel *model = m_session->model();
    if (m_reflowPageId.isEmpty() || model->indexOf(pageId) < model->indexOf(m_reflowPageId)) {
        m_reflowPageId = pageId;
    }
    if (m_reflowScheduled) {
        return;
    }
    m_reflowScheduled = true;

    // Measure after the edit has been laid out
    QTimer::singleShot(0, this, [this]() {
        m_reflowScheduled = false;
        runReflow();
    });
}

void PageEditorView::runReflow()
{
    const QString pageId = m_reflowPageId;
    m_reflowPageId.clear();
    if (pageId.isEmpty() || !m_session->model()->contains(pageId)) {
        return;
    }

    // When typing at the end of a full page, the caret follows the moved text
    PageTextEdit *focusedEditor = nullptr;
    int charsBefore = 0;
    for (PageTextEdit *editor : m_editors) {
        if (editor->pageId() == pageId && editor->hasFocus() && editor->isAtEnd()) {
            focusedEditor = editor;
            charsBefore = editor->document()->characterCount();
        }
    }

    const OverflowDetector::Result result = m_session->reflowFrom(pageId);
    if (!result.changed()) {
        return;
    }
    qDebug() << "[PageEditorView] Reflow moved content across" << result.splits << "pages,"
             << result.pagesCreated << "created";

    if (!focusedEditor) {
        return;
    }
    const int index = m_editors.indexOf(focusedEditor);
    PageTextEdit *next = editorAt(index + 1);
    if (!next) {
        return;
    }
    const int moved = charsBefore - focusedEditor->document()->characterCount();
    QTextCursor cursor(next->document());
    cursor.setPosition(qBound(0, moved, next->document()->characterCount() - 1));
    next->setTextCursor(cursor);
    next->setFocus(Qt::OtherFocusReason);
    scrollToActivePage();
}

PageTextEdit *PageEditorView::createEditor(const QString &pageId)
{
    PageTextEdit *editor = new PageTextEdit(m_layout, pageId, this);
    connect(editor, &PageTextEdit::contentEdited, this, &PageEditorView::onContentEdited);
    connect(editor, &PageTextEdit::focused, this, &PageEditorView::onEditorFocused);
    connect(editor, &PageTextEdit::focusLeaving, this, &PageEditorView::onEditorFocusLeaving);
    return editor;
}

int PageEditorView::pageYOffset(int pageIndex) const
{
    return PAGE_PADDING_PX + (m_layout.pageHeightPx() + PAGE_GAP_PX) * pageIndex;
}

int PageEditorView::pageXOffset() const
{
    const int x = (width() - m_layout.pageWidthPx()) / 2;
    return x < PAGE_PADDING_PX ? PAGE_PADDING_PX : x;
}
