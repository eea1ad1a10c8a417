#include <QApplication>
#include <QCommandLineParser>
#include <QMainWindow>
#include <QScrollArea>
#include <QStatusBar>
#include <QMenuBar>
#include <QMenu>
#include <QDebug>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QVBoxLayout>
#include <QDateTime>
#include <QTimer>
#include "contentmeasurer.h"
#include "documentio.h"
#include "documentsession.h"
#include "formattoolbar.h"
#include "pageeditorview.h"
#include "pagelayout.h"

// Custom message handler to add timestamps
void customMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    QString formattedMsg = QString("[%1] %2").arg(timestamp, msg);

    QByteArray localMsg = formattedMsg.toLocal8Bit();
    switch (type) {
    case QtDebugMsg:
    case QtInfoMsg:
        fprintf(stderr, "%s\n", localMsg.constData());
        break;
    case QtWarningMsg:
        fprintf(stderr, "Warning: %s\n", localMsg.constData());
        break;
    case QtCriticalMsg:
        fprintf(stderr, "Critical: %s\n", localMsg.constData());
        break;
    case QtFatalMsg:
        fprintf(stderr, "Fatal: %s\n", localMsg.constData());
        abort();
    }
}

int main(int argc, char *argv[])
{
    qInstallMessageHandler(customMessageHandler);
    QApplication app(argc, argv);
    QApplication::setApplicationName("Folio");
    QApplication::setApplicationVersion("1.0");
    qDebug() << "[Main] Application started";

    QCommandLineParser parser;
    parser.setApplicationDescription("Paginated rich-text document editor");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption layoutOption(QStringList() << "l" << "layout",
                                    "Page layout overrides (JSON).", "file");
    parser.addOption(layoutOption);
    parser.addPositionalArgument("document", "Document to open (.folio or .html).");
    parser.process(app);

    PageLayout layout;
    if (parser.isSet(layoutOption) && !layout.loadFromFile(parser.value(layoutOption))) {
        qWarning() << "[Main] Using default page layout";
    }
    qDebug() << "[Main] Page" << layout.pageWidthPx() << "x" << layout.pageHeightPx()
             << "content" << layout.contentWidthPx() << "x" << layout.capacityPx();

    const TextDocumentMeasurer measurer(layout);

    QMainWindow window;
    window.setWindowTitle("Folio");
    window.resize(1000, 800);

    // Current document (one session and view per open document)
    DocumentSession *currentSession = nullptr;
    PageEditorView *currentView = nullptr;
    QString currentFilePath;

    QMenuBar *menuBar = window.menuBar();
    QMenu *fileMenu = menuBar->addMenu("&File");

    QAction *newAction = fileMenu->addAction("&New");
    newAction->setShortcut(QKeySequence::New);

    QAction *openAction = fileMenu->addAction("&Open...");
    openAction->setShortcut(QKeySequence::Open);

    QAction *saveAction = fileMenu->addAction("&Save");
    saveAction->setShortcut(QKeySequence::Save);

    QAction *saveAsAction = fileMenu->addAction("Save &As...");
    saveAsAction->setShortcut(QKeySequence::SaveAs);

    fileMenu->addSeparator();

    QAction *exportPdfAction = fileMenu->addAction("Export to &PDF...");
    QAction *exportHtmlAction = fileMenu->addAction("Export Printable &HTML...");

    QMenu *editMenu = menuBar->addMenu("&Edit");
    QAction *undoAction = editMenu->addAction("&Undo");
    undoAction->setShortcut(QKeySequence::Undo);
    QAction *redoAction = editMenu->addAction("&Redo");
    redoAction->setShortcut(QKeySequence::Redo);

    QMenu *pageMenu = menuBar->addMenu("&Page");
    QAction *addPageAction = pageMenu->addAction("&Add Page");
    addPageAction->setShortcut(QKeySequence("Ctrl+Return"));
    QAction *deletePageAction = pageMenu->addAction("&Delete Page");
    pageMenu->addSeparator();
    QAction *previousPageAction = pageMenu->addAction("&Previous Page");
    previousPageAction->setShortcut(QKeySequence("Ctrl+PgUp"));
    QAction *nextPageAction = pageMenu->addAction("&Next Page");
    nextPageAction->setShortcut(QKeySequence("Ctrl+PgDown"));
    pageMenu->addSeparator();
    QAction *previewAction = pageMenu->addAction("P&review");
    previewAction->setCheckable(true);

    const QString fileFilter = "Folio Documents (*.folio);;HTML (*.html *.htm)";

    auto openDocument = [&](const QString &initialValue) {
        QWidget *container = new QWidget();
        QVBoxLayout *containerLayout = new QVBoxLayout(container);
        containerLayout->setContentsMargins(0, 0, 0, 0);
        containerLayout->setSpacing(0);

        // Session lives as long as the container that shows it
        DocumentSession *session = new DocumentSession(layout, &measurer, initialValue, container);
        FormatToolbar *toolbar = new FormatToolbar(container);
        PageEditorView *view = new PageEditorView(session);
        view->setPlaceholderText("Start typing your document...");
        toolbar->setPageView(view);

        QScrollArea *scroll = new QScrollArea(container);
        scroll->setWidget(view);
        scroll->setWidgetResizable(true);
        scroll->setBackgroundRole(QPalette::Dark);
        scroll->setAlignment(Qt::AlignHCenter | Qt::AlignTop);

        containerLayout->addWidget(toolbar);
        containerLayout->addWidget(scroll, 1);

        QObject::connect(session, &DocumentSession::valueChanged, &window, [&window](const QString &) {
            window.setWindowModified(true);
        });
        QObject::connect(session, &DocumentSession::previewModeChanged, toolbar, &FormatToolbar::setPreviewMode);
        QObject::connect(session, &DocumentSession::previewModeChanged, previewAction, &QAction::setChecked);
        QObject::connect(session->model(), &PageModel::pagesChanged, &window, [&window, session]() {
            window.statusBar()->showMessage(QString("%1 pages").arg(session->model()->pageCount()));
        });

        QWidget *previous = window.takeCentralWidget();
        window.setCentralWidget(container);
        if (previous) {
            previous->deleteLater();
        }
        currentSession = session;
        currentView = view;
        previewAction->setChecked(false);
        window.setWindowModified(false);

        // Loaded content may not have been paginated with this layout
        QTimer::singleShot(0, view, [session, view]() {
            const OverflowDetector::Result result = session->reflowAll();
            qDebug() << "[Main] Initial reflow:" << result.splits << "splits," << result.pagesCreated << "pages created";
            view->focusEditor();
        });
        qDebug() << "[Main] Document opened with" << session->model()->pageCount() << "pages";
    };

    auto updateTitle = [&window, &currentFilePath]() {
        const QString name = currentFilePath.isEmpty() ? QString("Untitled") : QFileInfo(currentFilePath).fileName();
        window.setWindowTitle(QString("%1[*] - Folio").arg(name));
    };

    auto loadFile = [&](const QString &filePath) {
        QString value;
        if (!DocumentIO::loadDocument(filePath, value)) {
            QMessageBox::warning(&window, "Load Error", "Failed to load document file.");
            return;
        }
        openDocument(value);
        currentFilePath = filePath;
        updateTitle();
    };

    auto saveTo = [&](const QString &filePath) -> bool {
        if (!currentSession) return false;
        if (!DocumentIO::saveDocument(currentSession->value(), filePath)) {
            QMessageBox::warning(&window, "Save Error", "Failed to save document file.");
            return false;
        }
        currentFilePath = filePath;
        window.setWindowModified(false);
        updateTitle();
        qDebug() << "[Main] Saved to:" << filePath;
        return true;
    };

    QObject::connect(newAction, &QAction::triggered, [&]() {
        qDebug() << "[Main] New document requested";
        openDocument(QString());
        currentFilePath.clear();
        updateTitle();
    });

    QObject::connect(openAction, &QAction::triggered, [&]() {
        QString filePath = QFileDialog::getOpenFileName(&window, "Open Document", "", fileFilter);
        if (filePath.isEmpty()) return;
        qDebug() << "[Main] Open document requested:" << filePath;
        loadFile(filePath);
    });

    QObject::connect(saveAsAction, &QAction::triggered, [&]() {
        QString filePath = QFileDialog::getSaveFileName(&window, "Save Document As", "", fileFilter);
        if (filePath.isEmpty()) return;
        saveTo(filePath);
    });

    QObject::connect(saveAction, &QAction::triggered, [&]() {
        if (currentFilePath.isEmpty()) {
            saveAsAction->trigger();
            return;
        }
        saveTo(currentFilePath);
    });

    QObject::connect(exportPdfAction, &QAction::triggered, [&]() {
        if (!currentView) return;
        QString filePath = QFileDialog::getSaveFileName(&window, "Export as PDF", "", "PDF Files (*.pdf)");
        if (filePath.isEmpty()) return;
        if (currentView->exportToPdf(filePath)) {
            qDebug() << "[Main] Exported to PDF:" << filePath;
            QMessageBox::information(&window, "Export Successful", "Document exported to PDF successfully.");
        } else {
            QMessageBox::warning(&window, "Export Error", "Failed to export document to PDF.");
        }
    });

    QObject::connect(exportHtmlAction, &QAction::triggered, [&]() {
        if (!currentView) return;
        QString filePath = QFileDialog::getSaveFileName(&window, "Export Printable HTML", "", "HTML (*.html)");
        if (filePath.isEmpty()) return;
        if (!currentView->printToHtml(filePath)) {
            QMessageBox::warning(&window, "Export Error", "Failed to write printable HTML.");
        }
    });

    QObject::connect(undoAction, &QAction::triggered, [&]() {
        if (currentView) currentView->applyCommand(PageEditorView::Undo);
    });
    QObject::connect(redoAction, &QAction::triggered, [&]() {
        if (currentView) currentView->applyCommand(PageEditorView::Redo);
    });

    QObject::connect(addPageAction, &QAction::triggered, [&]() {
        if (currentView) currentView->addPage();
    });
    QObject::connect(deletePageAction, &QAction::triggered, [&]() {
        if (currentView) currentView->deleteActivePage();
    });
    QObject::connect(previousPageAction, &QAction::triggered, [&]() {
        if (currentView) currentView->activatePreviousPage();
    });
    QObject::connect(nextPageAction, &QAction::triggered, [&]() {
        if (currentView) currentView->activateNextPage();
    });

    QObject::connect(previewAction, &QAction::triggered, [&](bool checked) {
        if (!currentSession) return;
        if (checked) {
            // No placeholder resolver is attached; the preview shows the document as is
            currentSession->setPreviewContent(currentSession->value());
        }
        currentSession->setPreviewMode(checked);
        previewAction->setChecked(currentSession->isPreviewMode());
    });

    const QStringList positional = parser.positionalArguments();
    if (!positional.isEmpty()) {
        loadFile(positional.first());
    }
    if (!currentSession) {
        openDocument(QString());
        updateTitle();
    }

    window.show();
    qDebug() << "[Main] Window shown, entering event loop";

    return app.exec();
}
