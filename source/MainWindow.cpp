#include "MainWindow.h"

#include "core/ViewportNavigation.h"
#include "core/NavigationCoordinator.h"
#include "core/NavigationEventBus.h"
#include "core/PageStateStore.h"
#include "viewport/DocumentStackView.h"
#include "ui/sidebars/ThumbnailRail.h"

#include <QComboBox>
#include <QSpinBox>
#include <QCheckBox>
#include <QPushButton>
#include <QLabel>
#include <QSplitter>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QStatusBar>
#include <QSignalBlocker>
#include <QDebug>

// ============================================================================
// Constructor / Destructor
// ============================================================================

MainWindow::MainWindow(const NavigationConfig& config, QWidget* parent)
    : QMainWindow(parent)
{
    // Created first so that it is destroyed before the widgets it watches
    m_navigation = new ViewportNavigation(config, this);

    setupUi();
    setupConnections();

    setWindowTitle(tr("SyncView"));
    resize(1100, 800);
}

MainWindow::~MainWindow()
{
}

// ============================================================================
// Setup
// ============================================================================

void MainWindow::setupUi()
{
    QWidget* central = new QWidget(this);
    QVBoxLayout* mainLayout = new QVBoxLayout(central);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    mainLayout->addWidget(createNavigationBar());

    QSplitter* splitter = new QSplitter(Qt::Horizontal, central);
    m_thumbnailRail = new ThumbnailRail(splitter);
    m_thumbnailRail->setMinimumWidth(THUMBNAIL_RAIL_WIDTH);
    m_stackView = new DocumentStackView(splitter);
    splitter->addWidget(m_thumbnailRail);
    splitter->addWidget(m_stackView);
    splitter->setStretchFactor(0, 0);
    splitter->setStretchFactor(1, 1);
    mainLayout->addWidget(splitter, 1);

    setCentralWidget(central);

    m_pageStatus = new QLabel(this);
    m_phaseStatus = new QLabel(this);
    statusBar()->addPermanentWidget(m_phaseStatus);
    statusBar()->addWidget(m_pageStatus, 1);

    m_stackView->setNavigation(m_navigation);
    m_thumbnailRail->setNavigation(m_navigation);
}

QWidget* MainWindow::createNavigationBar()
{
    QWidget* bar = new QWidget(this);
    QHBoxLayout* layout = new QHBoxLayout(bar);
    layout->setContentsMargins(8, 6, 8, 6);
    layout->setSpacing(8);

    m_fileSelector = new QComboBox(bar);
    m_fileSelector->setMinimumWidth(160);

    m_pageSpin = new QSpinBox(bar);
    m_pageSpin->setRange(1, 1);
    m_pageSpin->setPrefix(tr("Page "));

    m_smoothCheck = new QCheckBox(tr("Smooth"), bar);
    m_smoothCheck->setChecked(true);
    m_alignTopCheck = new QCheckBox(tr("Align to top"), bar);

    m_goButton = new QPushButton(tr("Go"), bar);

    layout->addWidget(new QLabel(tr("File:"), bar));
    layout->addWidget(m_fileSelector);
    layout->addWidget(m_pageSpin);
    layout->addWidget(m_smoothCheck);
    layout->addWidget(m_alignTopCheck);
    layout->addWidget(m_goButton);
    layout->addStretch(1);
    return bar;
}

void MainWindow::setupConnections()
{
    connect(m_fileSelector, QOverload<int>::of(&QComboBox::currentIndexChanged),
            this, &MainWindow::onFileSelected);
    connect(m_goButton, &QPushButton::clicked, this, &MainWindow::onGoToPage);
    connect(m_pageSpin, &QSpinBox::editingFinished, this, &MainWindow::onGoToPage);

    PageStateStore* store = m_navigation->pageState();
    connect(store, &PageStateStore::currentFileChanged, this, &MainWindow::onCurrentFileChanged);
    connect(store, &PageStateStore::currentPageChanged, this, &MainWindow::updateStatus);
    connect(store, &PageStateStore::activePageChanged, this, &MainWindow::updateStatus);

    connect(m_navigation->eventBus(), &NavigationEventBus::scrollFailed,
            this, &MainWindow::onScrollFailed);
    connect(m_navigation->coordinator(), &NavigationCoordinator::phaseChanged, this,
            [this](NavigationPhase phase) {
        m_phaseStatus->setText(navigationPhaseName(phase));
    });
}

// ============================================================================
// Files
// ============================================================================

void MainWindow::loadDemoFiles(int fileCount, int pagesPerFile)
{
    for (int i = 1; i <= fileCount; ++i) {
        const FileKey fileKey = QStringLiteral("file-%1").arg(i);
        if (m_stackView->addFile(fileKey, pagesPerFile, tr("Document %1").arg(i))) {
            m_fileSelector->addItem(fileKey, fileKey);
        }
    }
    qDebug() << "MainWindow: loaded" << fileCount << "files of" << pagesPerFile << "pages";
    updateStatus();
}

void MainWindow::onFileSelected(int index)
{
    if (index < 0) {
        return;
    }
    const FileKey fileKey = m_fileSelector->itemData(index).toString();
    PageStateStore* store = m_navigation->pageState();
    if (fileKey == store->currentFile()) {
        return;
    }

    const bool hasOffset = store->hasSavedScrollOffset(fileKey);
    if (!m_navigation->activateFile(fileKey)) {
        return;
    }

    // First visit: nothing to restore, go to the file's current page
    if (!hasOffset) {
        ScrollOptions options;
        options.behavior = ScrollBehavior::Instant;
        options.alignToTop = true;
        m_navigation->navigateToPage(store->currentPage(fileKey), fileKey, options,
                                     NavigationSource::FileList);
    }
}

void MainWindow::onCurrentFileChanged(const FileKey& fileKey, const QString& source)
{
    Q_UNUSED(source);

    const int index = m_fileSelector->findData(fileKey);
    if (index >= 0 && index != m_fileSelector->currentIndex()) {
        const QSignalBlocker blocker(m_fileSelector);
        m_fileSelector->setCurrentIndex(index);
    }
    updateStatus();
}

// ============================================================================
// Navigation
// ============================================================================

void MainWindow::onGoToPage()
{
    const FileKey fileKey = m_fileSelector->currentData().toString();

    ScrollOptions options;
    options.behavior = m_smoothCheck->isChecked() ? ScrollBehavior::Smooth : ScrollBehavior::Instant;
    options.alignToTop = m_alignTopCheck->isChecked();

    if (!m_navigation->navigateToPage(m_pageSpin->value(), fileKey, options, NavigationSource::Toolbar)) {
        statusBar()->showMessage(tr("Navigation in progress, try again"), FAILURE_MESSAGE_MS);
    }
}

void MainWindow::onScrollFailed(const ScrollFailedEvent& event)
{
    statusBar()->showMessage(tr("Could not reach page %1 of %2 after %3 attempts (%4)")
                                 .arg(event.pageNumber)
                                 .arg(event.fileKey)
                                 .arg(event.attempts)
                                 .arg(scrollFailureReasonName(event.reason)),
                             FAILURE_MESSAGE_MS);
}

void MainWindow::updateStatus()
{
    const PageStateStore* store = m_navigation->pageState();
    const FileKey fileKey = store->currentFile();
    if (fileKey.isEmpty()) {
        m_pageStatus->setText(tr("No file"));
        return;
    }

    const FileNavigationState state = store->state(fileKey);
    m_pageStatus->setText(tr("%1: page %2 of %3 (most visible: %4)")
                              .arg(fileKey)
                              .arg(state.currentPage)
                              .arg(state.totalPages)
                              .arg(state.activePage));

    const QSignalBlocker blocker(m_pageSpin);
    m_pageSpin->setRange(1, qMax(1, state.totalPages));
    m_pageSpin->setValue(qMax(1, state.currentPage));
}
