#include "ThumbnailRail.h"
#include "../PageThumbnailModel.h"
#include "../PageThumbnailDelegate.h"
#include "../ThemeColors.h"
#include "../../core/ViewportNavigation.h"
#include "../../core/NavigationEventBus.h"
#include "../../core/PageStateStore.h"

#include <QListView>
#include <QVBoxLayout>
#include <QTimer>
#include <QResizeEvent>
#include <QDebug>

// ============================================================================
// Constructor / Destructor
// ============================================================================

ThumbnailRail::ThumbnailRail(QWidget* parent)
    : QWidget(parent)
{
    setupUI();

    connect(m_listView, &QListView::clicked, this, &ThumbnailRail::onItemClicked);
    connect(m_pulseTimer, &QTimer::timeout, this, [this]() {
        m_model->setHighlightedPage(0);
    });
}

ThumbnailRail::~ThumbnailRail()
{
    unbindNavigation();
}

// ============================================================================
// Setup
// ============================================================================

void ThumbnailRail::setupUI()
{
    QVBoxLayout* layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(0);

    m_model = new PageThumbnailModel(this);
    m_delegate = new PageThumbnailDelegate(this);

    m_listView = new QListView(this);
    configureListView();
    m_listView->setModel(m_model);
    m_listView->setItemDelegate(m_delegate);
    layout->addWidget(m_listView);

    m_pulseTimer = new QTimer(this);
    m_pulseTimer->setSingleShot(true);
    m_pulseTimer->setInterval(NavigationConfig().thumbnailHighlightDurationMs);

    applyTheme();
}

void ThumbnailRail::configureListView()
{
    m_listView->setViewMode(QListView::ListMode);
    m_listView->setFlow(QListView::TopToBottom);
    m_listView->setWrapping(false);
    m_listView->setResizeMode(QListView::Adjust);
    m_listView->setLayoutMode(QListView::SinglePass);

    m_listView->setSelectionMode(QAbstractItemView::SingleSelection);
    m_listView->setSelectionBehavior(QAbstractItemView::SelectRows);

    m_listView->setVerticalScrollMode(QAbstractItemView::ScrollPerPixel);
    m_listView->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);

    m_listView->setFrameShape(QFrame::NoFrame);
    m_listView->setSpacing(0);
    m_listView->setUniformItemSizes(true);

    // Hover feedback in the delegate
    m_listView->setMouseTracking(true);
    m_listView->viewport()->setAttribute(Qt::WA_Hover, true);
}

// ============================================================================
// Binding
// ============================================================================

void ThumbnailRail::setNavigation(ViewportNavigation* navigation)
{
    if (m_navigation == navigation) {
        return;
    }
    unbindNavigation();

    m_navigation = navigation;
    if (!m_navigation) {
        m_model->setPageState(nullptr);
        return;
    }

    m_pulseTimer->setInterval(m_navigation->config().thumbnailHighlightDurationMs);

    PageStateStore* store = m_navigation->pageState();
    m_model->setPageState(store);
    connect(store, &PageStateStore::currentFileChanged, this,
            [this](const FileKey& fileKey, const QString&) {
        setFileKey(fileKey);
    });

    // Registered under our own source id: our own clicks do not echo back
    m_navigation->eventBus()->subscribe(NavigationSource::Thumbnails,
                                        [this](const PageChangedEvent& event) {
        onPageChanged(event);
    });

    setFileKey(store->currentFile());
}

void ThumbnailRail::unbindNavigation()
{
    if (!m_navigation) {
        return;
    }
    m_navigation->eventBus()->unsubscribe(NavigationSource::Thumbnails);
    disconnect(m_navigation->pageState(), nullptr, this, nullptr);
    m_navigation = nullptr;
}

void ThumbnailRail::setFileKey(const FileKey& fileKey)
{
    if (fileKey == m_model->fileKey()) {
        return;
    }
    m_pulseTimer->stop();
    m_model->setFileKey(fileKey);
    updateThumbnailWidth();
    scrollToCurrentPage();
}

FileKey ThumbnailRail::fileKey() const
{
    return m_model->fileKey();
}

// ============================================================================
// Navigation
// ============================================================================

bool ThumbnailRail::requestPage(int pageNumber)
{
    const FileKey fileKey = m_model->fileKey();
    if (!m_navigation || fileKey.isEmpty()) {
        return false;
    }

    const bool accepted = m_navigation->navigateToPage(pageNumber, fileKey, ScrollOptions(),
                                                       NavigationSource::Thumbnails);
    if (accepted) {
        m_model->setCurrentPage(m_navigation->pageState()->currentPage(fileKey));
    }
    emit pageRequested(fileKey, pageNumber, accepted);
    return accepted;
}

void ThumbnailRail::onItemClicked(const QModelIndex& index)
{
    if (!index.isValid()) {
        return;
    }
    requestPage(index.data(PageThumbnailModel::PageNumberRole).toInt());
}

void ThumbnailRail::onPageChanged(const PageChangedEvent& event)
{
    if (event.fileKey != m_model->fileKey()) {
        if (!m_navigation || m_navigation->pageState()->currentFile() != event.fileKey) {
            return;
        }
        setFileKey(event.fileKey);
    }

    m_model->setCurrentPage(event.pageNumber);
    scrollToCurrentPage();
    pulse(event.pageNumber);
}

void ThumbnailRail::pulse(int pageNumber)
{
    m_model->setHighlightedPage(pageNumber);
    m_pulseTimer->start();
}

bool ThumbnailRail::isPulsing() const
{
    return m_pulseTimer->isActive();
}

void ThumbnailRail::scrollToCurrentPage()
{
    const QModelIndex index = m_model->indexForPage(m_model->currentPage());
    if (!index.isValid()) {
        return;
    }

    // Only scroll if the item is not already in view
    const QRect itemRect = m_listView->visualRect(index);
    if (!m_listView->viewport()->rect().contains(itemRect)) {
        m_listView->scrollTo(index, QAbstractItemView::PositionAtCenter);
    }
}

// ============================================================================
// Appearance
// ============================================================================

void ThumbnailRail::setDarkMode(bool dark)
{
    if (m_darkMode == dark) {
        return;
    }
    m_darkMode = dark;
    applyTheme();
}

void ThumbnailRail::applyTheme()
{
    m_delegate->setDarkMode(m_darkMode);

    QPalette pal = m_listView->palette();
    pal.setColor(QPalette::Base, ThemeColors::background(m_darkMode));
    pal.setColor(QPalette::Text, ThemeColors::textPrimary(m_darkMode));
    m_listView->setPalette(pal);
    m_listView->viewport()->update();
}

void ThumbnailRail::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    updateThumbnailWidth();
}

void ThumbnailRail::updateThumbnailWidth()
{
    const int available = m_listView->viewport()->width() - 2 * THUMBNAIL_PADDING;
    const int width = qMax(MIN_THUMBNAIL_WIDTH, available);
    if (width == m_delegate->thumbnailWidth()) {
        return;
    }
    m_delegate->setThumbnailWidth(width);

    // Item size hints changed
    m_listView->doItemsLayout();
}
