#include "PageThumbnailModel.h"
#include "../core/PageStateStore.h"

// ============================================================================
// Constructor / Destructor
// ============================================================================

PageThumbnailModel::PageThumbnailModel(QObject* parent)
    : QAbstractListModel(parent)
{
}

PageThumbnailModel::~PageThumbnailModel()
{
}

// ============================================================================
// QAbstractListModel Interface
// ============================================================================

int PageThumbnailModel::rowCount(const QModelIndex& parent) const
{
    if (parent.isValid()) {
        return 0;  // No children for list model
    }
    return m_pageCount;
}

QVariant PageThumbnailModel::data(const QModelIndex& index, int role) const
{
    if (!index.isValid() || index.row() < 0 || index.row() >= m_pageCount) {
        return QVariant();
    }

    const int pageNumber = index.row() + 1;

    switch (role) {
        case Qt::DisplayRole:
            return QString::number(pageNumber);

        case PageNumberRole:
            return pageNumber;

        case FileKeyRole:
            return m_fileKey;

        case IsCurrentPageRole:
            return pageNumber == m_currentPage;

        case IsActivePageRole:
            return pageNumber == m_activePage;

        case IsHighlightedRole:
            return pageNumber == m_highlightedPage;

        case PageAspectRatioRole:
            return m_pageAspectRatio;

        default:
            return QVariant();
    }
}

Qt::ItemFlags PageThumbnailModel::flags(const QModelIndex& index) const
{
    Qt::ItemFlags defaultFlags = QAbstractListModel::flags(index);
    if (!index.isValid()) {
        return defaultFlags;
    }
    return defaultFlags | Qt::ItemIsEnabled | Qt::ItemIsSelectable;
}

QHash<int, QByteArray> PageThumbnailModel::roleNames() const
{
    QHash<int, QByteArray> roles = QAbstractListModel::roleNames();
    roles[PageNumberRole] = "pageNumber";
    roles[FileKeyRole] = "fileKey";
    roles[IsCurrentPageRole] = "isCurrentPage";
    roles[IsActivePageRole] = "isActivePage";
    roles[IsHighlightedRole] = "isHighlighted";
    roles[PageAspectRatioRole] = "pageAspectRatio";
    return roles;
}

// ============================================================================
// Binding
// ============================================================================

void PageThumbnailModel::setPageState(PageStateStore* store)
{
    if (m_store == store) {
        return;
    }
    if (m_store) {
        disconnect(m_store, nullptr, this, nullptr);
    }

    m_store = store;
    if (m_store) {
        connect(m_store, &PageStateStore::activePageChanged,
                this, &PageThumbnailModel::onActivePageChanged);
        connect(m_store, &PageStateStore::fileRemoved,
                this, &PageThumbnailModel::onFileRemoved);
    }
    setFileKey(m_fileKey);
}

void PageThumbnailModel::setFileKey(const FileKey& fileKey)
{
    beginResetModel();
    m_fileKey = fileKey;
    m_pageCount = m_store ? m_store->totalPages(fileKey) : 0;
    m_currentPage = m_store ? m_store->currentPage(fileKey) : 0;
    m_activePage = m_store ? m_store->activePage(fileKey) : 0;
    m_highlightedPage = 0;
    endResetModel();
}

void PageThumbnailModel::onPageCountChanged()
{
    const int count = m_store ? m_store->totalPages(m_fileKey) : 0;
    if (count == m_pageCount) {
        return;
    }

    if (count > m_pageCount) {
        beginInsertRows(QModelIndex(), m_pageCount, count - 1);
        m_pageCount = count;
        endInsertRows();
    } else {
        beginRemoveRows(QModelIndex(), count, m_pageCount - 1);
        m_pageCount = count;
        endRemoveRows();
    }
}

// ============================================================================
// Page Markers
// ============================================================================

void PageThumbnailModel::setCurrentPage(int pageNumber)
{
    if (m_currentPage == pageNumber) {
        return;
    }
    const int oldPage = m_currentPage;
    m_currentPage = pageNumber;

    emitRowChanged(oldPage, {IsCurrentPageRole});
    emitRowChanged(pageNumber, {IsCurrentPageRole});
}

void PageThumbnailModel::setHighlightedPage(int pageNumber)
{
    if (m_highlightedPage == pageNumber) {
        return;
    }
    const int oldPage = m_highlightedPage;
    m_highlightedPage = pageNumber;

    emitRowChanged(oldPage, {IsHighlightedRole});
    emitRowChanged(pageNumber, {IsHighlightedRole});
}

void PageThumbnailModel::onActivePageChanged(const FileKey& fileKey, int pageNumber)
{
    if (fileKey != m_fileKey || m_activePage == pageNumber) {
        return;
    }
    const int oldPage = m_activePage;
    m_activePage = pageNumber;

    emitRowChanged(oldPage, {IsActivePageRole});
    emitRowChanged(pageNumber, {IsActivePageRole});
}

void PageThumbnailModel::onFileRemoved(const FileKey& fileKey)
{
    if (fileKey == m_fileKey) {
        setFileKey(FileKey());
    }
}

QModelIndex PageThumbnailModel::indexForPage(int pageNumber) const
{
    if (pageNumber < 1 || pageNumber > m_pageCount) {
        return QModelIndex();
    }
    return index(pageNumber - 1, 0);
}

void PageThumbnailModel::setPageAspectRatio(qreal ratio)
{
    if (ratio <= 0.1 || ratio >= 10.0 || qFuzzyCompare(ratio, m_pageAspectRatio)) {
        return;
    }
    m_pageAspectRatio = ratio;
    if (m_pageCount > 0) {
        emit dataChanged(index(0, 0), index(m_pageCount - 1, 0), {PageAspectRatioRole});
    }
}

void PageThumbnailModel::emitRowChanged(int pageNumber, const QVector<int>& roles)
{
    const QModelIndex idx = indexForPage(pageNumber);
    if (idx.isValid()) {
        emit dataChanged(idx, idx, roles);
    }
}
