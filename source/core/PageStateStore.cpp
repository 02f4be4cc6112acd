#include "PageStateStore.h"
#include "NavigationEventBus.h"
#include "NavigationConfig.h"

#include <QTimer>
#include <QDebug>
#include <utility>

// ============================================================================
// Constructor / Destructor
// ============================================================================

PageStateStore::PageStateStore(NavigationEventBus* bus, QObject* parent)
    : QObject(parent)
    , m_bus(bus)
    , m_fileChangeTimer(new QTimer(this))
{
    m_fileChangeTimer->setSingleShot(true);
    m_fileChangeTimer->setInterval(NavigationConfig().fileChangeSuppressionMs);
    connect(m_fileChangeTimer, &QTimer::timeout, this, [this]() {
        setFileChanging(false);
    });
}

PageStateStore::~PageStateStore()
{
}

void PageStateStore::setConfig(const NavigationConfig& config)
{
    m_fileChangeTimer->setInterval(config.fileChangeSuppressionMs);
}

void PageStateStore::setNavigationActiveCheck(SuppressionCheck check)
{
    m_navigationActive = std::move(check);
}

// ============================================================================
// File Lifecycle
// ============================================================================

bool PageStateStore::addFile(const FileKey& fileKey, int totalPages)
{
    if (fileKey.isEmpty()) {
        qWarning() << "PageStateStore::addFile: empty file key";
        return false;
    }

    if (m_states.contains(fileKey)) {
        setTotalPages(fileKey, totalPages);
        return true;
    }

    FileNavigationState state;
    state.fileKey = fileKey;
    state.totalPages = qMax(0, totalPages);
    state.currentPage = state.totalPages > 0 ? 1 : 0;
    state.activePage = state.currentPage;

    m_states.insert(fileKey, state);
    m_fileOrder.append(fileKey);
    emit fileAdded(fileKey);

    if (m_currentFile.isEmpty()) {
        setCurrentFile(fileKey, NavigationSource::FileList);
    }
    return true;
}

void PageStateStore::removeFile(const FileKey& fileKey)
{
    if (!m_states.remove(fileKey)) {
        return;
    }
    m_fileOrder.removeAll(fileKey);
    m_scrollCache.remove(fileKey);
    emit fileRemoved(fileKey);

    if (m_currentFile == fileKey) {
        m_currentFile.clear();
        if (!m_fileOrder.isEmpty()) {
            setCurrentFile(m_fileOrder.first(), NavigationSource::FileList);
        } else {
            emit currentFileChanged(FileKey(), NavigationSource::FileList);
        }
    }
}

void PageStateStore::setTotalPages(const FileKey& fileKey, int totalPages)
{
    auto it = m_states.find(fileKey);
    if (it == m_states.end()) {
        return;
    }

    FileNavigationState& state = it.value();
    state.totalPages = qMax(0, totalPages);

    const int current = clampPage(fileKey, state.currentPage);
    const int active = clampPage(fileKey, state.activePage);
    if (current != state.currentPage) {
        state.currentPage = current;
        emit currentPageChanged(fileKey, current, NavigationSource::FileList);
    }
    if (active != state.activePage) {
        state.activePage = active;
        emit activePageChanged(fileKey, active);
    }
}

// ============================================================================
// Queries
// ============================================================================

FileNavigationState PageStateStore::state(const FileKey& fileKey) const
{
    return m_states.value(fileKey);
}

int PageStateStore::currentPage(const FileKey& fileKey) const
{
    return m_states.value(fileKey).currentPage;
}

int PageStateStore::activePage(const FileKey& fileKey) const
{
    return m_states.value(fileKey).activePage;
}

int PageStateStore::totalPages(const FileKey& fileKey) const
{
    return m_states.value(fileKey).totalPages;
}

int PageStateStore::clampPage(const FileKey& fileKey, int pageNumber) const
{
    const int total = totalPages(fileKey);
    if (total <= 0) {
        return 0;
    }
    return qBound(1, pageNumber, total);
}

// ============================================================================
// Mutations
// ============================================================================

void PageStateStore::setCurrentFile(const FileKey& fileKey, const QString& source)
{
    if (m_currentFile == fileKey || !m_states.contains(fileKey)) {
        return;
    }
    if (!m_currentFile.isEmpty()) {
        m_scrollCache.save(m_currentFile, m_states.value(m_currentFile).lastScrollOffset);
    }
    m_currentFile = fileKey;
    emit currentFileChanged(fileKey, source);
}

bool PageStateStore::activateFile(const FileKey& fileKey, const QString& source)
{
    if (!m_states.contains(fileKey)) {
        qWarning() << "PageStateStore::activateFile: unknown file" << fileKey;
        return false;
    }

    setFileChanging(true);
    setCurrentFile(fileKey, source);

    if (m_scrollCache.contains(fileKey)) {
        emit scrollOffsetRestoreRequested(fileKey, m_scrollCache.offset(fileKey));
    }
    return true;
}

bool PageStateStore::setCurrentPage(const FileKey& fileKey, int pageNumber, const QString& source)
{
    auto it = m_states.find(fileKey);
    if (it == m_states.end()) {
        return false;
    }

    const int page = clampPage(fileKey, pageNumber);
    if (it->currentPage == page) {
        return true;
    }
    it->currentPage = page;
    emit currentPageChanged(fileKey, page, source);
    return true;
}

bool PageStateStore::setActivePage(const FileKey& fileKey, int pageNumber)
{
    auto it = m_states.find(fileKey);
    if (it == m_states.end()) {
        return false;
    }

    const int page = clampPage(fileKey, pageNumber);
    if (it->activePage == page) {
        return true;
    }
    it->activePage = page;
    emit activePageChanged(fileKey, page);
    return true;
}

// ============================================================================
// Passive Visibility
// ============================================================================

bool PageStateStore::passiveUpdatesSuppressed() const
{
    return m_fileChanging || (m_navigationActive && m_navigationActive());
}

void PageStateStore::handleDominantPage(const FileKey& fileKey, int pageNumber, qreal ratio)
{
    if (!m_states.contains(fileKey)) {
        return;
    }

    if (passiveUpdatesSuppressed()) {
#ifdef SYNCVIEW_DEBUG
        qDebug() << "PageStateStore::handleDominantPage: suppressed" << fileKey << pageNumber;
#endif
        return;
    }

    if (fileKey != m_currentFile) {
        qDebug() << "PageStateStore::handleDominantPage: promoting" << fileKey
                 << "to current file (page" << pageNumber << "at" << ratio << ")";
        setCurrentFile(fileKey, NavigationSource::Visibility);
    }

    const int previous = activePage(fileKey);
    setActivePage(fileKey, pageNumber);

    if (m_bus && previous != activePage(fileKey)) {
        m_bus->publishPageChanged(fileKey, activePage(fileKey), NavigationSource::Visibility);
    }
}

// ============================================================================
// File-Change Suppression
// ============================================================================

void PageStateStore::setFileChanging(bool changing)
{
    if (changing) {
        // Restart the safety net on every raise
        m_fileChangeTimer->start();
    } else {
        m_fileChangeTimer->stop();
    }

    if (m_fileChanging == changing) {
        return;
    }
    m_fileChanging = changing;
    emit fileChangingChanged(changing);
}

// ============================================================================
// Scroll Offsets
// ============================================================================

void PageStateStore::recordScrollOffset(const FileKey& fileKey, qreal offset)
{
    auto it = m_states.find(fileKey);
    if (it == m_states.end()) {
        return;
    }
    it->lastScrollOffset = qMax<qreal>(0.0, offset);
}

qreal PageStateStore::savedScrollOffset(const FileKey& fileKey, qreal fallback) const
{
    return m_scrollCache.offset(fileKey, fallback);
}
