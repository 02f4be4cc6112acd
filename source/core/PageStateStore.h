#pragma once

// ============================================================================
// PageStateStore - Per-file current/active page state
// ============================================================================
// The single place every consumer reads currentPage / activePage /
// totalPages from. Entries exist from file load to file unload.
//
// Authority:
// - NavigationCoordinator owns currentPage (deliberate navigation)
// - VisibilityTracker owns activePage (observed visibility)
// ============================================================================

#include "NavigationTypes.h"
#include "ScrollPositionCache.h"

#include <QObject>
#include <QHash>
#include <QVector>

class QTimer;
class NavigationEventBus;
struct NavigationConfig;

class PageStateStore : public QObject {
    Q_OBJECT

public:
    using SuppressionCheck = std::function<bool()>;

    /**
     * @param bus Event bus for visibility-driven page broadcasts (not owned, may be null).
     */
    explicit PageStateStore(NavigationEventBus* bus, QObject* parent = nullptr);
    ~PageStateStore() override;

    void setConfig(const NavigationConfig& config);

    /**
     * @brief Predicate reporting whether a deliberate navigation is running.
     *
     * Passive, visibility-driven updates are ignored while it returns true.
     */
    void setNavigationActiveCheck(SuppressionCheck check);

    // =========================================================================
    // File Lifecycle
    // =========================================================================

    /**
     * @brief Create the navigation state for a loaded file.
     * @return False if the key is empty.
     *
     * Re-adding a known file only updates its page count. The first file
     * added becomes the current file.
     */
    bool addFile(const FileKey& fileKey, int totalPages);

    /**
     * @brief Drop all state for an unloaded file.
     *
     * If it was the current file, the next remaining file becomes current.
     */
    void removeFile(const FileKey& fileKey);

    bool hasFile(const FileKey& fileKey) const { return m_states.contains(fileKey); }
    QVector<FileKey> files() const { return m_fileOrder; }

    void setTotalPages(const FileKey& fileKey, int totalPages);

    // =========================================================================
    // Queries
    // =========================================================================

    FileNavigationState state(const FileKey& fileKey) const;
    int currentPage(const FileKey& fileKey) const;
    int activePage(const FileKey& fileKey) const;
    int totalPages(const FileKey& fileKey) const;

    /**
     * @brief Clamp a page number into [1, totalPages] for a file.
     * @return Clamped page, or 0 if the file is unknown or has no pages.
     */
    int clampPage(const FileKey& fileKey, int pageNumber) const;

    FileKey currentFile() const { return m_currentFile; }

    // =========================================================================
    // Mutations
    // =========================================================================

    /**
     * @brief Make a file current without scrolling.
     *
     * The outgoing file's last recorded offset is saved so a later
     * activateFile() can return to it.
     */
    void setCurrentFile(const FileKey& fileKey, const QString& source);

    /**
     * @brief Deliberately switch to a file.
     * @return False if the file is unknown.
     *
     * Raises the file-changing suppression flag, makes the file current and
     * requests restoration of its cached scroll offset.
     */
    bool activateFile(const FileKey& fileKey, const QString& source = NavigationSource::FileList);

    /**
     * @brief Set the explicitly requested page (clamped).
     * @return False if the file is unknown.
     */
    bool setCurrentPage(const FileKey& fileKey, int pageNumber, const QString& source);

    /**
     * @brief Set the page judged most visible (clamped).
     * @return False if the file is unknown.
     */
    bool setActivePage(const FileKey& fileKey, int pageNumber);

    // =========================================================================
    // Passive Visibility
    // =========================================================================

    /**
     * @brief React to a confirmed dominant page.
     *
     * Updates activePage and broadcasts a visibility-sourced page change. If
     * the page belongs to another file, that file is promoted to current
     * after the outgoing file's scroll offset is saved. Ignored while a
     * navigation or a deliberate file switch is in progress.
     */
    void handleDominantPage(const FileKey& fileKey, int pageNumber, qreal ratio);

    bool passiveUpdatesSuppressed() const;

    // =========================================================================
    // File-Change Suppression
    // =========================================================================

    /**
     * @brief Flag a deliberate programmatic file switch.
     *
     * Auto-clears after the configured safety delay.
     */
    void setFileChanging(bool changing);
    bool isFileChanging() const { return m_fileChanging; }

    // =========================================================================
    // Scroll Offsets
    // =========================================================================

    void recordScrollOffset(const FileKey& fileKey, qreal offset);
    bool hasSavedScrollOffset(const FileKey& fileKey) const { return m_scrollCache.contains(fileKey); }
    qreal savedScrollOffset(const FileKey& fileKey, qreal fallback = 0.0) const;

signals:
    void fileAdded(const FileKey& fileKey);
    void fileRemoved(const FileKey& fileKey);
    void currentFileChanged(const FileKey& fileKey, const QString& source);
    void currentPageChanged(const FileKey& fileKey, int pageNumber, const QString& source);
    void activePageChanged(const FileKey& fileKey, int pageNumber);
    void fileChangingChanged(bool changing);

    /**
     * @brief The view should scroll back to a file's remembered offset.
     */
    void scrollOffsetRestoreRequested(const FileKey& fileKey, qreal offset);

private:
    NavigationEventBus* m_bus = nullptr;
    SuppressionCheck m_navigationActive;

    QHash<FileKey, FileNavigationState> m_states;
    QVector<FileKey> m_fileOrder;
    FileKey m_currentFile;

    ScrollPositionCache m_scrollCache;

    bool m_fileChanging = false;
    QTimer* m_fileChangeTimer = nullptr;
};
