#ifndef THUMBNAILRAIL_H
#define THUMBNAILRAIL_H

#include "../../core/NavigationTypes.h"

#include <QWidget>
#include <QPointer>

class QListView;
class QModelIndex;
class QTimer;
class PageThumbnailModel;
class PageThumbnailDelegate;
class ViewportNavigation;

/**
 * @brief Thumbnail list of the current file's pages, kept in sync with navigation.
 *
 * Features:
 * - QListView with PageThumbnailModel and PageThumbnailDelegate
 * - Follows the current file of the PageStateStore
 * - Marks the current page from page-changed broadcasts, scrolls it into
 *   view and pulses its highlight (not for broadcasts it caused itself)
 * - Clicking a thumbnail requests navigation with source "thumbnails"
 * - Width-responsive thumbnail sizing
 *
 * Usage:
 * 1. MainWindow creates ThumbnailRail next to the DocumentStackView
 * 2. Call setNavigation() with the viewer's ViewportNavigation
 */
class ThumbnailRail : public QWidget {
    Q_OBJECT

public:
    explicit ThumbnailRail(QWidget* parent = nullptr);
    ~ThumbnailRail() override;

    // =========================================================================
    // Binding
    // =========================================================================

    /**
     * @brief Follow a navigation service (not owned).
     */
    void setNavigation(ViewportNavigation* navigation);

    /**
     * @brief Show the pages of a file.
     */
    void setFileKey(const FileKey& fileKey);
    FileKey fileKey() const;

    PageThumbnailModel* model() const { return m_model; }
    QListView* listView() const { return m_listView; }

    // =========================================================================
    // Navigation
    // =========================================================================

    /**
     * @brief Navigate the viewer to a page of the shown file.
     * @return True if the navigation request was accepted.
     */
    bool requestPage(int pageNumber);

    bool isPulsing() const;

    void setDarkMode(bool dark);

signals:
    /**
     * @brief Emitted when a thumbnail asked the viewer to navigate.
     */
    void pageRequested(const FileKey& fileKey, int pageNumber, bool accepted);

public slots:
    /**
     * @brief Scroll the list so the current page is visible.
     */
    void scrollToCurrentPage();

protected:
    void resizeEvent(QResizeEvent* event) override;

private slots:
    void onItemClicked(const QModelIndex& index);

private:
    void setupUI();
    void configureListView();
    void updateThumbnailWidth();
    void applyTheme();
    void unbindNavigation();

    void onPageChanged(const PageChangedEvent& event);
    void pulse(int pageNumber);

    // Widgets
    QListView* m_listView = nullptr;
    PageThumbnailModel* m_model = nullptr;
    PageThumbnailDelegate* m_delegate = nullptr;

    QPointer<ViewportNavigation> m_navigation;
    QTimer* m_pulseTimer = nullptr;
    bool m_darkMode = false;

    // Constants
    static constexpr int MIN_THUMBNAIL_WIDTH = 80;
    static constexpr int THUMBNAIL_PADDING = 16;  // Padding on each side
};

#endif // THUMBNAILRAIL_H
