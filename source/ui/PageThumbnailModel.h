#ifndef PAGETHUMBNAILMODEL_H
#define PAGETHUMBNAILMODEL_H

#include "../core/NavigationTypes.h"

#include <QAbstractListModel>
#include <QPointer>

class PageStateStore;

/**
 * @brief QAbstractListModel listing the pages of one file for QListView.
 *
 * This model provides:
 * - Page number, current/active/highlighted state per row
 * - Page count taken from the PageStateStore
 * - Active page tracking from the store's activePageChanged signal
 *
 * The current page and the highlight pulse are set by ThumbnailRail, which
 * follows page-changed broadcasts.
 */
class PageThumbnailModel : public QAbstractListModel {
    Q_OBJECT

public:
    /**
     * @brief Custom roles for page data.
     */
    enum Roles {
        PageNumberRole = Qt::UserRole + 1,  ///< Page number (1-based)
        FileKeyRole,                        ///< FileKey of the page
        IsCurrentPageRole,                  ///< bool: last navigated-to page
        IsActivePageRole,                   ///< bool: most visible page
        IsHighlightedRole,                  ///< bool: pulse after an external page change
        PageAspectRatioRole                 ///< qreal: page height/width ratio
    };

    explicit PageThumbnailModel(QObject* parent = nullptr);
    ~PageThumbnailModel() override;

    // ===== QAbstractListModel Interface =====

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    Qt::ItemFlags flags(const QModelIndex& index) const override;
    QHash<int, QByteArray> roleNames() const override;

    // ===== Binding =====

    /**
     * @brief Set the page state to read page counts from.
     * @param store PageStateStore pointer (not owned).
     */
    void setPageState(PageStateStore* store);

    /**
     * @brief Show the pages of a file.
     *
     * Resets the model. The current page is taken from the store.
     */
    void setFileKey(const FileKey& fileKey);
    FileKey fileKey() const { return m_fileKey; }

    // ===== Page Markers =====

    /**
     * @brief Set the current page (for the thick border).
     * @param pageNumber 1-based page number, 0 for none.
     */
    void setCurrentPage(int pageNumber);
    int currentPage() const { return m_currentPage; }

    int activePage() const { return m_activePage; }

    /**
     * @brief Set the page drawn with the highlight pulse.
     * @param pageNumber 1-based page number, 0 to clear.
     */
    void setHighlightedPage(int pageNumber);
    int highlightedPage() const { return m_highlightedPage; }

    QModelIndex indexForPage(int pageNumber) const;

    void setPageAspectRatio(qreal ratio);

public slots:
    /**
     * @brief Re-read the page count of the bound file.
     */
    void onPageCountChanged();

private slots:
    void onActivePageChanged(const FileKey& fileKey, int pageNumber);
    void onFileRemoved(const FileKey& fileKey);

private:
    void emitRowChanged(int pageNumber, const QVector<int>& roles);

    QPointer<PageStateStore> m_store;
    FileKey m_fileKey;
    int m_pageCount = 0;

    int m_currentPage = 0;
    int m_activePage = 0;
    int m_highlightedPage = 0;

    qreal m_pageAspectRatio = 1.294;  // US Letter
};

#endif // PAGETHUMBNAILMODEL_H
