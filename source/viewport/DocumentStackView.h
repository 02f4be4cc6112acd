// ============================================================================
// DocumentStackView - Scroll area stacking every loaded file's pages
// ============================================================================
// Content layout:
//
//   content widget
//   +-- section "file:<A>"   (header label + PageWidget 1..N)
//   +-- section "file:<B>"
//   ...
//
// The view registers itself with a ViewportNavigation: files added here are
// loaded into the page state, pages report render completion, and removing
// a file unloads it.
// ============================================================================

#pragma once

#include "../core/NavigationTypes.h"

#include <QScrollArea>
#include <QHash>
#include <QPointer>
#include <QVector>

class QVBoxLayout;
class PageWidget;
class ViewportNavigation;

class DocumentStackView : public QScrollArea {
    Q_OBJECT

public:
    explicit DocumentStackView(QWidget* parent = nullptr);
    ~DocumentStackView() override;

    /**
     * @brief Bind to a navigation service (not owned).
     *
     * Attaches this scroll area as the navigation viewport and loads every
     * file already in the view.
     */
    void setNavigation(ViewportNavigation* navigation);
    ViewportNavigation* navigation() const;

    // =========================================================================
    // Files
    // =========================================================================

    /**
     * @brief Append a file section with pageCount pages.
     * @return False if the key is empty, already present, or pageCount < 1.
     */
    bool addFile(const FileKey& fileKey, int pageCount, const QString& title = QString());
    void removeFile(const FileKey& fileKey);

    QVector<FileKey> files() const { return m_fileOrder; }
    int pageCount(const FileKey& fileKey) const;

    QWidget* fileSection(const FileKey& fileKey) const;
    PageWidget* pageWidget(const FileKey& fileKey, int pageNumber) const;

    void setDarkMode(bool dark);

signals:
    void fileAdded(const FileKey& fileKey, int pageCount);
    void fileRemoved(const FileKey& fileKey);
    void pageRendered(const FileKey& fileKey, int pageNumber);

private:
    struct FileSection {
        QPointer<QWidget> section;
        QVector<PageWidget*> pages;
    };

    void onPageRendered(const FileKey& fileKey, int pageNumber);

    QPointer<ViewportNavigation> m_navigation;

    QWidget* m_content = nullptr;
    QVBoxLayout* m_contentLayout = nullptr;

    QHash<FileKey, FileSection> m_sections;
    QVector<FileKey> m_fileOrder;
    bool m_darkMode = false;

    static constexpr int PAGE_SPACING = 16;
    static constexpr int FILE_SPACING = 32;
    static constexpr int CONTENT_MARGIN = 24;
};
