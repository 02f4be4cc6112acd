// ============================================================================
// PageWidget - Render target for one page of one file
// ============================================================================
// PageWidget is what navigation scrolls to and what visibility tracking
// measures. It carries:
// - the composite object name "page:<fileKey>:<pageNumber>"
// - the fileKey / pageNumber dynamic properties
// - the navigationActive / justActivated markers set by navigation
//
// Page content rasterization is out of scope; the widget paints a paper
// placeholder with the page number and the navigation markers.
//
// DocumentStackView creates one PageWidget per page.
// ============================================================================

#pragma once

#include "../core/NavigationTypes.h"
#include <QWidget>

class PageWidget : public QWidget {
    Q_OBJECT

public:
    // US Letter at 72 dpi
    static constexpr int DEFAULT_PAGE_WIDTH = 612;
    static constexpr int DEFAULT_PAGE_HEIGHT = 792;

    PageWidget(const FileKey& fileKey, int pageNumber, QWidget* parent = nullptr);
    ~PageWidget() override;

    FileKey fileKey() const { return m_fileKey; }
    int pageNumber() const { return m_pageNumber; }

    // ===== Geometry =====

    /**
     * @brief Set the page size in pixels (fixed).
     */
    void setPageSize(const QSize& size);
    QSize pageSize() const { return m_pageSize; }

    QSize sizeHint() const override { return m_pageSize; }

    // ===== Render State =====

    /**
     * @brief Whether the page has painted at least once.
     */
    bool isRendered() const { return m_rendered; }

    /**
     * @brief Mark the page as rendered and announce it (once).
     *
     * Called automatically after the first paint.
     */
    void markRendered();

    // ===== Navigation Markers =====

    bool isNavigationActive() const;
    bool isJustActivated() const;

    void setDarkMode(bool dark);

signals:
    /**
     * @brief The page became paintable for the first time.
     */
    void renderCompleted(const FileKey& fileKey, int pageNumber);

protected:
    void paintEvent(QPaintEvent* event) override;

private:
    FileKey m_fileKey;
    int m_pageNumber = 0;
    QSize m_pageSize;
    bool m_rendered = false;
    bool m_renderAnnounced = false;
    bool m_darkMode = false;

    static constexpr int ACTIVE_BORDER_WIDTH = 3;
    static constexpr int GLOW_BORDER_WIDTH = 6;
};
