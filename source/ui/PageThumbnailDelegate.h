#ifndef PAGETHUMBNAILDELEGATE_H
#define PAGETHUMBNAILDELEGATE_H

#include <QStyledItemDelegate>
#include <QColor>

/**
 * @brief Custom delegate for rendering page thumbnails in QListView.
 *
 * Renders each item as:
 * 1. Paper placeholder with the page number in the middle
 * 2. Border (thin neutral, thick accent for the current page)
 * 3. Glow while the page is highlighted after an external page change
 * 4. Small dot marking the most visible (active) page
 * 5. "Page N" caption below
 */
class PageThumbnailDelegate : public QStyledItemDelegate {
    Q_OBJECT

public:
    explicit PageThumbnailDelegate(QObject* parent = nullptr);

    void paint(QPainter* painter, const QStyleOptionViewItem& option,
               const QModelIndex& index) const override;

    QSize sizeHint(const QStyleOptionViewItem& option,
                   const QModelIndex& index) const override;

    /**
     * @brief Set the thumbnail width.
     * @param width Thumbnail width in pixels.
     */
    void setThumbnailWidth(int width);
    int thumbnailWidth() const { return m_thumbnailWidth; }

    void setDarkMode(bool dark);
    bool isDarkMode() const { return m_darkMode; }

private:
    QRect thumbnailRect(const QRect& itemRect, qreal aspectRatio) const;

    void drawPlaceholder(QPainter* painter, const QRect& thumbRect, int pageNumber) const;
    void drawBorder(QPainter* painter, const QRect& thumbRect,
                    bool isCurrentPage, bool isHighlighted) const;
    void drawActiveIndicator(QPainter* painter, const QRect& thumbRect) const;

    int m_thumbnailWidth = 120;
    bool m_darkMode = false;

    // Visual constants
    static constexpr int VERTICAL_PADDING = 8;
    static constexpr int HORIZONTAL_PADDING = 8;
    static constexpr int BORDER_RADIUS = 4;
    static constexpr int BORDER_WIDTH_NORMAL = 1;
    static constexpr int BORDER_WIDTH_CURRENT = 3;
    static constexpr int BORDER_WIDTH_HIGHLIGHT = 5;
    static constexpr int ACTIVE_DOT_SIZE = 8;
    static constexpr int PAGE_NUMBER_HEIGHT = 24;
    static constexpr int ITEM_SPACING = 8;
};

#endif // PAGETHUMBNAILDELEGATE_H
