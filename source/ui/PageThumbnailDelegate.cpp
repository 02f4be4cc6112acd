#include "PageThumbnailDelegate.h"
#include "PageThumbnailModel.h"
#include "ThemeColors.h"

#include <QPainter>
#include <QPainterPath>

// ============================================================================
// Constructor
// ============================================================================

PageThumbnailDelegate::PageThumbnailDelegate(QObject* parent)
    : QStyledItemDelegate(parent)
{
}

// ============================================================================
// Size Hint
// ============================================================================

QSize PageThumbnailDelegate::sizeHint(const QStyleOptionViewItem& option,
                                       const QModelIndex& index) const
{
    Q_UNUSED(option);

    const qreal aspectRatio = index.data(PageThumbnailModel::PageAspectRatioRole).toReal();
    const QRect thumbRect = thumbnailRect(QRect(0, 0, m_thumbnailWidth, 0), aspectRatio);

    // Total item height: padding + thumbnail + spacing + page number + padding
    const int totalHeight = VERTICAL_PADDING + thumbRect.height() + ITEM_SPACING +
                            PAGE_NUMBER_HEIGHT + VERTICAL_PADDING;
    const int totalWidth = HORIZONTAL_PADDING + m_thumbnailWidth + HORIZONTAL_PADDING;

    return QSize(totalWidth, totalHeight);
}

// ============================================================================
// Paint
// ============================================================================

void PageThumbnailDelegate::paint(QPainter* painter, const QStyleOptionViewItem& option,
                                   const QModelIndex& index) const
{
    painter->save();
    painter->setRenderHint(QPainter::Antialiasing, true);
    painter->setRenderHint(QPainter::TextAntialiasing, true);

    const int pageNumber = index.data(PageThumbnailModel::PageNumberRole).toInt();
    const bool isCurrentPage = index.data(PageThumbnailModel::IsCurrentPageRole).toBool();
    const bool isActivePage = index.data(PageThumbnailModel::IsActivePageRole).toBool();
    const bool isHighlighted = index.data(PageThumbnailModel::IsHighlightedRole).toBool();
    const qreal aspectRatio = index.data(PageThumbnailModel::PageAspectRatioRole).toReal();

    const bool isSelected = option.state & QStyle::State_Selected;
    const bool isHovered = option.state & QStyle::State_MouseOver;

    const QRect thumbRect = thumbnailRect(option.rect, aspectRatio);
    const QRect pageNumRect(option.rect.left(), thumbRect.bottom() + ITEM_SPACING,
                            option.rect.width(), PAGE_NUMBER_HEIGHT);

    // 1. Selection/hover background
    if (isSelected) {
        painter->fillRect(option.rect, ThemeColors::itemSelected(m_darkMode));
    } else if (isHovered) {
        painter->fillRect(option.rect, ThemeColors::itemHover(m_darkMode));
    }

    // 2. Page placeholder
    drawPlaceholder(painter, thumbRect, pageNumber);

    // 3. Border / highlight
    drawBorder(painter, thumbRect, isCurrentPage, isHighlighted);

    // 4. Active page marker
    if (isActivePage) {
        drawActiveIndicator(painter, thumbRect);
    }

    // 5. Caption
    painter->setPen(ThemeColors::textMuted(m_darkMode));
    QFont font = option.font;
    font.setPixelSize(12);
    painter->setFont(font);
    painter->drawText(pageNumRect, Qt::AlignHCenter | Qt::AlignTop, tr("Page %1").arg(pageNumber));

    painter->restore();
}

// ============================================================================
// Settings
// ============================================================================

void PageThumbnailDelegate::setThumbnailWidth(int width)
{
    if (width > 0) {
        m_thumbnailWidth = width;
    }
}

void PageThumbnailDelegate::setDarkMode(bool dark)
{
    m_darkMode = dark;
}

// ============================================================================
// Private Helpers
// ============================================================================

QRect PageThumbnailDelegate::thumbnailRect(const QRect& itemRect, qreal aspectRatio) const
{
    if (aspectRatio <= 0.0) {
        aspectRatio = 1.294;
    }
    const int thumbHeight = static_cast<int>(m_thumbnailWidth * aspectRatio);

    // Centered horizontally in the item
    const int thumbX = itemRect.left() + (itemRect.width() - m_thumbnailWidth) / 2;
    const int thumbY = itemRect.top() + VERTICAL_PADDING;

    return QRect(thumbX, thumbY, m_thumbnailWidth, thumbHeight);
}

void PageThumbnailDelegate::drawPlaceholder(QPainter* painter, const QRect& thumbRect,
                                             int pageNumber) const
{
    QPainterPath path;
    path.addRoundedRect(thumbRect, BORDER_RADIUS, BORDER_RADIUS);
    painter->fillPath(path, ThemeColors::paper(m_darkMode));

    QFont font = painter->font();
    font.setPixelSize(qMax(10, thumbRect.height() / 6));
    painter->setFont(font);
    painter->setPen(ThemeColors::border(m_darkMode));
    painter->drawText(thumbRect, Qt::AlignCenter, QString::number(pageNumber));
}

void PageThumbnailDelegate::drawBorder(QPainter* painter, const QRect& thumbRect,
                                        bool isCurrentPage, bool isHighlighted) const
{
    int borderWidth = BORDER_WIDTH_NORMAL;
    QColor borderColor = ThemeColors::border(m_darkMode);
    if (isHighlighted) {
        borderWidth = BORDER_WIDTH_HIGHLIGHT;
        borderColor = ThemeColors::navigationGlow(m_darkMode);
    } else if (isCurrentPage) {
        borderWidth = BORDER_WIDTH_CURRENT;
        borderColor = ThemeColors::selectionBorder(m_darkMode);
    }

    QPen pen(borderColor);
    pen.setWidth(borderWidth);
    painter->setPen(pen);
    painter->setBrush(Qt::NoBrush);

    // Inset rect by half border width for proper drawing
    const qreal inset = borderWidth / 2.0;
    const QRectF borderRect = QRectF(thumbRect).adjusted(inset, inset, -inset, -inset);
    painter->drawRoundedRect(borderRect, BORDER_RADIUS, BORDER_RADIUS);
}

void PageThumbnailDelegate::drawActiveIndicator(QPainter* painter, const QRect& thumbRect) const
{
    painter->setPen(Qt::NoPen);
    painter->setBrush(ThemeColors::selectionBorder(m_darkMode));
    const QPoint center(thumbRect.right() - ACTIVE_DOT_SIZE, thumbRect.top() + ACTIVE_DOT_SIZE);
    painter->drawEllipse(center, ACTIVE_DOT_SIZE / 2, ACTIVE_DOT_SIZE / 2);
}
