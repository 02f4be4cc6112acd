// ============================================================================
// PageWidget - Implementation
// ============================================================================

#include "PageWidget.h"
#include "../core/ElementLocator.h"
#include "../ui/ThemeColors.h"

#include <QPainter>
#include <QPaintEvent>
#include <QTimer>

PageWidget::PageWidget(const FileKey& fileKey, int pageNumber, QWidget* parent)
    : QWidget(parent)
    , m_fileKey(fileKey)
    , m_pageNumber(pageNumber)
    , m_pageSize(DEFAULT_PAGE_WIDTH, DEFAULT_PAGE_HEIGHT)
{
    // Identity used by ElementLocator strategies and VisibilityTracker::rebuildAll()
    setObjectName(ElementLocator::pageObjectName(fileKey, pageNumber));
    setProperty(PageTargetProperty::FileKey, fileKey);
    setProperty(PageTargetProperty::PageNumber, pageNumber);

    setAttribute(Qt::WA_OpaquePaintEvent, true);
    setFixedSize(m_pageSize);
}

PageWidget::~PageWidget()
{
}

void PageWidget::setPageSize(const QSize& size)
{
    if (size.isEmpty() || size == m_pageSize) {
        return;
    }
    m_pageSize = size;
    setFixedSize(size);
    updateGeometry();
}

void PageWidget::markRendered()
{
    m_rendered = true;
    if (m_renderAnnounced) {
        return;
    }
    m_renderAnnounced = true;

    // Never let a listener scroll the view from inside a paint event
    QTimer::singleShot(0, this, [this]() {
        emit renderCompleted(m_fileKey, m_pageNumber);
    });
}

bool PageWidget::isNavigationActive() const
{
    return property(PageTargetProperty::Active).toBool();
}

bool PageWidget::isJustActivated() const
{
    return property(PageTargetProperty::JustActivated).toBool();
}

void PageWidget::setDarkMode(bool dark)
{
    if (m_darkMode == dark) {
        return;
    }
    m_darkMode = dark;
    update();
}

void PageWidget::paintEvent(QPaintEvent* event)
{
    QPainter painter(this);
    painter.fillRect(event->rect(), ThemeColors::paper(m_darkMode));

    // Page number, centered
    QFont font = painter.font();
    font.setPixelSize(qMax(12, height() / 12));
    painter.setFont(font);
    painter.setPen(ThemeColors::textMuted(m_darkMode));
    painter.drawText(rect(), Qt::AlignCenter, QString::number(m_pageNumber));

    // Navigation markers
    if (isJustActivated()) {
        QPen glow(ThemeColors::navigationGlow(m_darkMode));
        glow.setWidth(GLOW_BORDER_WIDTH);
        painter.setPen(glow);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(rect().adjusted(GLOW_BORDER_WIDTH / 2, GLOW_BORDER_WIDTH / 2,
                                         -GLOW_BORDER_WIDTH / 2, -GLOW_BORDER_WIDTH / 2));
    } else if (isNavigationActive()) {
        QPen pen(ThemeColors::selectionBorder(m_darkMode));
        pen.setWidth(ACTIVE_BORDER_WIDTH);
        painter.setPen(pen);
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(rect().adjusted(1, 1, -2, -2));
    } else {
        painter.setPen(ThemeColors::border(m_darkMode));
        painter.drawRect(rect().adjusted(0, 0, -1, -1));
    }

    if (!m_rendered) {
        markRendered();
    }
}
