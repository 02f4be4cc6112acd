#include "VisibilityTracker.h"
#include "NavigationEventBus.h"
#include "NavigationConfig.h"

#include <QAbstractScrollArea>
#include <QScrollArea>
#include <QScrollBar>
#include <QTimer>
#include <QEvent>
#include <QDebug>
#include <utility>

// ============================================================================
// Constructor / Destructor
// ============================================================================

VisibilityTracker::VisibilityTracker(NavigationEventBus* bus, QObject* parent)
    : QObject(parent)
    , m_bus(bus)
    , m_refreshTimer(new QTimer(this))
{
    // Coalesce bursts of scroll/resize notifications into one pass
    m_refreshTimer->setSingleShot(true);
    m_refreshTimer->setInterval(0);
    connect(m_refreshTimer, &QTimer::timeout, this, &VisibilityTracker::refresh);
}

VisibilityTracker::~VisibilityTracker()
{
    if (m_area && m_area->viewport()) {
        m_area->viewport()->removeEventFilter(this);
    }
}

void VisibilityTracker::setConfig(const NavigationConfig& config)
{
    m_threshold = config.dominanceThreshold;
}

void VisibilityTracker::setSuppressionCheck(SuppressionCheck check)
{
    m_suppressed = std::move(check);
}

void VisibilityTracker::setScrollArea(QAbstractScrollArea* area)
{
    if (m_area == area) {
        return;
    }

    for (const QMetaObject::Connection& connection : std::as_const(m_areaConnections)) {
        disconnect(connection);
    }
    m_areaConnections.clear();
    if (m_area && m_area->viewport()) {
        m_area->viewport()->removeEventFilter(this);
    }

    m_area = area;
    m_unavailableReported = false;

    if (!m_area) {
        qWarning() << "VisibilityTracker::setScrollArea: no scroll area, passive page detection disabled";
        emit availabilityChanged(false);
        return;
    }

    m_area->viewport()->installEventFilter(this);
    m_areaConnections << connect(m_area->verticalScrollBar(), &QScrollBar::valueChanged,
                                 this, &VisibilityTracker::scheduleRefresh);
    m_areaConnections << connect(m_area->verticalScrollBar(), &QScrollBar::rangeChanged,
                                 this, &VisibilityTracker::scheduleRefresh);
    m_areaConnections << connect(m_area->horizontalScrollBar(), &QScrollBar::valueChanged,
                                 this, &VisibilityTracker::scheduleRefresh);

    emit availabilityChanged(true);
    scheduleRefresh();
}

// ============================================================================
// Observation
// ============================================================================

QString VisibilityTracker::observationKey(const FileKey& fileKey, int pageNumber)
{
    return fileKey + QLatin1Char('\n') + QString::number(pageNumber);
}

bool VisibilityTracker::observe(const FileKey& fileKey, int pageNumber, QWidget* target)
{
    if (!isAvailable()) {
        if (!m_unavailableReported) {
            qWarning() << "VisibilityTracker::observe: no scroll area, visibility of"
                       << fileKey << pageNumber << "will not be tracked";
            m_unavailableReported = true;
        }
        return false;
    }
    if (!target || fileKey.isEmpty() || pageNumber < 1) {
        qWarning() << "VisibilityTracker::observe: invalid target for" << fileKey << pageNumber;
        return false;
    }

    const QString key = observationKey(fileKey, pageNumber);
    auto it = m_observations.find(key);
    if (it != m_observations.end()) {
        if (it->target != target) {
            // Render target was re-created
            it->target = target;
            scheduleRefresh();
        }
        return true;
    }

    Observation observation;
    observation.fileKey = fileKey;
    observation.pageNumber = pageNumber;
    observation.target = target;
    m_observations.insert(key, observation);

    scheduleRefresh();
    return true;
}

void VisibilityTracker::unobserve(const FileKey& fileKey, int pageNumber)
{
    m_observations.remove(observationKey(fileKey, pageNumber));
    if (m_dominantFile == fileKey && m_dominantPage == pageNumber) {
        m_dominantFile.clear();
        m_dominantPage = 0;
    }
}

void VisibilityTracker::unobserveFile(const FileKey& fileKey)
{
    for (auto it = m_observations.begin(); it != m_observations.end();) {
        if (it->fileKey == fileKey) {
            it = m_observations.erase(it);
        } else {
            ++it;
        }
    }
    if (m_dominantFile == fileKey) {
        m_dominantFile.clear();
        m_dominantPage = 0;
    }
}

void VisibilityTracker::disconnectAll()
{
    m_observations.clear();
    m_dominantFile.clear();
    m_dominantPage = 0;
}

void VisibilityTracker::rebuildAll()
{
    disconnectAll();

    if (!isAvailable()) {
        qWarning() << "VisibilityTracker::rebuildAll: no scroll area, nothing to observe";
        return;
    }

    QWidget* root = m_area->viewport();
    if (auto* scrollArea = qobject_cast<QScrollArea*>(m_area.data())) {
        if (scrollArea->widget()) {
            root = scrollArea->widget();
        }
    }

    const QList<QWidget*> candidates = root->findChildren<QWidget*>();
    for (QWidget* candidate : candidates) {
        const QVariant page = candidate->property(PageTargetProperty::PageNumber);
        const QString fileKey = candidate->property(PageTargetProperty::FileKey).toString();
        if (page.isValid() && !fileKey.isEmpty()) {
            observe(fileKey, page.toInt(), candidate);
        }
    }

    qDebug() << "VisibilityTracker::rebuildAll: observing" << m_observations.size() << "pages";
}

bool VisibilityTracker::isObserved(const FileKey& fileKey, int pageNumber) const
{
    return m_observations.contains(observationKey(fileKey, pageNumber));
}

qreal VisibilityTracker::visibilityRatio(const FileKey& fileKey, int pageNumber) const
{
    return m_observations.value(observationKey(fileKey, pageNumber)).ratio;
}

QVector<PageVisibilityRecord> VisibilityTracker::records() const
{
    QVector<PageVisibilityRecord> result;
    result.reserve(m_observations.size());
    for (const Observation& observation : m_observations) {
        PageVisibilityRecord record;
        record.fileKey = observation.fileKey;
        record.pageNumber = observation.pageNumber;
        record.ratio = observation.ratio;
        result.append(record);
    }
    return result;
}

// ============================================================================
// Visibility Updates
// ============================================================================

void VisibilityTracker::scheduleRefresh()
{
    if (isAvailable()) {
        m_refreshTimer->start();
    }
}

qreal VisibilityTracker::computeRatio(QWidget* target, QWidget* viewport) const
{
    if (!target->isVisibleTo(viewport)) {
        return 0.0;
    }

    const QRect targetRect(target->mapTo(viewport, QPoint(0, 0)), target->size());
    const qreal targetArea = qreal(targetRect.width()) * targetRect.height();
    if (targetArea <= 0.0) {
        return 0.0;
    }

    const QRect visible = targetRect.intersected(viewport->rect());
    return qreal(visible.width()) * visible.height() / targetArea;
}

void VisibilityTracker::refresh()
{
    if (!isAvailable()) {
        return;
    }

    QWidget* viewport = m_area->viewport();
    for (auto it = m_observations.begin(); it != m_observations.end(); ++it) {
        QWidget* target = it->target;
        if (!target) {
            // Torn down: keep the entry for a re-created target, forget its ratio
            if (m_dominantFile == it->fileKey && m_dominantPage == it->pageNumber) {
                m_dominantFile.clear();
                m_dominantPage = 0;
            }
            if (it->ratio != 0.0) {
                it->ratio = 0.0;
                if (m_bus) {
                    m_bus->publishVisibilityChanged(it->fileKey, it->pageNumber, 0.0);
                }
            }
            continue;
        }
        if (!viewport->isAncestorOf(target)) {
            continue;
        }

        const qreal ratio = computeRatio(target, viewport);
        if (qFuzzyCompare(1.0 + ratio, 1.0 + it->ratio)) {
            continue;
        }
        it->ratio = ratio;
        if (m_bus) {
            m_bus->publishVisibilityChanged(it->fileKey, it->pageNumber, ratio);
        }
    }

    evaluateDominance();
}

bool VisibilityTracker::reportVisibility(const FileKey& fileKey, int pageNumber, qreal ratio)
{
    auto it = m_observations.find(observationKey(fileKey, pageNumber));
    if (it == m_observations.end()) {
        return false;
    }

    it->ratio = qBound<qreal>(0.0, ratio, 1.0);
#ifdef SYNCVIEW_DEBUG
    qDebug() << "VisibilityTracker::reportVisibility:" << fileKey << pageNumber << it->ratio;
#endif
    if (m_bus) {
        m_bus->publishVisibilityChanged(fileKey, pageNumber, it->ratio);
    }

    evaluateDominance();
    return true;
}

void VisibilityTracker::reevaluate()
{
    evaluateDominance();
}

void VisibilityTracker::evaluateDominance()
{
    if (m_suppressed && m_suppressed()) {
        return;
    }

    // Ties keep the current dominant page
    const Observation* best = nullptr;
    auto current = m_observations.constFind(observationKey(m_dominantFile, m_dominantPage));
    if (current != m_observations.constEnd()) {
        best = &current.value();
    }

    for (const Observation& observation : m_observations) {
        if (!best || observation.ratio > best->ratio) {
            best = &observation;
        }
    }

    if (!best || best->ratio <= m_threshold) {
        return;
    }
    if (best->fileKey == m_dominantFile && best->pageNumber == m_dominantPage) {
        return;
    }

    const FileKey fileKey = best->fileKey;
    const int pageNumber = best->pageNumber;
    const qreal ratio = best->ratio;
    m_dominantFile = fileKey;
    m_dominantPage = pageNumber;
    emit pageDominant(fileKey, pageNumber, ratio);
}

// ============================================================================
// Event Filter
// ============================================================================

bool VisibilityTracker::eventFilter(QObject* watched, QEvent* event)
{
    if (m_area && watched == m_area->viewport()) {
        switch (event->type()) {
            case QEvent::Resize:
            case QEvent::Show:
            case QEvent::LayoutRequest:
                scheduleRefresh();
                break;
            default:
                break;
        }
    }
    return QObject::eventFilter(watched, event);
}
