#include "NavigationEventBus.h"
#include "NavigationConfig.h"

#include <QTimer>
#include <QDebug>
#include <utility>

// ============================================================================
// Constructor / Destructor
// ============================================================================

NavigationEventBus::NavigationEventBus(QObject* parent)
    : QObject(parent)
    , m_clock(defaultNavigationClock())
{
    registerNavigationMetaTypes();
}

NavigationEventBus::~NavigationEventBus()
{
    // Throttle timers are children and die with us; nothing pending is delivered.
}

void NavigationEventBus::setClock(NavigationClock clock)
{
    m_clock = clock ? std::move(clock) : defaultNavigationClock();
}

void NavigationEventBus::setConfig(const NavigationConfig& config)
{
    m_throttleMs = config.eventThrottleMs;
    m_reentrancyWindowMs = config.reentrancyWindowMs;
    for (QTimer* timer : std::as_const(m_throttleTimers)) {
        timer->setInterval(m_throttleMs);
    }
}

// ============================================================================
// Publishing
// ============================================================================

bool NavigationEventBus::publishPageChanged(const FileKey& fileKey, int pageNumber, const QString& source)
{
    PageChangedEvent event;
    event.fileKey = fileKey;
    event.pageNumber = pageNumber;
    event.source = source;
    event.timestamp = m_clock();

    if (m_manualMode) {
        m_manualPending = event;
        m_hasManualPending = true;
        return false;
    }

    if (m_activeSources.contains(source)) {
#ifdef SYNCVIEW_DEBUG
        qDebug() << "NavigationEventBus::publishPageChanged: dropped re-entrant event from" << source;
#endif
        return false;
    }

    m_pendingBySource[source] = event;
    throttleTimerFor(source)->start();
    return true;
}

void NavigationEventBus::publishRenderComplete(const FileKey& fileKey, int pageNumber)
{
    RenderCompleteEvent event;
    event.fileKey = fileKey;
    event.pageNumber = pageNumber;
    event.timestamp = m_clock();

    recordEvent(QStringLiteral("render-complete"), fileKey, pageNumber, QString(), event.timestamp);
    emit renderComplete(event);
}

void NavigationEventBus::publishScrollFailed(const FileKey& fileKey, int pageNumber,
                                             ScrollFailureReason reason, int attempts)
{
    ScrollFailedEvent event;
    event.fileKey = fileKey;
    event.pageNumber = pageNumber;
    event.reason = reason;
    event.attempts = attempts;
    event.timestamp = m_clock();

    recordEvent(QStringLiteral("scroll-failed"), fileKey, pageNumber,
                scrollFailureReasonName(reason), event.timestamp);
    emit scrollFailed(event);
}

bool NavigationEventBus::publishVisibilityChanged(const FileKey& fileKey, int pageNumber, qreal ratio)
{
    if (m_manualMode) {
        return false;
    }

    VisibilityChangedEvent event;
    event.fileKey = fileKey;
    event.pageNumber = pageNumber;
    event.visibilityRatio = ratio;
    event.timestamp = m_clock();

    emit visibilityChanged(event);
    return true;
}

// ============================================================================
// Manual Mode
// ============================================================================

void NavigationEventBus::setManualMode(bool enabled)
{
    if (m_manualMode == enabled) {
        return;
    }

    m_manualMode = enabled;

    if (!enabled && m_hasManualPending) {
        PageChangedEvent pending = m_manualPending;
        m_hasManualPending = false;
        m_manualPending = PageChangedEvent();
        dispatchPageChanged(pending);
    }
}

// ============================================================================
// Named Subscribers
// ============================================================================

void NavigationEventBus::subscribe(const QString& subscriberId, PageChangedCallback callback)
{
    if (subscriberId.isEmpty() || !callback) {
        qWarning() << "NavigationEventBus::subscribe: ignoring empty subscriber";
        return;
    }
    m_subscribers.insert(subscriberId, std::move(callback));
}

void NavigationEventBus::unsubscribe(const QString& subscriberId)
{
    m_subscribers.remove(subscriberId);
}

// ============================================================================
// Dispatch
// ============================================================================

void NavigationEventBus::dispatchPageChanged(const PageChangedEvent& event)
{
    m_activeSources.insert(event.source);
    recordEvent(QStringLiteral("page-changed"), event.fileKey, event.pageNumber,
                event.source, event.timestamp);

    emit pageChanged(event);

    // Copy: a callback may unsubscribe itself or others
    const QMap<QString, PageChangedCallback> subscribers = m_subscribers;
    for (auto it = subscribers.cbegin(); it != subscribers.cend(); ++it) {
        if (it.key() == event.source) {
            continue;
        }
        it.value()(event);
    }

    if (m_reentrancyWindowMs <= 0) {
        releaseSource(event.source);
    } else {
        const QString source = event.source;
        QTimer::singleShot(m_reentrancyWindowMs, this, [this, source]() {
            releaseSource(source);
        });
    }
}

void NavigationEventBus::releaseSource(const QString& source)
{
    m_activeSources.remove(source);
}

QTimer* NavigationEventBus::throttleTimerFor(const QString& source)
{
    QTimer* timer = m_throttleTimers.value(source, nullptr);
    if (timer) {
        return timer;
    }

    timer = new QTimer(this);
    timer->setSingleShot(true);
    timer->setInterval(m_throttleMs);
    connect(timer, &QTimer::timeout, this, [this, source]() {
        auto it = m_pendingBySource.find(source);
        if (it == m_pendingBySource.end()) {
            return;
        }
        const PageChangedEvent event = it.value();
        m_pendingBySource.erase(it);

        // Manual mode may have been switched on while the event was queued
        if (m_manualMode) {
            m_manualPending = event;
            m_hasManualPending = true;
            return;
        }
        dispatchPageChanged(event);
    });
    m_throttleTimers.insert(source, timer);
    return timer;
}

void NavigationEventBus::recordEvent(const QString& type, const FileKey& fileKey, int pageNumber,
                                     const QString& source, qint64 timestamp)
{
    EventRecord record;
    record.type = type;
    record.fileKey = fileKey;
    record.pageNumber = pageNumber;
    record.source = source;
    record.timestamp = timestamp;

    m_history.prepend(record);
    if (m_history.size() > MAX_EVENT_HISTORY) {
        m_history.removeLast();
    }
}
