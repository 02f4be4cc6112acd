#pragma once

// ============================================================================
// NavigationEventBus - Typed publish/subscribe for navigation notifications
// ============================================================================
// Decouples producers (coordinator, visibility tracking, renderer) from the
// views that follow them (thumbnail rail, side panels, status bar).
//
// Message types: PageChanged, RenderComplete, ScrollFailed, VisibilityChanged.
// Listeners connect to the Qt signals, or register a named callback for
// page changes (named callbacks are skipped for their own events).
//
// Page-changed publishing is:
// - throttled per source (latest event within the window wins)
// - guarded against re-entrancy (a source cannot re-trigger itself while
//   its own event is being dispatched)
// - suppressible with manual mode for batched updates
// ============================================================================

#include "NavigationTypes.h"

#include <QObject>
#include <QHash>
#include <QSet>
#include <QVector>
#include <QMap>

class QTimer;
struct NavigationConfig;

class NavigationEventBus : public QObject {
    Q_OBJECT

public:
    using PageChangedCallback = std::function<void(const PageChangedEvent&)>;

    /**
     * @brief Diagnostic record of a dispatched event.
     */
    struct EventRecord {
        QString type;
        FileKey fileKey;
        int pageNumber = 0;
        QString source;
        qint64 timestamp = 0;
    };

    static constexpr int MAX_EVENT_HISTORY = 20;

    explicit NavigationEventBus(QObject* parent = nullptr);
    ~NavigationEventBus() override;

    void setClock(NavigationClock clock);
    void setConfig(const NavigationConfig& config);

    // =========================================================================
    // Publishing
    // =========================================================================

    /**
     * @brief Publish a page change on behalf of a source.
     * @return False if the event was dropped (manual mode or the source is
     *         currently dispatching); true if it was queued for delivery.
     *
     * Delivery happens after the throttle window. Several publishes from the
     * same source within the window coalesce into one delivery of the last.
     */
    bool publishPageChanged(const FileKey& fileKey, int pageNumber, const QString& source);

    void publishRenderComplete(const FileKey& fileKey, int pageNumber);

    /**
     * @brief Broadcast a terminal scroll failure. Never throttled.
     */
    void publishScrollFailed(const FileKey& fileKey, int pageNumber,
                             ScrollFailureReason reason, int attempts);

    /**
     * @brief Broadcast a raw visibility sample.
     * @return False if suppressed by manual mode.
     */
    bool publishVisibilityChanged(const FileKey& fileKey, int pageNumber, qreal ratio);

    // =========================================================================
    // Manual Mode
    // =========================================================================

    /**
     * @brief Suppress automatic page-changed and visibility broadcasts.
     *
     * While enabled, the latest page-changed event is retained. Disabling
     * manual mode delivers that event once.
     */
    void setManualMode(bool enabled);
    bool isManualMode() const { return m_manualMode; }

    bool isSourceActive(const QString& source) const { return m_activeSources.contains(source); }

    // =========================================================================
    // Named Subscribers
    // =========================================================================

    /**
     * @brief Register a page-changed callback under an id.
     *
     * Replaces any callback previously registered under the same id. The
     * callback is not invoked for events whose source equals the id.
     */
    void subscribe(const QString& subscriberId, PageChangedCallback callback);
    void unsubscribe(const QString& subscriberId);
    int subscriberCount() const { return m_subscribers.size(); }

    /**
     * @brief Most recent dispatched events, newest first.
     */
    QVector<EventRecord> recentEvents() const { return m_history; }

signals:
    void pageChanged(const PageChangedEvent& event);
    void renderComplete(const RenderCompleteEvent& event);
    void scrollFailed(const ScrollFailedEvent& event);
    void visibilityChanged(const VisibilityChangedEvent& event);

private:
    void dispatchPageChanged(const PageChangedEvent& event);
    void releaseSource(const QString& source);
    QTimer* throttleTimerFor(const QString& source);
    void recordEvent(const QString& type, const FileKey& fileKey, int pageNumber,
                     const QString& source, qint64 timestamp);

    NavigationClock m_clock;
    int m_throttleMs = 10;
    int m_reentrancyWindowMs = 50;

    bool m_manualMode = false;
    bool m_hasManualPending = false;
    PageChangedEvent m_manualPending;

    QHash<QString, QTimer*> m_throttleTimers;
    QHash<QString, PageChangedEvent> m_pendingBySource;
    QSet<QString> m_activeSources;

    // QMap keeps delivery order stable across runs
    QMap<QString, PageChangedCallback> m_subscribers;

    QVector<EventRecord> m_history;
};
