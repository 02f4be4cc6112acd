#pragma once

// ============================================================================
// NavigationCoordinator - Drives deliberate "go to page N of file F" requests
// ============================================================================
// State machine:
//   Idle -> Requested -> Executing -> Verifying -> Completed
//                            ^            |
//                            +- Retrying <+-> Failed
//
// At most one request is in flight. A request arriving while busy is
// rejected, unless the busy flag is older than the stuck threshold, in which
// case the old request is abandoned (its pending continuations are
// invalidated) and the new one proceeds.
//
// Each attempt runs three scroll strategies in order (content geometry,
// viewport geometry, secondary scroll area mirror), then verifies after a
// settle delay that the target intersects the viewport. Failed attempts are
// retried with linear backoff and no animation, up to maxAttempts in total.
// ============================================================================

#include "NavigationTypes.h"
#include "NavigationConfig.h"

#include <QObject>
#include <QAbstractScrollArea>
#include <QPointer>
#include <QWidget>

class QTimer;
class QPropertyAnimation;
class PageStateStore;
class ElementLocator;
class NavigationEventBus;

class NavigationCoordinator : public QObject {
    Q_OBJECT

public:
    /**
     * @param store Page state (not owned).
     * @param locator Render target lookup (not owned).
     * @param bus Broadcast channel for completions and failures (not owned).
     */
    NavigationCoordinator(PageStateStore* store, ElementLocator* locator,
                          NavigationEventBus* bus, QObject* parent = nullptr);
    ~NavigationCoordinator() override;

    void setConfig(const NavigationConfig& config);
    const NavigationConfig& config() const { return m_config; }

    void setClock(NavigationClock clock);

    /**
     * @brief Set the scroll area that holds the render targets.
     */
    void setScrollArea(QAbstractScrollArea* area);
    QAbstractScrollArea* scrollArea() const { return m_area; }

    /**
     * @brief Optional second scroll area that mirrors the primary offset.
     */
    void setSecondaryScrollArea(QAbstractScrollArea* area);

    // =========================================================================
    // Requests
    // =========================================================================

    /**
     * @brief Request navigation to a page.
     * @param pageNumber 1-based page, clamped to the file's page range.
     * @param fileKey Target file; empty means the current file.
     * @param options Scroll behaviour, alignment and highlight.
     * @param source Originator, carried by the completion broadcast.
     * @return True if the request was accepted.
     *
     * Rejected (no state change) when the file is unknown or has no pages,
     * or while another request is in flight and not yet stale. On
     * acceptance the file's currentPage is updated immediately.
     */
    bool navigate(int pageNumber, const FileKey& fileKey = FileKey(),
                  const ScrollOptions& options = ScrollOptions(),
                  const QString& source = NavigationSource::Coordinator);

    /**
     * @brief A page's render target became available.
     *
     * Refreshes the locator entry and, if a retry of that page is waiting
     * for its backoff, runs it right away.
     */
    void notifyRenderComplete(const FileKey& fileKey, int pageNumber);

    bool isBusy() const { return m_busy; }
    qint64 busySince() const { return m_busySince; }
    NavigationPhase phase() const { return m_phase; }
    ScrollRequest currentRequest() const { return m_request; }
    ScrollFailureReason lastFailureReason() const { return m_lastFailure; }

signals:
    void phaseChanged(NavigationPhase phase);
    void attemptStarted(const ScrollRequest& request);

    /**
     * @brief Verification missed and the offset was forced before re-checking.
     */
    void offsetCorrected(const ScrollRequest& request, int offset);
    void navigationCompleted(const FileKey& fileKey, int pageNumber);
    void navigationFailed(const FileKey& fileKey, int pageNumber,
                          ScrollFailureReason reason, int attempts);

    /**
     * @brief A stuck request was abandoned to accept a new one.
     */
    void staleStateRecovered(const FileKey& fileKey, int pageNumber);

private:
    void setPhase(NavigationPhase phase);
    void scheduleStep(int delayMs, std::function<void()> step);
    void recoverStaleState();

    void execute(const ScrollRequest& request);
    void verify(const ScrollRequest& request, bool corrected);
    void complete(const ScrollRequest& request);
    void handleAttemptFailure(const ScrollRequest& request, ScrollFailureReason reason);
    void fail(const ScrollRequest& request, ScrollFailureReason reason);
    void runPendingRetry();

    // Scroll strategies
    int contentOffsetOf(QWidget* target) const;
    int viewportOffsetOf(QWidget* target) const;
    int alignedOffset(int pageTop, int pageHeight, bool alignToTop) const;
    void scrollTo(int offset, ScrollBehavior behavior);
    void retargetOrSet(int offset);
    void mirrorToSecondary(int offset);
    void stopAnimation();

    bool isTargetVisible(QWidget* target) const;
    void applyHighlight(const FileKey& fileKey, QWidget* target);

    PageStateStore* m_store = nullptr;
    ElementLocator* m_locator = nullptr;
    NavigationEventBus* m_bus = nullptr;

    NavigationConfig m_config;
    NavigationClock m_clock;

    QPointer<QAbstractScrollArea> m_area;
    QPointer<QAbstractScrollArea> m_secondary;
    QPropertyAnimation* m_animation = nullptr;

    // Mutual exclusion
    bool m_busy = false;
    qint64 m_busySince = 0;
    quint64 m_generation = 0;   ///< Bumped per accepted request; stale steps bail out
    bool m_raisedFileChanging = false;

    NavigationPhase m_phase = NavigationPhase::Idle;
    ScrollRequest m_request;
    ScrollFailureReason m_lastFailure = ScrollFailureReason::None;

    // Retry waiting for its backoff (or for the page to finish rendering)
    QTimer* m_retryTimer = nullptr;
    ScrollRequest m_pendingRetry;
    bool m_hasPendingRetry = false;
};
