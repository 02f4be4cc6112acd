#include "NavigationCoordinator.h"
#include "PageStateStore.h"
#include "ElementLocator.h"
#include "NavigationEventBus.h"

#include <QAbstractScrollArea>
#include <QScrollArea>
#include <QScrollBar>
#include <QPropertyAnimation>
#include <QStyle>
#include <QTimer>
#include <QDebug>
#include <utility>

// ============================================================================
// Constructor / Destructor
// ============================================================================

NavigationCoordinator::NavigationCoordinator(PageStateStore* store, ElementLocator* locator,
                                             NavigationEventBus* bus, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_locator(locator)
    , m_bus(bus)
    , m_clock(defaultNavigationClock())
    , m_retryTimer(new QTimer(this))
{
    m_retryTimer->setSingleShot(true);
    connect(m_retryTimer, &QTimer::timeout, this, &NavigationCoordinator::runPendingRetry);
}

NavigationCoordinator::~NavigationCoordinator()
{
    // Pending singleShot steps use this as context and are dropped with us
    stopAnimation();
}

void NavigationCoordinator::setConfig(const NavigationConfig& config)
{
    m_config = config.sanitized();
}

void NavigationCoordinator::setClock(NavigationClock clock)
{
    m_clock = clock ? std::move(clock) : defaultNavigationClock();
}

void NavigationCoordinator::setScrollArea(QAbstractScrollArea* area)
{
    if (m_area != area) {
        stopAnimation();
    }
    m_area = area;
}

void NavigationCoordinator::setSecondaryScrollArea(QAbstractScrollArea* area)
{
    m_secondary = area;
}

// ============================================================================
// Requests
// ============================================================================

bool NavigationCoordinator::navigate(int pageNumber, const FileKey& fileKey,
                                     const ScrollOptions& options, const QString& source)
{
    const FileKey file = fileKey.isEmpty() ? m_store->currentFile() : fileKey;
    if (file.isEmpty() || !m_store->hasFile(file)) {
        qWarning() << "NavigationCoordinator::navigate: unknown file" << file;
        return false;
    }
    if (m_store->totalPages(file) <= 0) {
        qWarning() << "NavigationCoordinator::navigate: file" << file << "has no pages";
        return false;
    }

    const qint64 now = m_clock();
    if (m_busy) {
        const qint64 busyFor = now - m_busySince;
        if (busyFor < m_config.stuckThresholdMs) {
            qDebug() << "NavigationCoordinator::navigate: busy with" << m_request.fileKey
                     << m_request.pageNumber << "- rejecting" << file << pageNumber;
            return false;
        }
        qWarning() << "NavigationCoordinator::navigate: busy for" << busyFor
                   << "ms, resetting stuck navigation to" << m_request.fileKey << m_request.pageNumber;
        recoverStaleState();
    }

    ScrollRequest request;
    request.fileKey = file;
    request.pageNumber = m_store->clampPage(file, pageNumber);
    request.options = options;
    request.attempt = 1;
    request.requestedAt = now;
    request.source = source.isEmpty() ? NavigationSource::Coordinator : source;

    ++m_generation;
    m_busy = true;
    m_busySince = now;
    m_request = request;
    m_lastFailure = ScrollFailureReason::None;

    // Optimistic: reflect intent before the scroll settles
    if (file != m_store->currentFile()) {
        m_store->setFileChanging(true);
        m_raisedFileChanging = true;
        m_store->setCurrentFile(file, request.source);
    }
    m_store->setCurrentPage(file, request.pageNumber, request.source);

    setPhase(NavigationPhase::Requested);
    scheduleStep(m_config.preExecutionDelayMs, [this, request]() {
        execute(request);
    });
    return true;
}

void NavigationCoordinator::notifyRenderComplete(const FileKey& fileKey, int pageNumber)
{
    m_locator->warm(fileKey, pageNumber);

    if (m_hasPendingRetry && m_pendingRetry.targets(fileKey, pageNumber) && m_retryTimer->isActive()) {
        qDebug() << "NavigationCoordinator::notifyRenderComplete: page" << fileKey << pageNumber
                 << "rendered, retrying now";
        m_retryTimer->stop();
        runPendingRetry();
    }
}

// ============================================================================
// State Machine
// ============================================================================

void NavigationCoordinator::setPhase(NavigationPhase phase)
{
    if (m_phase == phase) {
        return;
    }
    m_phase = phase;
#ifdef SYNCVIEW_DEBUG
    qDebug() << "NavigationCoordinator: phase" << navigationPhaseName(phase);
#endif
    emit phaseChanged(phase);
}

void NavigationCoordinator::scheduleStep(int delayMs, std::function<void()> step)
{
    const quint64 generation = m_generation;
    QTimer::singleShot(qMax(0, delayMs), this, [this, generation, step = std::move(step)]() {
        if (generation != m_generation) {
            return;
        }
        step();
    });
}

void NavigationCoordinator::recoverStaleState()
{
    const ScrollRequest abandoned = m_request;

    ++m_generation;
    m_retryTimer->stop();
    m_hasPendingRetry = false;
    stopAnimation();
    m_busy = false;
    setPhase(NavigationPhase::Idle);

    emit staleStateRecovered(abandoned.fileKey, abandoned.pageNumber);
}

void NavigationCoordinator::execute(const ScrollRequest& request)
{
    setPhase(NavigationPhase::Executing);
    m_request = request;
    emit attemptStarted(request);

    if (!m_area || !m_area->viewport()) {
        handleAttemptFailure(request, ScrollFailureReason::ContainerNotFound);
        return;
    }

    QWidget* target = m_locator->locate(request.fileKey, request.pageNumber);
    if (!target) {
        handleAttemptFailure(request, ScrollFailureReason::TargetNotFound);
        return;
    }
    if (!m_area->viewport()->isAncestorOf(target)) {
        handleAttemptFailure(request, ScrollFailureReason::ContainerNotFound);
        return;
    }

    if (request.options.highlightTarget) {
        applyHighlight(request.fileKey, target);
    }

    const bool alignToTop = request.options.alignToTop;

    // 1. Bring into view using the target's position in the content
    const int contentOffset = alignedOffset(contentOffsetOf(target), target->height(), alignToTop);
    scrollTo(contentOffset, request.options.behavior);

    // 2. Recompute from live viewport geometry and apply directly
    const int viewportOffset = alignedOffset(viewportOffsetOf(target), target->height(), alignToTop);
    retargetOrSet(viewportOffset);

    // 3. Keep a secondary container in step
    mirrorToSecondary(viewportOffset);

    setPhase(NavigationPhase::Verifying);
    const bool smooth = request.options.behavior == ScrollBehavior::Smooth;
    scheduleStep(m_config.settleDelayMs(smooth), [this, request]() {
        verify(request, false);
    });
}

void NavigationCoordinator::verify(const ScrollRequest& request, bool corrected)
{
    QWidget* target = m_area ? m_locator->locate(request.fileKey, request.pageNumber) : nullptr;
    if (target && isTargetVisible(target)) {
        complete(request);
        return;
    }

    if (!corrected && target && request.attempt < m_config.maxAttempts) {
        // Jump just above the page and look again before a full retry
        qDebug() << "NavigationCoordinator::verify:" << request.fileKey << request.pageNumber
                 << "not visible, forcing offset";
        stopAnimation();
        const int offset = qMax(0, contentOffsetOf(target) - m_config.correctionMarginPx);
        m_area->verticalScrollBar()->setValue(offset);
        mirrorToSecondary(offset);
        emit offsetCorrected(request, offset);

        scheduleStep(m_config.correctionDelayMs, [this, request]() {
            verify(request, true);
        });
        return;
    }

    handleAttemptFailure(request, target ? ScrollFailureReason::VerificationFailed
                                         : ScrollFailureReason::TargetNotFound);
}

void NavigationCoordinator::complete(const ScrollRequest& request)
{
    m_busy = false;
    setPhase(NavigationPhase::Completed);

    m_store->setActivePage(request.fileKey, request.pageNumber);
    if (m_raisedFileChanging) {
        m_raisedFileChanging = false;
        m_store->setFileChanging(false);
    }
    if (m_area) {
        m_store->recordScrollOffset(request.fileKey, m_area->verticalScrollBar()->value());
    }

    qDebug() << "NavigationCoordinator: reached" << request.fileKey << "page" << request.pageNumber
             << "on attempt" << request.attempt;

    m_bus->publishPageChanged(request.fileKey, request.pageNumber, request.source);
    emit navigationCompleted(request.fileKey, request.pageNumber);
}

void NavigationCoordinator::handleAttemptFailure(const ScrollRequest& request, ScrollFailureReason reason)
{
    m_lastFailure = reason;
    qWarning() << "NavigationCoordinator: attempt" << request.attempt << "of" << m_config.maxAttempts
               << "for" << request.fileKey << request.pageNumber
               << "failed:" << scrollFailureReasonName(reason);

    if (request.attempt >= m_config.maxAttempts) {
        fail(request, reason);
        return;
    }

    setPhase(NavigationPhase::Retrying);
    m_pendingRetry = request.nextAttempt();
    m_hasPendingRetry = true;
    m_retryTimer->start(m_config.retryBackoffMs * request.attempt);
}

void NavigationCoordinator::runPendingRetry()
{
    if (!m_hasPendingRetry) {
        return;
    }
    const ScrollRequest retry = m_pendingRetry;
    m_hasPendingRetry = false;
    execute(retry);
}

void NavigationCoordinator::fail(const ScrollRequest& request, ScrollFailureReason reason)
{
    m_busy = false;
    m_hasPendingRetry = false;
    setPhase(NavigationPhase::Failed);

    if (m_raisedFileChanging) {
        m_raisedFileChanging = false;
        m_store->setFileChanging(false);
    }

    qWarning() << "NavigationCoordinator:" << scrollFailureReasonName(ScrollFailureReason::AttemptsExhausted)
               << "for" << request.fileKey << request.pageNumber << "after" << request.attempt
               << "attempts, last reason" << scrollFailureReasonName(reason);

    m_bus->publishScrollFailed(request.fileKey, request.pageNumber, reason, request.attempt);
    emit navigationFailed(request.fileKey, request.pageNumber, reason, request.attempt);
}

// ============================================================================
// Scroll Strategies
// ============================================================================

int NavigationCoordinator::contentOffsetOf(QWidget* target) const
{
    auto* scrollArea = qobject_cast<QScrollArea*>(m_area.data());
    if (scrollArea && scrollArea->widget() && scrollArea->widget()->isAncestorOf(target)) {
        return target->mapTo(scrollArea->widget(), QPoint(0, 0)).y();
    }
    return viewportOffsetOf(target);
}

int NavigationCoordinator::viewportOffsetOf(QWidget* target) const
{
    QWidget* viewport = m_area->viewport();
    return m_area->verticalScrollBar()->value() + target->mapTo(viewport, QPoint(0, 0)).y();
}

int NavigationCoordinator::alignedOffset(int pageTop, int pageHeight, bool alignToTop) const
{
    const int viewportHeight = m_area->viewport()->height();

    int offset = 0;
    if (alignToTop) {
        offset = pageTop - qRound(viewportHeight * m_config.alignTopMarginFraction);
    } else {
        offset = pageTop - viewportHeight / 2 + pageHeight / 2;
    }
    return qBound(0, offset, qMax(0, m_area->verticalScrollBar()->maximum()));
}

void NavigationCoordinator::scrollTo(int offset, ScrollBehavior behavior)
{
    QScrollBar* vbar = m_area->verticalScrollBar();

    if (behavior == ScrollBehavior::Instant || m_config.smoothScrollDurationMs <= 0
        || vbar->value() == offset) {
        stopAnimation();
        vbar->setValue(offset);
        return;
    }

    if (!m_animation) {
        m_animation = new QPropertyAnimation(this);
        m_animation->setPropertyName("value");
        m_animation->setEasingCurve(QEasingCurve::OutCubic);
    }
    m_animation->stop();
    m_animation->setTargetObject(vbar);
    m_animation->setDuration(m_config.smoothScrollDurationMs);
    m_animation->setStartValue(vbar->value());
    m_animation->setEndValue(offset);
    m_animation->start();
}

void NavigationCoordinator::retargetOrSet(int offset)
{
    if (m_animation && m_animation->state() == QAbstractAnimation::Running) {
        if (m_animation->endValue().toInt() != offset) {
            m_animation->setEndValue(offset);
        }
        return;
    }
    m_area->verticalScrollBar()->setValue(offset);
}

void NavigationCoordinator::mirrorToSecondary(int offset)
{
    if (m_secondary && m_secondary != m_area) {
        m_secondary->verticalScrollBar()->setValue(offset);
    }
}

void NavigationCoordinator::stopAnimation()
{
    if (m_animation) {
        m_animation->stop();
    }
}

// ============================================================================
// Verification / Feedback
// ============================================================================

bool NavigationCoordinator::isTargetVisible(QWidget* target) const
{
    QWidget* viewport = m_area->viewport();
    if (!viewport->isAncestorOf(target)) {
        return false;
    }
    const QRect targetRect(target->mapTo(viewport, QPoint(0, 0)), target->size());
    return targetRect.intersects(viewport->rect());
}

static void repolish(QWidget* widget)
{
    widget->style()->unpolish(widget);
    widget->style()->polish(widget);
    widget->update();
}

void NavigationCoordinator::applyHighlight(const FileKey& fileKey, QWidget* target)
{
    QWidget* root = m_locator->root() ? m_locator->root() : m_area->viewport();
    const QList<QWidget*> pages = root->findChildren<QWidget*>();
    for (QWidget* page : pages) {
        if (page != target && page->property(PageTargetProperty::Active).toBool()
            && page->property(PageTargetProperty::FileKey).toString() == fileKey) {
            page->setProperty(PageTargetProperty::Active, false);
            repolish(page);
        }
    }

    target->setProperty(PageTargetProperty::Active, true);
    target->setProperty(PageTargetProperty::JustActivated, true);
    repolish(target);

    // Context is the target: no callback once it is destroyed
    QTimer::singleShot(m_config.highlightDurationMs, target, [target]() {
        target->setProperty(PageTargetProperty::JustActivated, false);
        repolish(target);
    });
}
