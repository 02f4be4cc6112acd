#pragma once

// ============================================================================
// NavigationTypes - Shared value types for viewport navigation
// ============================================================================
// FileKey, scroll requests, per-file navigation state and the typed messages
// carried by NavigationEventBus.
// ============================================================================

#include <QString>
#include <QMetaType>
#include <QDateTime>
#include <functional>

/**
 * @brief Stable opaque identifier of a loaded document.
 *
 * Used everywhere instead of document pointers so that navigation state
 * never outlives (or dangles on) the document it describes.
 */
using FileKey = QString;

/**
 * @brief Millisecond clock used for timestamps and staleness checks.
 *
 * Injectable so that staleness and throttling can be tested without
 * waiting on the wall clock.
 */
using NavigationClock = std::function<qint64()>;

inline NavigationClock defaultNavigationClock()
{
    return []() { return QDateTime::currentMSecsSinceEpoch(); };
}

// Dynamic property names shared by render targets and the locator/tracker.
namespace PageTargetProperty {
inline const char* const FileKey = "fileKey";
inline const char* const PageNumber = "pageNumber";
inline const char* const Active = "navigationActive";
inline const char* const JustActivated = "justActivated";
}

// Well-known event sources.
namespace NavigationSource {
inline const QString Coordinator = QStringLiteral("navigation-coordinator");
inline const QString Visibility = QStringLiteral("visibility-tracker");
inline const QString Thumbnails = QStringLiteral("thumbnails");
inline const QString FileList = QStringLiteral("file-list");
inline const QString Toolbar = QStringLiteral("toolbar");
}

enum class ScrollBehavior {
    Smooth,     ///< Animated scroll
    Instant     ///< Jump directly to the target offset
};

struct ScrollOptions {
    ScrollBehavior behavior = ScrollBehavior::Smooth;
    bool alignToTop = false;        ///< Align page top (with margin) instead of centering
    bool highlightTarget = true;    ///< Apply the just-activated marker to the page
};

/**
 * @brief One logical navigation request.
 *
 * Immutable per attempt. A retry produces a copy with the next attempt
 * number; fileKey, pageNumber and requestedAt stay the same.
 */
struct ScrollRequest {
    FileKey fileKey;
    int pageNumber = 0;
    ScrollOptions options;
    int attempt = 1;            ///< 1-based attempt number
    qint64 requestedAt = 0;
    QString source;

    ScrollRequest nextAttempt() const
    {
        ScrollRequest next = *this;
        next.attempt = attempt + 1;
        next.options.behavior = ScrollBehavior::Instant;
        return next;
    }

    bool targets(const FileKey& file, int page) const
    {
        return fileKey == file && pageNumber == page;
    }
};

struct PageVisibilityRecord {
    FileKey fileKey;
    int pageNumber = 0;
    qreal ratio = 0.0;          ///< 0..1 overlap of the page with the viewport
};

/**
 * @brief Per-file page position state.
 *
 * currentPage is the last deliberately requested page; activePage is the
 * page judged most visible. Pages are 1-based; 0 means "none yet".
 */
struct FileNavigationState {
    FileKey fileKey;
    int currentPage = 0;
    int activePage = 0;
    int totalPages = 0;
    qreal lastScrollOffset = 0.0;

    bool isValid() const { return !fileKey.isEmpty(); }
};

enum class NavigationPhase {
    Idle,
    Requested,
    Executing,
    Verifying,
    Retrying,
    Completed,
    Failed
};

enum class ScrollFailureReason {
    None,
    TargetNotFound,
    ContainerNotFound,
    VerificationFailed,
    AttemptsExhausted
};

QString navigationPhaseName(NavigationPhase phase);
QString scrollFailureReasonName(ScrollFailureReason reason);

// ===== Bus messages =====

struct PageChangedEvent {
    FileKey fileKey;
    int pageNumber = 0;
    QString source;
    qint64 timestamp = 0;
};

struct RenderCompleteEvent {
    FileKey fileKey;
    int pageNumber = 0;
    qint64 timestamp = 0;
};

struct ScrollFailedEvent {
    FileKey fileKey;
    int pageNumber = 0;
    ScrollFailureReason reason = ScrollFailureReason::None;
    int attempts = 0;
    qint64 timestamp = 0;
};

struct VisibilityChangedEvent {
    FileKey fileKey;
    int pageNumber = 0;
    qreal visibilityRatio = 0.0;
    qint64 timestamp = 0;
};

Q_DECLARE_METATYPE(ScrollRequest)
Q_DECLARE_METATYPE(NavigationPhase)
Q_DECLARE_METATYPE(ScrollFailureReason)
Q_DECLARE_METATYPE(PageChangedEvent)
Q_DECLARE_METATYPE(RenderCompleteEvent)
Q_DECLARE_METATYPE(ScrollFailedEvent)
Q_DECLARE_METATYPE(VisibilityChangedEvent)

/**
 * @brief Register the navigation value types with the Qt meta-type system.
 *
 * Needed before these types travel through queued connections or are
 * inspected with QSignalSpy. Safe to call more than once.
 */
void registerNavigationMetaTypes();
