#ifndef NAVIGATIONCOORDINATORTESTS_H
#define NAVIGATIONCOORDINATORTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include <QElapsedTimer>
#include <QScrollArea>
#include <QScrollBar>
#include <QWidget>
#include "NavigationCoordinator.h"
#include "PageStateStore.h"
#include "ElementLocator.h"
#include "NavigationEventBus.h"
#include "NavigationConfig.h"

/**
 * Unit tests for NavigationCoordinator.
 * Run with: syncview_tests --test-coordinator
 */
class NavigationCoordinatorTests : public QObject {
    Q_OBJECT

private:
    static constexpr int PAGE_HEIGHT = 300;
    static constexpr int PAGE_GAP = 20;

    // Scroll area with one column of page targets for a file
    static QScrollArea* makeArea(const FileKey& fileKey, int pages) {
        auto* area = new QScrollArea();
        area->setFrameShape(QFrame::NoFrame);
        area->resize(400, 500);

        auto* content = new QWidget();
        content->setFixedSize(360, pages * (PAGE_HEIGHT + PAGE_GAP));
        for (int i = 1; i <= pages; ++i) {
            auto* page = new QWidget(content);
            page->setObjectName(ElementLocator::pageObjectName(fileKey, i));
            page->setProperty(PageTargetProperty::FileKey, fileKey);
            page->setProperty(PageTargetProperty::PageNumber, i);
            page->setGeometry(0, (i - 1) * (PAGE_HEIGHT + PAGE_GAP), 360, PAGE_HEIGHT);
        }
        area->setWidget(content);
        return area;
    }

    static NavigationConfig fastConfig() {
        NavigationConfig config;
        config.preExecutionDelayMs = 0;
        config.instantSettleDelayMs = 10;
        config.smoothSettleDelayMs = 10;
        config.correctionDelayMs = 10;
        config.retryBackoffMs = 10;
        config.eventThrottleMs = 0;
        return config;
    }

private slots:
    void initTestCase() {
        registerNavigationMetaTypes();
    }

    // Out-of-range pages are clamped before anything else happens
    void testPageClamping() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);

        NavigationConfig config = fastConfig();
        config.preExecutionDelayMs = 10000; // Stay in Requested
        config.stuckThresholdMs = 0;        // Every new request replaces the last
        coordinator.setConfig(config);

        store.addFile("A", 5);

        QVERIFY(coordinator.navigate(10, "A"));
        QCOMPARE(coordinator.currentRequest().pageNumber, 5);
        QCOMPARE(store.currentPage("A"), 5);

        QVERIFY(coordinator.navigate(0, "A"));
        QCOMPARE(coordinator.currentRequest().pageNumber, 1);
        QCOMPARE(store.currentPage("A"), 1);
    }

    // Unknown files and files without pages are rejected without side effects
    void testRejectsInvalidFiles() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);
        coordinator.setConfig(fastConfig());

        QVERIFY(!coordinator.navigate(1, "missing"));
        QVERIFY(!coordinator.navigate(1)); // No current file

        store.addFile("empty", 0);
        QVERIFY(!coordinator.navigate(1, "empty"));
        QVERIFY(!coordinator.isBusy());
        QCOMPARE(coordinator.phase(), NavigationPhase::Idle);
    }

    // A second request while one is in flight is refused
    void testBusyRejection() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);
        NavigationConfig config = fastConfig();
        config.preExecutionDelayMs = 10000;
        coordinator.setConfig(config);

        store.addFile("A", 10);
        QVERIFY(coordinator.navigate(4, "A"));
        QVERIFY(coordinator.isBusy());
        QCOMPARE(coordinator.phase(), NavigationPhase::Requested);

        QVERIFY(!coordinator.navigate(8, "A"));
        QCOMPARE(store.currentPage("A"), 4);
        QCOMPARE(coordinator.currentRequest().pageNumber, 4);
    }

    // A request stuck past the threshold is abandoned for the new one
    void testStaleBusyRecovers() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);
        NavigationConfig config = fastConfig();
        config.preExecutionDelayMs = 10000;
        coordinator.setConfig(config);

        qint64 now = 1000;
        coordinator.setClock([&now]() { return now; });
        QSignalSpy staleSpy(&coordinator, &NavigationCoordinator::staleStateRecovered);

        store.addFile("A", 10);
        QVERIFY(coordinator.navigate(2, "A"));
        QCOMPARE(coordinator.busySince(), qint64(1000));

        now += 2999;
        QVERIFY(!coordinator.navigate(6, "A"));
        QCOMPARE(staleSpy.count(), 0);

        now += 2;
        QVERIFY(coordinator.navigate(6, "A"));
        QCOMPARE(staleSpy.count(), 1);
        QCOMPARE(staleSpy.takeFirst().at(1).toInt(), 2);
        QCOMPARE(store.currentPage("A"), 6);
        QCOMPARE(coordinator.busySince(), now);
        QVERIFY(coordinator.isBusy());
    }

    // A page that never appears is attempted exactly maxAttempts times
    void testRetryBoundAndSingleFailure() {
        QScopedPointer<QScrollArea> area(makeArea("A", 3));
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        locator.setStrategies({}); // Nothing ever resolves
        NavigationCoordinator coordinator(&store, &locator, &bus);
        coordinator.setConfig(fastConfig());
        coordinator.setScrollArea(area.data());

        QSignalSpy attemptSpy(&coordinator, &NavigationCoordinator::attemptStarted);
        QSignalSpy failedSpy(&bus, &NavigationEventBus::scrollFailed);
        QSignalSpy completedSpy(&coordinator, &NavigationCoordinator::navigationCompleted);

        store.addFile("A", 10);
        QVERIFY(coordinator.navigate(7, "A"));

        QTRY_COMPARE(failedSpy.count(), 1);
        QCOMPARE(attemptSpy.count(), 3);
        QCOMPARE(attemptSpy.at(0).at(0).value<ScrollRequest>().attempt, 1);
        QCOMPARE(attemptSpy.at(2).at(0).value<ScrollRequest>().attempt, 3);
        // Retries never animate
        QCOMPARE(attemptSpy.at(1).at(0).value<ScrollRequest>().options.behavior, ScrollBehavior::Instant);

        const ScrollFailedEvent failure = failedSpy.takeFirst().at(0).value<ScrollFailedEvent>();
        QCOMPARE(failure.fileKey, QString("A"));
        QCOMPARE(failure.pageNumber, 7);
        QCOMPARE(failure.attempts, 3);
        QCOMPARE(failure.reason, ScrollFailureReason::TargetNotFound);

        QVERIFY(!coordinator.isBusy());
        QCOMPARE(coordinator.phase(), NavigationPhase::Failed);
        QCOMPARE(completedSpy.count(), 0);

        // No late events
        QTest::qWait(100);
        QCOMPARE(failedSpy.count(), 0);
        QCOMPARE(attemptSpy.count(), 3);
    }

    // Without a container every attempt fails the same way
    void testMissingContainerFails() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);
        NavigationConfig config = fastConfig();
        config.maxAttempts = 2;
        coordinator.setConfig(config);
        QSignalSpy failedSpy(&coordinator, &NavigationCoordinator::navigationFailed);

        store.addFile("A", 4);
        QVERIFY(coordinator.navigate(2, "A"));
        QTRY_COMPARE(failedSpy.count(), 1);
        const QList<QVariant> args = failedSpy.takeFirst();
        QCOMPARE(args.at(2).value<ScrollFailureReason>(), ScrollFailureReason::ContainerNotFound);
        QCOMPARE(args.at(3).toInt(), 2);
    }

    // Smooth navigation end to end: intent first, then verified arrival
    void testSmoothNavigationCompletes() {
        QScopedPointer<QScrollArea> area(makeArea("A", 10));
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        locator.setRoot(area->widget());
        NavigationCoordinator coordinator(&store, &locator, &bus);
        coordinator.setConfig(NavigationConfig());
        coordinator.setScrollArea(area.data());

        area->show();
        QVERIFY(QTest::qWaitForWindowExposed(area.data()));

        store.addFile("A", 10);
        QSignalSpy pageSpy(&bus, &NavigationEventBus::pageChanged);
        QSignalSpy completedSpy(&coordinator, &NavigationCoordinator::navigationCompleted);

        qint64 elapsedAtCompletion = -1;
        QElapsedTimer elapsed;
        connect(&coordinator, &NavigationCoordinator::navigationCompleted, this,
                [&elapsedAtCompletion, &elapsed]() { elapsedAtCompletion = elapsed.elapsed(); });

        ScrollOptions options;
        options.behavior = ScrollBehavior::Smooth;
        elapsed.start();
        QVERIFY(coordinator.navigate(7, "A", options, "toolbar"));

        // Optimistic current page, active page only after arrival
        QCOMPARE(store.currentPage("A"), 7);
        QCOMPARE(store.activePage("A"), 1);

        QTRY_COMPARE_WITH_TIMEOUT(pageSpy.count(), 1, 1500);
        const PageChangedEvent event = pageSpy.takeFirst().at(0).value<PageChangedEvent>();
        QCOMPARE(event.fileKey, QString("A"));
        QCOMPARE(event.pageNumber, 7);
        QCOMPARE(event.source, QString("toolbar"));

        QCOMPARE(completedSpy.count(), 1);
        // Default delays: pre-execution plus smooth settle, one attempt
        QVERIFY2(elapsedAtCompletion >= 0 && elapsedAtCompletion <= 700,
                 qPrintable(QString("completed after %1 ms").arg(elapsedAtCompletion)));
        QCOMPARE(store.activePage("A"), 7);
        QVERIFY(!coordinator.isBusy());
        QCOMPARE(coordinator.phase(), NavigationPhase::Completed);

        // Page 7 intersects the viewport
        QWidget* target = locator.locate("A", 7);
        QVERIFY(target);
        const QRect rect(target->mapTo(area->viewport(), QPoint(0, 0)), target->size());
        QVERIFY(rect.intersects(area->viewport()->rect()));
        QVERIFY(target->property(PageTargetProperty::Active).toBool());
        QVERIFY(target->property(PageTargetProperty::JustActivated).toBool());
    }

    // A page that exists but can never intersect the viewport is corrected, then fails verification
    void testVerificationFailureCorrectsBeforeRetrying() {
        QScopedPointer<QScrollArea> area(makeArea("A", 3));
        auto* flat = new QWidget(area->widget());
        flat->setObjectName(ElementLocator::pageObjectName("A", 4));
        flat->setGeometry(0, 900, 360, 0);

        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        locator.setRoot(area->widget());
        NavigationCoordinator coordinator(&store, &locator, &bus);
        coordinator.setConfig(fastConfig());
        coordinator.setScrollArea(area.data());

        area->show();
        QVERIFY(QTest::qWaitForWindowExposed(area.data()));

        store.addFile("A", 4);
        QSignalSpy attemptSpy(&coordinator, &NavigationCoordinator::attemptStarted);
        QSignalSpy correctedSpy(&coordinator, &NavigationCoordinator::offsetCorrected);
        QSignalSpy failedSpy(&bus, &NavigationEventBus::scrollFailed);

        QVERIFY(coordinator.navigate(4, "A"));
        QTRY_COMPARE(failedSpy.count(), 1);

        QCOMPARE(attemptSpy.count(), 3);
        // One correction per non-final attempt
        QCOMPARE(correctedSpy.count(), 2);
        QCOMPARE(correctedSpy.at(0).at(0).value<ScrollRequest>().attempt, 1);
        QCOMPARE(correctedSpy.at(1).at(0).value<ScrollRequest>().attempt, 2);
        QVERIFY(correctedSpy.at(0).at(1).toInt() >= 0);

        const ScrollFailedEvent failure = failedSpy.takeFirst().at(0).value<ScrollFailedEvent>();
        QCOMPARE(failure.pageNumber, 4);
        QCOMPARE(failure.attempts, 3);
        QCOMPARE(failure.reason, ScrollFailureReason::VerificationFailed);
        QCOMPARE(coordinator.lastFailureReason(), ScrollFailureReason::VerificationFailed);
        QVERIFY(!coordinator.isBusy());
    }

    // Navigating into another file remembers where the old one was
    void testNavigationIntoOtherFileSavesOffset() {
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        NavigationCoordinator coordinator(&store, &locator, &bus);
        NavigationConfig config = fastConfig();
        config.preExecutionDelayMs = 10000;
        coordinator.setConfig(config);

        store.addFile("A", 5);
        store.addFile("B", 5);
        store.recordScrollOffset("A", 300.0);

        QVERIFY(coordinator.navigate(3, "B"));
        QCOMPARE(store.currentFile(), QString("B"));
        QCOMPARE(store.savedScrollOffset("A"), 300.0);

        QSignalSpy restoreSpy(&store, &PageStateStore::scrollOffsetRestoreRequested);
        QVERIFY(store.activateFile("A"));
        QCOMPARE(restoreSpy.count(), 1);
        QCOMPARE(restoreSpy.at(0).at(0).toString(), QString("A"));
        QCOMPARE(restoreSpy.at(0).at(1).toReal(), 300.0);
    }

    // Switching file through navigation raises and clears the file-changing flag
    void testCrossFileNavigation() {
        QScopedPointer<QScrollArea> area(makeArea("B", 4));
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        locator.setRoot(area->widget());
        NavigationCoordinator coordinator(&store, &locator, &bus);
        coordinator.setConfig(fastConfig());
        coordinator.setScrollArea(area.data());

        area->show();
        QVERIFY(QTest::qWaitForWindowExposed(area.data()));

        store.addFile("A", 4);
        store.addFile("B", 4);
        QCOMPARE(store.currentFile(), QString("A"));

        ScrollOptions options;
        options.behavior = ScrollBehavior::Instant;
        options.alignToTop = true;
        QVERIFY(coordinator.navigate(3, "B", options));
        QCOMPARE(store.currentFile(), QString("B"));
        QVERIFY(store.isFileChanging());

        QTRY_VERIFY(!coordinator.isBusy());
        QVERIFY(!store.isFileChanging());
        QCOMPARE(store.activePage("B"), 3);

        // Aligned with a small top margin
        const int margin = qRound(area->viewport()->height() * NavigationConfig().alignTopMarginFraction);
        QCOMPARE(area->verticalScrollBar()->value(),
                 qMin(2 * (PAGE_HEIGHT + PAGE_GAP) - margin, area->verticalScrollBar()->maximum()));
    }

    // A render completion cuts a retry backoff short
    void testRenderCompleteTriggersRetry() {
        QScopedPointer<QScrollArea> area(makeArea("A", 3));
        delete area->widget()->findChild<QWidget*>(ElementLocator::pageObjectName("A", 3));
        NavigationEventBus bus;
        PageStateStore store(&bus);
        ElementLocator locator;
        locator.setRoot(area->widget());
        NavigationCoordinator coordinator(&store, &locator, &bus);
        NavigationConfig config = fastConfig();
        config.retryBackoffMs = 60000;
        coordinator.setConfig(config);
        coordinator.setScrollArea(area.data());

        area->show();
        QVERIFY(QTest::qWaitForWindowExposed(area.data()));

        store.addFile("A", 3);
        QSignalSpy attemptSpy(&coordinator, &NavigationCoordinator::attemptStarted);
        QVERIFY(coordinator.navigate(3, "A"));
        QTRY_COMPARE(coordinator.phase(), NavigationPhase::Retrying);
        QCOMPARE(attemptSpy.count(), 1);

        // Page 3 arrives late
        auto* late = new QWidget(area->widget());
        late->setObjectName(ElementLocator::pageObjectName("A", 3));
        late->setGeometry(0, 2 * (PAGE_HEIGHT + PAGE_GAP), 360, PAGE_HEIGHT);
        late->show();

        coordinator.notifyRenderComplete("A", 3);
        QCOMPARE(attemptSpy.count(), 2);
        QTRY_COMPARE(coordinator.phase(), NavigationPhase::Completed);
    }
};

#endif // NAVIGATIONCOORDINATORTESTS_H
