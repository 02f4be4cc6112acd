#ifndef NAVIGATIONEVENTBUSTESTS_H
#define NAVIGATIONEVENTBUSTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "NavigationEventBus.h"
#include "NavigationConfig.h"

/**
 * Unit tests for NavigationEventBus.
 * Run with: syncview_tests --test-eventbus
 */
class NavigationEventBusTests : public QObject {
    Q_OBJECT

private:
    static NavigationConfig fastConfig() {
        NavigationConfig config;
        config.eventThrottleMs = 10;
        config.reentrancyWindowMs = 30;
        return config;
    }

private slots:
    void initTestCase() {
        registerNavigationMetaTypes();
    }

    // Several publishes inside the throttle window deliver once, with the last page
    void testThrottleCoalescesToLatest() {
        NavigationEventBus bus;
        bus.setConfig(fastConfig());
        QSignalSpy spy(&bus, &NavigationEventBus::pageChanged);

        QVERIFY(bus.publishPageChanged("A", 3, "scroll"));
        QVERIFY(bus.publishPageChanged("A", 4, "scroll"));
        QVERIFY(bus.publishPageChanged("A", 5, "scroll"));
        QCOMPARE(spy.count(), 0); // Nothing synchronous

        QTRY_COMPARE(spy.count(), 1);
        const PageChangedEvent event = spy.takeFirst().at(0).value<PageChangedEvent>();
        QCOMPARE(event.fileKey, QString("A"));
        QCOMPARE(event.pageNumber, 5);
        QCOMPARE(event.source, QString("scroll"));

        // No late duplicate
        QTest::qWait(50);
        QCOMPARE(spy.count(), 0);
    }

    // Different sources are throttled independently
    void testSourcesThrottledIndependently() {
        NavigationEventBus bus;
        bus.setConfig(fastConfig());
        QSignalSpy spy(&bus, &NavigationEventBus::pageChanged);

        bus.publishPageChanged("A", 2, "toolbar");
        bus.publishPageChanged("A", 7, "thumbnails");

        QTRY_COMPARE(spy.count(), 2);
    }

    // A source cannot publish again while its own event is being dispatched
    void testReentrantPublishIsDropped() {
        NavigationEventBus bus;
        bus.setConfig(fastConfig());

        bool reentrantAccepted = true;
        int deliveries = 0;
        connect(&bus, &NavigationEventBus::pageChanged, this,
                [&](const PageChangedEvent& event) {
            ++deliveries;
            if (event.pageNumber == 1) {
                reentrantAccepted = bus.publishPageChanged("A", 2, event.source);
            }
        });

        bus.publishPageChanged("A", 1, "scroll");
        QTRY_COMPARE(deliveries, 1);
        QVERIFY(!reentrantAccepted);
        QVERIFY(bus.isSourceActive("scroll"));

        // Released after the re-entrancy window
        QTRY_VERIFY(!bus.isSourceActive("scroll"));
        QVERIFY(bus.publishPageChanged("A", 3, "scroll"));
        QTRY_COMPARE(deliveries, 2);
    }

    // Manual mode holds the latest event and delivers it once on release
    void testManualModeFlushesLatestOnce() {
        NavigationEventBus bus;
        bus.setConfig(fastConfig());
        QSignalSpy spy(&bus, &NavigationEventBus::pageChanged);
        QSignalSpy visibilitySpy(&bus, &NavigationEventBus::visibilityChanged);

        bus.setManualMode(true);
        QVERIFY(bus.isManualMode());
        QVERIFY(!bus.publishPageChanged("A", 2, "scroll"));
        QVERIFY(!bus.publishPageChanged("A", 9, "scroll"));
        QVERIFY(!bus.publishVisibilityChanged("A", 9, 0.8));
        QTest::qWait(40);
        QCOMPARE(spy.count(), 0);
        QCOMPARE(visibilitySpy.count(), 0);

        bus.setManualMode(false);
        QCOMPARE(spy.count(), 1);
        QCOMPARE(spy.takeFirst().at(0).value<PageChangedEvent>().pageNumber, 9);

        // Releasing again delivers nothing further
        bus.setManualMode(true);
        bus.setManualMode(false);
        QCOMPARE(spy.count(), 0);
    }

    // Named subscribers never hear their own events
    void testSubscriberSkipsOwnSource() {
        NavigationEventBus bus;
        bus.setConfig(fastConfig());

        QList<int> thumbnailPages;
        QList<int> panelPages;
        bus.subscribe("thumbnails", [&](const PageChangedEvent& e) { thumbnailPages.append(e.pageNumber); });
        bus.subscribe("outline", [&](const PageChangedEvent& e) { panelPages.append(e.pageNumber); });
        QCOMPARE(bus.subscriberCount(), 2);

        bus.publishPageChanged("A", 4, "thumbnails");
        QTRY_COMPARE(panelPages.size(), 1);
        QVERIFY(thumbnailPages.isEmpty());

        bus.publishPageChanged("A", 6, "navigation-coordinator");
        QTRY_COMPARE(thumbnailPages.size(), 1);
        QCOMPARE(thumbnailPages.first(), 6);
        QCOMPARE(panelPages.size(), 2);

        bus.unsubscribe("outline");
        QCOMPARE(bus.subscriberCount(), 1);
    }

    // Scroll failures and render completions are delivered immediately
    void testImmediateEvents() {
        NavigationEventBus bus;
        QSignalSpy failedSpy(&bus, &NavigationEventBus::scrollFailed);
        QSignalSpy renderSpy(&bus, &NavigationEventBus::renderComplete);

        bus.publishScrollFailed("A", 7, ScrollFailureReason::TargetNotFound, 3);
        bus.publishRenderComplete("A", 2);

        QCOMPARE(failedSpy.count(), 1);
        const ScrollFailedEvent failed = failedSpy.takeFirst().at(0).value<ScrollFailedEvent>();
        QCOMPARE(failed.pageNumber, 7);
        QCOMPARE(failed.attempts, 3);
        QCOMPARE(failed.reason, ScrollFailureReason::TargetNotFound);
        QCOMPARE(renderSpy.count(), 1);
    }

    // History is bounded and newest first
    void testEventHistory() {
        NavigationEventBus bus;
        for (int i = 1; i <= NavigationEventBus::MAX_EVENT_HISTORY + 5; ++i) {
            bus.publishRenderComplete("A", i);
        }

        const QVector<NavigationEventBus::EventRecord> history = bus.recentEvents();
        QCOMPARE(history.size(), NavigationEventBus::MAX_EVENT_HISTORY);
        QCOMPARE(history.first().pageNumber, NavigationEventBus::MAX_EVENT_HISTORY + 5);
        QCOMPARE(history.first().type, QString("render-complete"));
    }

    // Injected clock stamps events
    void testClockInjection() {
        NavigationEventBus bus;
        bus.setClock([]() -> qint64 { return 42; });
        QSignalSpy spy(&bus, &NavigationEventBus::renderComplete);

        bus.publishRenderComplete("A", 1);
        QCOMPARE(spy.takeFirst().at(0).value<RenderCompleteEvent>().timestamp, qint64(42));
    }
};

#endif // NAVIGATIONEVENTBUSTESTS_H
