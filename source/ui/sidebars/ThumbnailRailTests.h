#ifndef THUMBNAILRAILTESTS_H
#define THUMBNAILRAILTESTS_H

#include <QObject>
#include <QTest>
#include <QSignalSpy>
#include "ThumbnailRail.h"
#include "../PageThumbnailModel.h"
#include "../../core/ViewportNavigation.h"
#include "../../core/NavigationEventBus.h"
#include "../../core/PageStateStore.h"
#include "../../core/NavigationCoordinator.h"

/**
 * Unit tests for ThumbnailRail.
 * Run with: syncview_tests --test-thumbnails
 */
class ThumbnailRailTests : public QObject {
    Q_OBJECT

private:
    static NavigationConfig fastConfig() {
        NavigationConfig config;
        config.eventThrottleMs = 0;
        config.thumbnailHighlightDurationMs = 80;
        return config;
    }

private slots:
    void initTestCase() {
        registerNavigationMetaTypes();
    }

    // The rail follows the current file of the page state
    void testFollowsCurrentFile() {
        ViewportNavigation navigation(fastConfig());
        navigation.loadFile("A", 4);
        navigation.loadFile("B", 9);

        ThumbnailRail rail;
        rail.setNavigation(&navigation);
        QCOMPARE(rail.fileKey(), QString("A"));
        QCOMPARE(rail.model()->rowCount(), 4);

        QVERIFY(navigation.activateFile("B"));
        QCOMPARE(rail.fileKey(), QString("B"));
        QCOMPARE(rail.model()->rowCount(), 9);

        navigation.unloadFile("B");
        QCOMPARE(rail.fileKey(), QString("A"));
    }

    // Page changes from elsewhere move the marker and pulse the thumbnail
    void testExternalPageChangePulses() {
        ViewportNavigation navigation(fastConfig());
        navigation.loadFile("A", 10);
        ThumbnailRail rail;
        rail.setNavigation(&navigation);

        navigation.eventBus()->publishPageChanged("A", 4, NavigationSource::Toolbar);
        QTRY_VERIFY(rail.isPulsing());
        QCOMPARE(rail.model()->currentPage(), 4);
        QCOMPARE(rail.model()->highlightedPage(), 4);
        QVERIFY(rail.model()->indexForPage(4).data(PageThumbnailModel::IsHighlightedRole).toBool());

        // Pulse fades on its own
        QTRY_VERIFY(!rail.isPulsing());
        QCOMPARE(rail.model()->highlightedPage(), 0);
        QCOMPARE(rail.model()->currentPage(), 4);
    }

    // Events the rail caused itself never echo back into it
    void testOwnEventsDoNotEcho() {
        ViewportNavigation navigation(fastConfig());
        navigation.loadFile("A", 10);
        ThumbnailRail rail;
        rail.setNavigation(&navigation);

        QSignalSpy busSpy(navigation.eventBus(), &NavigationEventBus::pageChanged);
        navigation.eventBus()->publishPageChanged("A", 5, NavigationSource::Thumbnails);
        QTRY_COMPARE(busSpy.count(), 1);

        QVERIFY(!rail.isPulsing());
        QCOMPARE(rail.model()->highlightedPage(), 0);
    }

    // Events for files that are not shown are ignored
    void testOtherFileEventsIgnored() {
        ViewportNavigation navigation(fastConfig());
        navigation.loadFile("A", 10);
        navigation.loadFile("B", 10);
        ThumbnailRail rail;
        rail.setNavigation(&navigation);

        QSignalSpy busSpy(navigation.eventBus(), &NavigationEventBus::pageChanged);
        navigation.eventBus()->publishPageChanged("B", 7, NavigationSource::Toolbar);
        QTRY_COMPARE(busSpy.count(), 1);

        QCOMPARE(rail.fileKey(), QString("A"));
        QVERIFY(!rail.isPulsing());
        QCOMPARE(rail.model()->currentPage(), 1);
    }

    // Clicking a thumbnail requests navigation under the thumbnails source
    void testRequestPage() {
        NavigationConfig config = fastConfig();
        config.preExecutionDelayMs = 10000; // Keep the request in flight
        ViewportNavigation navigation(config);
        navigation.loadFile("A", 10);
        ThumbnailRail rail;
        rail.setNavigation(&navigation);
        QSignalSpy requestSpy(&rail, &ThumbnailRail::pageRequested);

        QVERIFY(rail.requestPage(6));
        QCOMPARE(requestSpy.count(), 1);
        QVERIFY(requestSpy.takeFirst().at(2).toBool());
        QCOMPARE(rail.model()->currentPage(), 6);
        QCOMPARE(navigation.pageState()->currentPage("A"), 6);
        QCOMPARE(navigation.coordinator()->currentRequest().source, NavigationSource::Thumbnails);

        // Second click while the first is still running is refused
        QVERIFY(!rail.requestPage(2));
        QCOMPARE(requestSpy.count(), 1);
        QVERIFY(!requestSpy.takeFirst().at(2).toBool());
        QCOMPARE(rail.model()->currentPage(), 6);
    }

    // Unbinding stops listening
    void testUnbind() {
        ViewportNavigation navigation(fastConfig());
        navigation.loadFile("A", 10);
        ThumbnailRail rail;
        rail.setNavigation(&navigation);
        QCOMPARE(navigation.eventBus()->subscriberCount(), 1);

        rail.setNavigation(nullptr);
        QCOMPARE(navigation.eventBus()->subscriberCount(), 0);
        QVERIFY(!rail.requestPage(3));
    }
};

#endif // THUMBNAILRAILTESTS_H
