#ifndef ELEMENTLOCATORTESTS_H
#define ELEMENTLOCATORTESTS_H

#include <QObject>
#include <QTest>
#include <QWidget>
#include "ElementLocator.h"

/**
 * Unit tests for ElementLocator.
 * Run with: syncview_tests --test-locator
 */
class ElementLocatorTests : public QObject {
    Q_OBJECT

private:
    static QWidget* makeTarget(QWidget* parent, const FileKey& fileKey, int pageNumber) {
        auto* w = new QWidget(parent);
        w->setObjectName(ElementLocator::pageObjectName(fileKey, pageNumber));
        w->setProperty(PageTargetProperty::FileKey, fileKey);
        w->setProperty(PageTargetProperty::PageNumber, pageNumber);
        return w;
    }

private slots:
    void testNamingConventions() {
        QCOMPARE(ElementLocator::pageObjectName("A", 3), QString("page:A:3"));
        QCOMPARE(ElementLocator::fileObjectName("A"), QString("file:A"));
    }

    void testDefaultStrategyOrder() {
        QWidget root;
        ElementLocator locator;
        locator.setRoot(&root);
        QCOMPARE(locator.strategyNames(),
                 QStringList({"object-name", "properties", "position"}));
    }

    // Exact object name wins
    void testLocateByObjectName() {
        QWidget root;
        QWidget* target = makeTarget(&root, "A", 2);
        makeTarget(&root, "A", 3);

        ElementLocator locator;
        locator.setRoot(&root);
        QCOMPARE(locator.locate("A", 2), target);
        QVERIFY(locator.locate("B", 2) == nullptr);
    }

    // Dynamic properties are enough when the object name is missing
    void testLocateByProperties() {
        QWidget root;
        auto* target = new QWidget(&root);
        target->setProperty(PageTargetProperty::FileKey, QString("A"));
        target->setProperty(PageTargetProperty::PageNumber, 4);

        ElementLocator locator;
        locator.setRoot(&root);
        QCOMPARE(locator.locate("A", 4), target);
    }

    // Positional fallback picks the Nth page of the file section in layout order
    void testLocateByPosition() {
        QWidget root;
        auto* section = new QWidget(&root);
        section->setObjectName(ElementLocator::fileObjectName("A"));

        // Created bottom-up on purpose; placeholders carry no usable identity
        QList<QWidget*> pages;
        for (int i = 0; i < 3; ++i) {
            auto* page = new QWidget(section);
            page->setProperty(PageTargetProperty::PageNumber, 0);
            page->move(0, (2 - i) * 100);
            pages.prepend(page);
        }
        new QWidget(section); // Header-like child without page identity

        ElementLocator locator;
        locator.setRoot(&root);
        QCOMPARE(locator.locate("A", 1), pages.at(0));
        QCOMPARE(locator.locate("A", 3), pages.at(2));
        QVERIFY(locator.locate("A", 4) == nullptr);
    }

    // Live hits come from the cache; misses are looked up again
    void testCacheBehaviour() {
        QWidget root;
        ElementLocator locator;
        locator.setRoot(&root);

        QVERIFY(locator.locate("A", 1) == nullptr);
        QCOMPARE(locator.cacheSize(), 1);

        QWidget* target = makeTarget(&root, "A", 1);
        QCOMPARE(locator.locate("A", 1), target);

        // Destroyed target falls through to the strategies again
        delete target;
        QWidget* recreated = makeTarget(&root, "A", 1);
        QCOMPARE(locator.locate("A", 1), recreated);

        // warm() bypasses a live cached entry
        recreated->setObjectName(QString());
        recreated->setProperty(PageTargetProperty::PageNumber, QVariant());
        QWidget* other = makeTarget(&root, "A", 1);
        QCOMPARE(locator.locate("A", 1), recreated);
        QCOMPARE(locator.warm("A", 1), other);
    }

    void testInvalidateFile() {
        QWidget root;
        makeTarget(&root, "A", 1);
        makeTarget(&root, "A", 2);
        makeTarget(&root, "AB", 1);
        makeTarget(&root, "A:1", 2);

        ElementLocator locator;
        locator.setRoot(&root);
        locator.locate("A", 1);
        locator.locate("A", 2);
        locator.locate("AB", 1);
        locator.locate("A:1", 2);
        QCOMPARE(locator.cacheSize(), 4);

        // Only exact file matches go, even when another key starts with it
        locator.invalidateFile("A");
        QCOMPARE(locator.cacheSize(), 2);

        locator.invalidateFile("A:1");
        QCOMPARE(locator.cacheSize(), 1);

        locator.clearCache();
        QCOMPARE(locator.cacheSize(), 0);
    }

    // Custom strategies run in priority order
    void testCustomStrategies() {
        QWidget root;
        QWidget first;
        QWidget second;

        ElementLocator locator;
        QStringList calls;
        locator.setStrategies({});
        locator.addStrategy("never", [&](const FileKey&, int) -> QWidget* {
            calls << "never";
            return nullptr;
        });
        locator.addStrategy("first", [&](const FileKey&, int) -> QWidget* {
            calls << "first";
            return &first;
        });
        locator.addStrategy("second", [&](const FileKey&, int) -> QWidget* {
            calls << "second";
            return &second;
        });
        locator.addStrategy("null", ElementLocator::MatchFunction());

        QCOMPARE(locator.strategyNames().size(), 3);
        QCOMPARE(locator.locate("A", 1), &first);
        QCOMPARE(calls, QStringList({"never", "first"}));
    }

    // A new root keeps caller-supplied strategies
    void testSetRootKeepsCustomStrategies() {
        QWidget root;
        QWidget custom;
        makeTarget(&root, "A", 1);

        ElementLocator locator;
        ElementLocator::Strategy strategy;
        strategy.name = "custom";
        strategy.match = [&](const FileKey&, int) -> QWidget* { return &custom; };
        locator.setStrategies(QVector<ElementLocator::Strategy>{strategy});
        locator.setRoot(&root);
        QCOMPARE(locator.strategyNames(), QStringList({"custom"}));
        QCOMPARE(locator.locate("A", 1), &custom);

        locator.useDefaultStrategies();
        QCOMPARE(locator.strategyNames(),
                 QStringList({"object-name", "properties", "position"}));
        QCOMPARE(locator.locate("A", 1)->objectName(), QString("page:A:1"));
    }

    // Cache is dropped periodically
    void testPeriodicCacheReset() {
        QWidget root;
        makeTarget(&root, "A", 1);
        ElementLocator locator;
        locator.setRoot(&root);
        locator.setCacheResetInterval(20);

        locator.locate("A", 1);
        QCOMPARE(locator.cacheSize(), 1);
        QTRY_COMPARE(locator.cacheSize(), 0);
    }
};

#endif // ELEMENTLOCATORTESTS_H
