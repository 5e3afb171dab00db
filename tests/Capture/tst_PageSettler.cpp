#include <QtTest>

#include <QElapsedTimer>
#include <QSignalSpy>

#include "MockBrowserEngine.h"
#include "pagesettler.hpp"

class tst_PageSettler : public QObject {
	Q_OBJECT

private slots:
	void constantHeight_stopsAfterFirstComparison();
	void growingHeight_scrollsUntilStable();
	void endlessGrowth_stopsAtIterationCap();
	void shrinkingHeight_countsAsSettled();
	void pauseIsAppliedPerIteration();
	void negativePause_isTreatedAsZero();
};

static MockPage pageWithHeights(const QList<int>& heights) {
	MockPage page;
	page.heights = heights;
	return page;
}

static ContextOptions viewport(int w, int h) {
	ContextOptions options;
	options.viewport = QSize(w, h);
	return options;
}

void tst_PageSettler::constantHeight_stopsAfterFirstComparison() {
	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights({ 2400 }));

	PageSettler settler(&context, PageSettler::Config{ 0, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);
	settler.start();

	QVERIFY(spy.wait(1000));
	QCOMPARE(spy.first().first().toInt(), 1);
	QCOMPARE(context.scrollCalls(), 1);
	QCOMPARE(context.measureCalls(), 2);
	QCOMPARE(settler.lastHeight(), 2400);
}

void tst_PageSettler::growingHeight_scrollsUntilStable() {
	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights({ 1000, 2000, 3000, 3000 }));

	PageSettler settler(&context, PageSettler::Config{ 0, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);
	settler.start();

	QVERIFY(spy.wait(1000));
	QCOMPARE(spy.count(), 1);
	QCOMPARE(spy.first().first().toInt(), 3);
	QCOMPARE(context.scrollCalls(), 3);
	QCOMPARE(settler.lastHeight(), 3000);
}

void tst_PageSettler::endlessGrowth_stopsAtIterationCap() {
	QList<int> heights;
	for (int ix = 0; ix < 100; ++ix)
		heights << 1000 * (ix + 1);

	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights(heights));

	PageSettler settler(&context, PageSettler::Config{ 0, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);
	settler.start();

	QVERIFY(spy.wait(2000));
	QCOMPARE(spy.count(), 1);
	QCOMPARE(spy.first().first().toInt(), 30);
	QCOMPARE(context.scrollCalls(), 30);
	QCOMPARE(context.measureCalls(), 31);
}

void tst_PageSettler::shrinkingHeight_countsAsSettled() {
	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights({ 3000, 1500, 6000 }));

	PageSettler settler(&context, PageSettler::Config{ 0, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);
	settler.start();

	QVERIFY(spy.wait(1000));
	QCOMPARE(spy.first().first().toInt(), 1);
	QCOMPARE(settler.lastHeight(), 1500);
}

void tst_PageSettler::pauseIsAppliedPerIteration() {
	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights({ 1000, 2000, 2000 }));

	PageSettler settler(&context, PageSettler::Config{ 50, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);

	QElapsedTimer timer;
	timer.start();
	settler.start();

	QVERIFY(spy.wait(2000));
	QCOMPARE(spy.first().first().toInt(), 2);
	QVERIFY(timer.elapsed() >= 90);
}

void tst_PageSettler::negativePause_isTreatedAsZero() {
	MockBrowsingContext context(nullptr, viewport(1920, 1080));
	context.setPage(pageWithHeights({ 1000, 2000, 2000 }));

	PageSettler settler(&context, PageSettler::Config{ -1, 30 });
	QSignalSpy spy(&settler, &PageSettler::settled);
	settler.start();

	QVERIFY(spy.wait(1000));
	QCOMPARE(spy.count(), 1);
	QCOMPARE(spy.first().first().toInt(), 2);
	QCOMPARE(settler.lastHeight(), 2000);
}

QTEST_MAIN(tst_PageSettler)
#include "tst_PageSettler.moc"
