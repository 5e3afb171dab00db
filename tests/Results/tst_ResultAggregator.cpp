#include <QtTest>

#include <QFile>
#include <QImage>
#include <QSignalSpy>
#include <QTemporaryDir>

#include <zip.h>

#include "batchcontext.hpp"
#include "resultaggregator.hpp"

class tst_ResultAggregator : public QObject {
	Q_OBJECT

private slots:
	void initTestCase();
	void recordAll_keepsReceiptOrder();
	void logLines_describeEachOutcome();
	void hasAnyArtifacts_requiresFileOnDisk();
	void archive_packsEveryArtifactOnce();
	void archive_skippedWithWarningWhenEmpty();
	void clear_forgetsArchive();
};

static QString writePng(const BatchContext& store, const QString& name) {
	const QString path = store.artifactPath(name);
	QImage image(4, 4, QImage::Format_RGB32);
	image.fill(Qt::blue);
	image.save(path, "PNG");
	return path;
}

static int zipEntryCount(const QString& path) {
	int err = 0;
	zip_t* za = zip_open(QFile::encodeName(path).constData(), ZIP_RDONLY, &err);
	if (!za)
		return -1;
	const int count = int(zip_get_num_entries(za, 0));
	zip_discard(za);
	return count;
}

void tst_ResultAggregator::initTestCase() {
	qRegisterMetaType<OutcomeRecord>();
}

void tst_ResultAggregator::recordAll_keepsReceiptOrder() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	ResultAggregator results(&store);
	QSignalSpy spy(&results, &ResultAggregator::appended);

	results.append(OutcomeRecord::failure(2, "https://b.com", FailureKind::Navigation, "boom"));
	results.append(OutcomeRecord::success(3, "https://c.com", "/tmp/3_c.com.png"));
	results.append(OutcomeRecord::success(1, "https://a.com", "/tmp/1_a.com.png"));

	QCOMPARE(spy.count(), 3);
	QCOMPARE(results.recordAll().size(), 3);
	QCOMPARE(results.recordAll().at(0).index(), 2);
	QCOMPARE(results.recordAll().at(1).index(), 3);
	QCOMPARE(results.recordAll().at(2).index(), 1);
	QCOMPARE(results.successCount(), 2);
	QCOMPARE(results.failureCount(), 1);
}

void tst_ResultAggregator::logLines_describeEachOutcome() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	ResultAggregator results(&store);

	results.append(OutcomeRecord::success(1, "https://a.com", "/tmp/1_a.com.png"));
	results.append(OutcomeRecord::failure(2, "https://b.invalid", FailureKind::Navigation,
	                                      "\n  net::ERR_NAME_NOT_RESOLVED  \nCall log:\n  - navigating"));

	const QStringList lines = results.logLines();
	QCOMPARE(lines.size(), 2);
	QCOMPARE(lines.at(0), QStringLiteral("Success: https://a.com"));
	QCOMPARE(lines.at(1), QStringLiteral("Error on https://b.invalid: net::ERR_NAME_NOT_RESOLVED"));
}

void tst_ResultAggregator::hasAnyArtifacts_requiresFileOnDisk() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	QVERIFY(store.reset());
	ResultAggregator results(&store);

	results.append(OutcomeRecord::failure(1, "https://a.com", FailureKind::Navigation, "x"));
	QVERIFY(!results.hasAnyArtifacts());

	results.append(OutcomeRecord::success(2, "https://b.com", store.artifactPath("2_b.com.png")));
	QVERIFY(!results.hasAnyArtifacts());

	writePng(store, "2_b.com.png");
	QVERIFY(results.hasAnyArtifacts());
}

void tst_ResultAggregator::archive_packsEveryArtifactOnce() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	QVERIFY(store.reset());
	ResultAggregator results(&store);

	results.append(OutcomeRecord::success(2, "https://a.com", writePng(store, "2_a.com.png")));
	results.append(OutcomeRecord::success(1, "https://a.com", writePng(store, "1_a.com.png")));

	QString warning;
	const QString path = results.archive(&warning);
	QVERIFY2(!path.isEmpty(), qPrintable(warning));
	QCOMPARE(path, store.archivePath());
	QCOMPARE(zipEntryCount(path), 2);

	const QDateTime created = QFileInfo(path).lastModified();
	QTest::qWait(20);
	QCOMPARE(results.archive(), path);
	QCOMPARE(QFileInfo(path).lastModified(), created);
}

void tst_ResultAggregator::archive_skippedWithWarningWhenEmpty() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	QVERIFY(store.reset());
	ResultAggregator results(&store);
	QSignalSpy spy(&results, &ResultAggregator::archiveWarning);

	results.append(OutcomeRecord::failure(1, "https://a.invalid", FailureKind::Navigation, "x"));

	QString warning;
	QVERIFY(results.archive(&warning).isEmpty());
	QVERIFY(!warning.isEmpty());
	QCOMPARE(spy.count(), 1);
	QVERIFY(!QFile::exists(store.archivePath()));
}

void tst_ResultAggregator::clear_forgetsArchive() {
	QTemporaryDir tempDir;
	BatchContext store(tempDir.filePath("shots"), tempDir.filePath("zips"));
	QVERIFY(store.reset());
	ResultAggregator results(&store);

	results.append(OutcomeRecord::success(1, "https://a.com", writePng(store, "1_a.com.png")));
	QVERIFY(!results.archive().isEmpty());

	results.clear();
	QVERIFY(results.recordAll().isEmpty());
	QVERIFY(results.archivePath().isEmpty());
	QVERIFY(!results.hasAnyArtifacts());
}

QTEST_MAIN(tst_ResultAggregator)
#include "tst_ResultAggregator.moc"
