#include <QtTest>

#include "captureconfig.hpp"
#include "webengine.hpp"

class tst_RequestInterceptor : public QObject {
	Q_OBJECT

private slots:
	void isBlockedPath_data();
	void isBlockedPath();
	void chromiumFlags_followLaunchConfig();
};

void tst_RequestInterceptor::isBlockedPath_data() {
	QTest::addColumn<QString>("path");
	QTest::addColumn<bool>("blocked");

	QTest::newRow("png") << "/static/logo.png" << true;
	QTest::newRow("upper-case") << "/IMG/PHOTO.JPEG" << true;
	QTest::newRow("font") << "/fonts/inter.woff2" << true;
	QTest::newRow("video") << "/media/intro.mp4" << true;
	QTest::newRow("svg") << "/icons/sprite.svg" << true;
	QTest::newRow("script") << "/app/main.js" << false;
	QTest::newRow("stylesheet") << "/app/site.css" << false;
	QTest::newRow("document") << "/" << false;
	QTest::newRow("dot-in-directory") << "/assets.png/index" << false;
	QTest::newRow("extension-prefix") << "/download.pngx" << false;
}

void tst_RequestInterceptor::isBlockedPath() {
	QFETCH(QString, path);
	QFETCH(bool, blocked);

	QCOMPARE(CaptRequestInterceptor::isBlockedPath(path, CaptureConfig::defaultBlockedExtensions()), blocked);
}

void tst_RequestInterceptor::chromiumFlags_followLaunchConfig() {
	LaunchConfig config;
	QByteArray flags = WebEngineBrowser::chromiumFlags(config);
	QVERIFY(flags.contains("--disable-blink-features=AutomationControlled"));
	QVERIFY(flags.contains("--disable-dev-shm-usage"));
	QVERIFY(flags.contains("--disable-gpu"));
	QVERIFY(flags.contains("--no-sandbox"));

	config.disableAutomationFlags = false;
	config.disableSandbox = false;
	flags = WebEngineBrowser::chromiumFlags(config);
	QVERIFY(!flags.contains("AutomationControlled"));
	QVERIFY(!flags.contains("--no-sandbox"));
	QVERIFY(flags.contains("--disable-gpu"));
}

QTEST_APPLESS_MAIN(tst_RequestInterceptor)
#include "tst_RequestInterceptor.moc"
