////////////////////////////////////////////////////////////////////
//
// BatchCapt - Qt WebEngine backend
//
////////////////////////////////////////////////////////////////////

#include "webengine.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QImage>
#include <QLibraryInfo>
#include <QPainter>
#include <QPixmap>
#include <QPointer>
#include <QVariantMap>
#include <QWebEngineCertificateError>
#include <QWebEngineLoadingInfo>
#include <QWebEngineProfile>
#include <QWebEngineScript>
#include <QWebEngineScriptCollection>
#include <QWebEngineSettings>
#include <QWebEngineUrlRequestInfo>
#include <QWebEngineView>

#include <algorithm>

static const char kDomReadyMarker[] = "__batchcapt_dom_ready__";

// Upper bound for the rendered page; taller documents are cut.
static const int kMaxCaptureHeight = 16384;

// Time given to the compositor after resizing the view to the content.
static const int kRepaintDelayMs = 500;

////////////////////////////////////////////////////////////////////
// CaptEnginePage
////////////////////////////////////////////////////////////////////

CaptEnginePage::CaptEnginePage(QWebEngineProfile* profile, QObject* parent)
	: QWebEnginePage(profile, parent) {
	QObject::connect(this, &QWebEnginePage::certificateError, this,
	                 [this](QWebEngineCertificateError error) { handleCertificateError(error); });
}

void CaptEnginePage::setInsecure(bool insecure) {
	mInsecure = insecure;
}

void CaptEnginePage::handleCertificateError(QWebEngineCertificateError error) {
	if (!mInsecure)
		return;

	if (error.isOverridable())
		error.acceptCertificate();
}

QStringList CaptEnginePage::chooseFiles(FileSelectionMode /*mode*/, const QStringList& /*oldFiles*/,
                                       const QStringList& /*acceptedMimeTypes*/) {
	return {};
}

void CaptEnginePage::javaScriptAlert(const QUrl& /*securityOrigin*/, const QString& msg) {
	qDebug() << "CaptEnginePage: [alert]" << msg;
}

bool CaptEnginePage::javaScriptConfirm(const QUrl& /*securityOrigin*/, const QString& /*msg*/) {
	return true;
}

bool CaptEnginePage::javaScriptPrompt(const QUrl& /*securityOrigin*/, const QString& /*msg*/,
                                     const QString& /*defaultValue*/, QString* result) {
	if (result) *result = QString();
	return true;
}

void CaptEnginePage::javaScriptConsoleMessage(JavaScriptConsoleMessageLevel /*level*/,
                                             const QString& message, int /*lineNumber*/,
                                             const QString& /*sourceID*/) {
	if (message == QLatin1String(kDomReadyMarker))
		emit domContentLoaded();
}

////////////////////////////////////////////////////////////////////
// CaptRequestInterceptor
////////////////////////////////////////////////////////////////////

CaptRequestInterceptor::CaptRequestInterceptor(QObject* parent)
	: QWebEngineUrlRequestInterceptor(parent) {}

void CaptRequestInterceptor::setBlockedExtensions(const QStringList& extensions) {
	mBlockedExtensions = extensions;
}

bool CaptRequestInterceptor::isBlockedPath(const QString& path, const QStringList& extensions) {
	const int dot = path.lastIndexOf(QLatin1Char('.'));
	if (dot < 0 || dot < path.lastIndexOf(QLatin1Char('/')))
		return false;
	return extensions.contains(path.mid(dot + 1), Qt::CaseInsensitive);
}

void CaptRequestInterceptor::interceptRequest(QWebEngineUrlRequestInfo& info) {
	// Called on the UI thread for profile-level interceptors.
	if (isBlockedPath(info.requestUrl().path(), mBlockedExtensions))
		info.block(true);
}

////////////////////////////////////////////////////////////////////
// WebEngineContext
////////////////////////////////////////////////////////////////////

WebEngineContext::WebEngineContext(const ContextOptions& options, bool headless, QObject* parent)
	: IBrowsingContext(parent), mOptions(options) {
	// No storage name: off-the-record, so cookies and cache die with the context.
	mProfile = new QWebEngineProfile();
	mProfile->setHttpUserAgent(options.userAgent);

	mInterceptor = new CaptRequestInterceptor(mProfile);
	mProfile->setUrlRequestInterceptor(mInterceptor);

	QWebEngineScript domReady;
	domReady.setName(QStringLiteral("batchcapt-dom-ready"));
	domReady.setInjectionPoint(QWebEngineScript::DocumentReady);
	domReady.setRunsOnSubFrames(false);
	domReady.setWorldId(QWebEngineScript::ApplicationWorld);
	domReady.setSourceCode(QStringLiteral(
		"if (location.protocol === 'http:' || location.protocol === 'https:')"
		" console.log('%1');").arg(QLatin1String(kDomReadyMarker)));
	mProfile->scripts()->insert(domReady);

	mView = new QWebEngineView();
	mPage = new CaptEnginePage(mProfile, mView);
	mPage->setInsecure(options.ignoreCertificateErrors);
	mView->setPage(mPage);

	QWebEngineSettings* settings = mPage->settings();
	settings->setAttribute(QWebEngineSettings::JavascriptEnabled, options.javaScriptEnabled);
	settings->setAttribute(QWebEngineSettings::ShowScrollBars, false);

	connect(mPage, &QWebEnginePage::loadingChanged, this, &WebEngineContext::onLoadingChanged);
	connect(mPage, &CaptEnginePage::domContentLoaded, this, &WebEngineContext::onDomContentLoaded);
	connect(mPage, &QWebEnginePage::renderProcessTerminated, this, &WebEngineContext::onRenderProcessTerminated);

	if (headless)
		mView->setAttribute(Qt::WA_DontShowOnScreen, true);
	mView->setMinimumSize(options.viewport);
	mView->setMaximumSize(QSize(QWIDGETSIZE_MAX, QWIDGETSIZE_MAX));
	mView->resize(options.viewport);
	mView->show();
}

WebEngineContext::~WebEngineContext() {
	close();
}

void WebEngineContext::setBlockedExtensions(const QStringList& extensions) {
	if (mInterceptor)
		mInterceptor->setBlockedExtensions(extensions);
}

void WebEngineContext::navigate(const QUrl& url, StatusCallback done) {
	if (mClosed) {
		done(CaptureStatus::failure(FailureKind::Navigation, QStringLiteral("Context is closed")));
		return;
	}
	mNavigationDone = std::move(done);
	mPage->load(url);
}

void WebEngineContext::onDomContentLoaded() {
	finishNavigation(CaptureStatus::success());
}

void WebEngineContext::onLoadingChanged(const QWebEngineLoadingInfo& info) {
	switch (info.status()) {
		case QWebEngineLoadingInfo::LoadSucceededStatus:
			// Normally preceded by DOM readiness; covers pages the marker script misses.
			finishNavigation(CaptureStatus::success());
			break;
		case QWebEngineLoadingInfo::LoadFailedStatus:
			finishNavigation(CaptureStatus::failure(
				FailureKind::Navigation,
				QStringLiteral("%1 (code %2) at %3")
					.arg(info.errorString())
					.arg(info.errorCode())
					.arg(info.url().toString())));
			break;
		case QWebEngineLoadingInfo::LoadStoppedStatus:
			finishNavigation(CaptureStatus::failure(FailureKind::Navigation,
			                                        QStringLiteral("Navigation was stopped")));
			break;
		default:
			break;
	}
}

void WebEngineContext::onRenderProcessTerminated(QWebEnginePage::RenderProcessTerminationStatus status,
                                                 int exitCode) {
	if (mClosed)
		return;

	QString what;
	switch (status) {
		case QWebEnginePage::NormalTerminationStatus: what = QStringLiteral("exited"); break;
		case QWebEnginePage::AbnormalTerminationStatus: what = QStringLiteral("terminated abnormally"); break;
		case QWebEnginePage::CrashedTerminationStatus: what = QStringLiteral("crashed"); break;
		case QWebEnginePage::KilledTerminationStatus: what = QStringLiteral("was killed"); break;
	}
	const QString reason = QStringLiteral("Target crashed: render process %1 (exit code %2)").arg(what).arg(exitCode);
	qWarning() << "WebEngineContext:" << reason;

	// Outstanding runJavaScript callbacks are dropped by the engine.
	finishNavigation(CaptureStatus::failure(FailureKind::Navigation, reason));
	if (!mClosed)
		emit terminated(reason);
}

void WebEngineContext::finishNavigation(const CaptureStatus& status) {
	if (!mNavigationDone)
		return;
	StatusCallback done = std::move(mNavigationDone);
	mNavigationDone = nullptr;
	done(status);
}

void WebEngineContext::measureScrollHeight(std::function<void(int)> done) {
	if (mClosed) {
		done(0);
		return;
	}

	const QString js = QStringLiteral(R"(
		(function() {
			const de = document.documentElement;
			const body = document.body;
			return Math.max(de ? de.scrollHeight : 0, body ? body.scrollHeight : 0);
		})()
	)");

	QPointer<WebEngineContext> self(this);
	mPage->runJavaScript(js, QWebEngineScript::ApplicationWorld, [self, done](const QVariant& v) {
		if (!self || self->mClosed)
			return;
		done(v.toInt());
	});
}

void WebEngineContext::scrollBy(int dy) {
	if (mClosed)
		return;
	mPage->runJavaScript(QStringLiteral("window.scrollBy(0, %1);").arg(dy),
	                     QWebEngineScript::ApplicationWorld);
}

QSize WebEngineContext::viewportSize() const {
	return mOptions.viewport;
}

void WebEngineContext::captureFullPage(const QString& path, StatusCallback done) {
	if (mClosed) {
		done(CaptureStatus::failure(FailureKind::Capture, QStringLiteral("Context is closed")));
		return;
	}

	// Ask the DOM for the scroll size, then grow the view to cover all of it.
	const QString js = QStringLiteral(R"(
		(function() {
			const de = document.documentElement;
			const body = document.body;
			const w = Math.max(de ? de.scrollWidth : 0, body ? body.scrollWidth : 0, window.innerWidth || 0);
			const h = Math.max(de ? de.scrollHeight : 0, body ? body.scrollHeight : 0, window.innerHeight || 0);
			window.scrollTo(0, 0);
			return { width: w, height: h };
		})()
	)");

	QPointer<WebEngineContext> self(this);
	mPage->runJavaScript(js, QWebEngineScript::ApplicationWorld, [self, path, done](const QVariant& v) {
		if (!self || self->mClosed)
			return;

		const QVariantMap m = v.toMap();
		QSize size(m.value(QStringLiteral("width")).toInt(), m.value(QStringLiteral("height")).toInt());
		size = size.expandedTo(self->mOptions.viewport);
		if (size.height() > kMaxCaptureHeight) {
			qDebug() << "WebEngineContext: page height" << size.height() << "cut to" << kMaxCaptureHeight;
			size.setHeight(kMaxCaptureHeight);
		}

		self->mView->setMinimumSize(size);
		self->mView->resize(size);

		QTimer::singleShot(kRepaintDelayMs, self.data(), [self, path, size, done]() {
			if (!self || self->mClosed)
				return;
			self->saveSnapshot(path, size, done);
		});
	});
}

void WebEngineContext::saveSnapshot(const QString& path, const QSize& size, StatusCallback done) {
	QPixmap px = mView->grab();

	bool saved = false;
	if (px.isNull()) {
		// No backing store yet; paint the view into an image instead.
		QImage image(size, QImage::Format_ARGB32);
		image.fill(Qt::white);
		QPainter painter;
		if (painter.begin(&image)) {
			mView->render(&painter);
			painter.end();
			saved = image.save(path, "png");
		}
	} else {
		saved = px.save(path, "png");
	}

	if (!saved) {
		done(CaptureStatus::failure(FailureKind::Capture,
		                            QStringLiteral("Failed to write screenshot '%1'").arg(path)));
		return;
	}
	done(CaptureStatus::success());
}

void WebEngineContext::close() {
	if (mClosed)
		return;
	mClosed = true;
	mNavigationDone = nullptr;

	if (mPage) {
		mPage->disconnect(this);
		mPage->triggerAction(QWebEnginePage::Stop);
	}

	// The page is a child of the view; it has to go before its profile.
	if (mView)
		mView->deleteLater();
	if (mProfile)
		mProfile->deleteLater();

	mView = nullptr;
	mPage = nullptr;
	mInterceptor = nullptr;
	mProfile = nullptr;
}

////////////////////////////////////////////////////////////////////
// WebEngineBrowser
////////////////////////////////////////////////////////////////////

WebEngineBrowser::WebEngineBrowser(QObject* parent) : IBrowserEngine(parent) {
	mLaunchTimer.setSingleShot(true);
	connect(&mLaunchTimer, &QTimer::timeout, this, &WebEngineBrowser::onLaunchTimeout);
}

WebEngineBrowser::~WebEngineBrowser() {
	shutdown();
}

QByteArray WebEngineBrowser::chromiumFlags(const LaunchConfig& config) {
	QByteArrayList flags;
	if (config.disableAutomationFlags)
		flags << "--disable-blink-features=AutomationControlled";
	flags << "--disable-dev-shm-usage" << "--disable-gpu";
	if (config.disableSandbox)
		flags << "--no-sandbox";
	return flags.join(' ');
}

void WebEngineBrowser::launch(const LaunchConfig& config) {
	mConfig = config;

	QString processPath = qEnvironmentVariable("QTWEBENGINEPROCESS_PATH");
	if (processPath.isEmpty())
		processPath = QLibraryInfo::path(QLibraryInfo::LibraryExecutablesPath) +
		              QStringLiteral("/QtWebEngineProcess");
	if (!QFileInfo(processPath).isExecutable()) {
		failLaunch(QStringLiteral("Browser engine binary not found at '%1'").arg(processPath));
		return;
	}

	// Chromium reads its switches once, when the first profile comes up.
	static QByteArray sAppliedFlags;
	const QByteArray flags = chromiumFlags(config);
	if (sAppliedFlags.isNull()) {
		QByteArray merged = qgetenv("QTWEBENGINE_CHROMIUM_FLAGS");
		if (!merged.isEmpty())
			merged += ' ';
		merged += flags;
		qputenv("QTWEBENGINE_CHROMIUM_FLAGS", merged);
		if (config.disableSandbox)
			qputenv("QTWEBENGINE_DISABLE_SANDBOX", "1");
		sAppliedFlags = flags;
	} else if (sAppliedFlags != flags) {
		qWarning() << "WebEngineBrowser: launch flags changed after engine start, keeping" << sAppliedFlags;
	}

	// Load an empty document to bring up the engine and a renderer process.
	mProbeProfile = new QWebEngineProfile();
	mProbePage = new QWebEnginePage(mProbeProfile);
	connect(mProbePage, &QWebEnginePage::loadFinished, this, &WebEngineBrowser::onProbeLoaded);

	mLaunchTimer.start(config.launchTimeoutMs);
	mProbePage->setHtml(QStringLiteral("<html><body></body></html>"));
}

void WebEngineBrowser::onProbeLoaded(bool ok) {
	mLaunchTimer.stop();
	releaseProbe();

	if (!ok) {
		failLaunch(QStringLiteral("Browser engine failed to render its first page"));
		return;
	}

	mRunning = true;
	emit launched();
}

void WebEngineBrowser::onLaunchTimeout() {
	releaseProbe();
	failLaunch(QStringLiteral("Browser launch timed out after %1 ms").arg(mConfig.launchTimeoutMs));
}

void WebEngineBrowser::failLaunch(const QString& message) {
	// Always report after launch() has returned.
	QTimer::singleShot(0, this, [this, message]() { emit launchFailed(message); });
}

void WebEngineBrowser::releaseProbe() {
	if (mProbePage) {
		mProbePage->disconnect(this);
		mProbePage->deleteLater();
		mProbePage = nullptr;
	}
	if (mProbeProfile) {
		mProbeProfile->deleteLater();
		mProbeProfile = nullptr;
	}
}

void WebEngineBrowser::shutdown() {
	mLaunchTimer.stop();
	releaseProbe();
	mRunning = false;
}

IBrowsingContext* WebEngineBrowser::createContext(const ContextOptions& options, QString* errorMessage) {
	if (!mRunning) {
		if (errorMessage)
			*errorMessage = QStringLiteral("Browser engine is not running");
		return nullptr;
	}
	return new WebEngineContext(options, mConfig.headless);
}
