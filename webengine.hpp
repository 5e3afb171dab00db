#pragma once

#include "browser.hpp"

#include <QTimer>
#include <QWebEnginePage>
#include <QWebEngineUrlRequestInterceptor>

class QWebEngineCertificateError;
class QWebEngineLoadingInfo;
class QWebEngineProfile;
class QWebEngineView;

// Page-level hooks: certificate policy, JS dialogs and DOM readiness.
class CaptEnginePage : public QWebEnginePage {
	Q_OBJECT
public:
	CaptEnginePage(QWebEngineProfile* profile, QObject* parent = nullptr);

	void setInsecure(bool insecure);

	// Connected to certificateError; accepts only when insecure mode is on.
	void handleCertificateError(QWebEngineCertificateError error);

signals:
	void domContentLoaded();

protected:
	QStringList chooseFiles(FileSelectionMode mode, const QStringList& oldFiles,
	                        const QStringList& acceptedMimeTypes) override;

	void javaScriptAlert(const QUrl& securityOrigin, const QString& msg) override;
	bool javaScriptConfirm(const QUrl& securityOrigin, const QString& msg) override;
	bool javaScriptPrompt(const QUrl& securityOrigin, const QString& msg, const QString& defaultValue,
	                      QString* result) override;
	void javaScriptConsoleMessage(JavaScriptConsoleMessageLevel level, const QString& message,
	                              int lineNumber, const QString& sourceID) override;

private:
	bool mInsecure{ false };
};

// Aborts requests for heavy media before they reach the network.
class CaptRequestInterceptor : public QWebEngineUrlRequestInterceptor {
	Q_OBJECT
public:
	explicit CaptRequestInterceptor(QObject* parent = nullptr);

	void setBlockedExtensions(const QStringList& extensions);
	void interceptRequest(QWebEngineUrlRequestInfo& info) override;

	static bool isBlockedPath(const QString& path, const QStringList& extensions);

private:
	QStringList mBlockedExtensions;
};

class WebEngineContext : public IBrowsingContext {
	Q_OBJECT
public:
	WebEngineContext(const ContextOptions& options, bool headless, QObject* parent = nullptr);
	~WebEngineContext() override;

	void setBlockedExtensions(const QStringList& extensions) override;
	void navigate(const QUrl& url, StatusCallback done) override;
	void measureScrollHeight(std::function<void(int)> done) override;
	void scrollBy(int dy) override;
	QSize viewportSize() const override;
	void captureFullPage(const QString& path, StatusCallback done) override;
	void close() override;

private slots:
	void onLoadingChanged(const QWebEngineLoadingInfo& info);
	void onDomContentLoaded();
	void onRenderProcessTerminated(QWebEnginePage::RenderProcessTerminationStatus status, int exitCode);

private:
	void finishNavigation(const CaptureStatus& status);
	void saveSnapshot(const QString& path, const QSize& size, StatusCallback done);

	ContextOptions mOptions;
	QWebEngineProfile* mProfile{ nullptr };
	CaptRequestInterceptor* mInterceptor{ nullptr };
	QWebEngineView* mView{ nullptr };
	CaptEnginePage* mPage{ nullptr };
	StatusCallback mNavigationDone;
	bool mClosed{ false };
};

class WebEngineBrowser : public IBrowserEngine {
	Q_OBJECT
public:
	explicit WebEngineBrowser(QObject* parent = nullptr);
	~WebEngineBrowser() override;

	void launch(const LaunchConfig& config) override;
	void shutdown() override;
	IBrowsingContext* createContext(const ContextOptions& options, QString* errorMessage) override;
	QString engineName() const override { return QStringLiteral("QtWebEngine"); }

	// Chromium switches derived from the launch flags.
	static QByteArray chromiumFlags(const LaunchConfig& config);

private slots:
	void onProbeLoaded(bool ok);
	void onLaunchTimeout();

private:
	void releaseProbe();
	void failLaunch(const QString& message);

	LaunchConfig mConfig;
	bool mRunning{ false };
	QWebEngineProfile* mProbeProfile{ nullptr };
	QWebEnginePage* mProbePage{ nullptr };
	QTimer mLaunchTimer;
};
