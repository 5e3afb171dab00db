#pragma once

#include "captureconfig.hpp"
#include "outcome.hpp"

#include <QObject>
#include <QSize>
#include <QString>
#include <QStringList>
#include <QUrl>

#include <functional>

using StatusCallback = std::function<void(const CaptureStatus&)>;

// Per-context options, fixed when the context is created.
struct ContextOptions {
	QString userAgent;
	QSize viewport{ 1920, 1080 };
	bool javaScriptEnabled{ true };
	bool ignoreCertificateErrors{ true };
};

/**
 * One isolated browsing sandbox: its own cookie jar, cache, user agent and
 * navigation state. Callbacks run on the owning thread's event loop and are
 * never invoked after close(). After terminated() no pending callback runs.
 */
class IBrowsingContext : public QObject {
	Q_OBJECT
public:
	explicit IBrowsingContext(QObject* parent = nullptr) : QObject(parent) {}
	~IBrowsingContext() override = default;

	// Requests whose URL path ends in one of these extensions are aborted.
	virtual void setBlockedExtensions(const QStringList& extensions) = 0;

	// Completes once the DOM content of the main frame is parsed, or on failure.
	virtual void navigate(const QUrl& url, StatusCallback done) = 0;

	// Current document scroll height in CSS pixels, 0 if unavailable.
	virtual void measureScrollHeight(std::function<void(int)> done) = 0;
	virtual void scrollBy(int dy) = 0;

	virtual QSize viewportSize() const = 0;

	// Saves the whole scrollable page area as PNG.
	virtual void captureFullPage(const QString& path, StatusCallback done) = 0;

	// Releases every engine resource. Idempotent.
	virtual void close() = 0;

signals:
	// The page's renderer went away; the context is unusable from here on.
	void terminated(const QString& reason);
};

/**
 * The shared browser process. launch() reports through launched() or
 * launchFailed(), always after it returns.
 */
class IBrowserEngine : public QObject {
	Q_OBJECT
public:
	explicit IBrowserEngine(QObject* parent = nullptr) : QObject(parent) {}
	~IBrowserEngine() override = default;

	virtual void launch(const LaunchConfig& config) = 0;
	virtual void shutdown() = 0;

	// Caller owns the returned context. Returns nullptr and sets *errorMessage
	// if the engine cannot provide one.
	virtual IBrowsingContext* createContext(const ContextOptions& options, QString* errorMessage) = 0;

	virtual QString engineName() const = 0;

signals:
	void launched();
	void launchFailed(const QString& message);
};
