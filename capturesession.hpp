#pragma once

#include "browser.hpp"

#include <QObject>

#include <memory>

// The one browser engine of a batch. Tasks draw isolated contexts from it.
class CaptureSession : public QObject {
	Q_OBJECT
public:
	enum class State { Unstarted, Starting, Running, Closed };
	Q_ENUM(State)

	explicit CaptureSession(std::unique_ptr<IBrowserEngine> engine, QObject* parent = nullptr);
	~CaptureSession() override;

	// Emits started() or launchFailed() once the engine has answered.
	void start(const LaunchConfig& config);

	// Idempotent; a no-op unless the engine was started.
	void stop();

	State state() const { return mState; }
	bool isRunning() const { return mState == State::Running; }

	// A fresh context with a user agent picked uniformly from userAgents.
	// Returns nullptr and sets *errorMessage unless the session is running.
	std::unique_ptr<IBrowsingContext> newIsolatedContext(const QStringList& userAgents,
	                                                     const QSize& viewport,
	                                                     QString* errorMessage);

	IBrowserEngine* engine() const { return mEngine.get(); }

signals:
	void started();
	void launchFailed(const QString& message);

private slots:
	void onLaunched();
	void onLaunchFailed(const QString& message);

private:
	std::unique_ptr<IBrowserEngine> mEngine;
	State mState{ State::Unstarted };
};
