#include "capturesession.hpp"

#include <QDebug>
#include <QRandomGenerator>

CaptureSession::CaptureSession(std::unique_ptr<IBrowserEngine> engine, QObject* parent)
	: QObject(parent), mEngine(std::move(engine)) {
	connect(mEngine.get(), &IBrowserEngine::launched, this, &CaptureSession::onLaunched);
	connect(mEngine.get(), &IBrowserEngine::launchFailed, this, &CaptureSession::onLaunchFailed);
}

CaptureSession::~CaptureSession() {
	stop();
}

void CaptureSession::start(const LaunchConfig& config) {
	if (mState != State::Unstarted) {
		qWarning() << "CaptureSession: start() called in state" << mState;
		return;
	}
	mState = State::Starting;
	qDebug() << "CaptureSession: launching" << mEngine->engineName();
	mEngine->launch(config);
}

void CaptureSession::onLaunched() {
	if (mState != State::Starting)
		return;
	mState = State::Running;
	emit started();
}

void CaptureSession::onLaunchFailed(const QString& message) {
	if (mState != State::Starting)
		return;
	mEngine->shutdown();
	mState = State::Closed;
	emit launchFailed(message);
}

void CaptureSession::stop() {
	if (mState == State::Starting || mState == State::Running)
		mEngine->shutdown();
	if (mState != State::Unstarted)
		mState = State::Closed;
}

std::unique_ptr<IBrowsingContext> CaptureSession::newIsolatedContext(const QStringList& userAgents,
                                                                     const QSize& viewport,
                                                                     QString* errorMessage) {
	if (mState != State::Running) {
		if (errorMessage)
			*errorMessage = QStringLiteral("Capture session is not running");
		return nullptr;
	}

	ContextOptions options;
	if (!userAgents.isEmpty())
		options.userAgent = userAgents.at(QRandomGenerator::global()->bounded(int(userAgents.size())));
	options.viewport = viewport;
	options.javaScriptEnabled = true;
	options.ignoreCertificateErrors = true;

	QString error;
	std::unique_ptr<IBrowsingContext> context(mEngine->createContext(options, &error));
	if (!context && errorMessage)
		*errorMessage = error.isEmpty() ? QStringLiteral("Browser refused to create a context") : error;
	return context;
}
