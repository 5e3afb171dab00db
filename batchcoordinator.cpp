#include "batchcoordinator.hpp"

#include "batchcontext.hpp"
#include "browser.hpp"
#include "capturesession.hpp"
#include "capturetask.hpp"
#include "resultaggregator.hpp"

#include <QDebug>
#include <QTimer>

BatchCoordinator::BatchCoordinator(BatchContext* store, EngineFactory engineFactory, QObject* parent)
	: QObject(parent),
	  mStore(store),
	  mEngineFactory(std::move(engineFactory)),
	  mResults(new ResultAggregator(store, this)) {}

BatchCoordinator::~BatchCoordinator() {
	if (mSession)
		mSession->stop();
}

bool BatchCoordinator::start(const QList<Address>& addresses, QString* errorMessage) {
	if (mRunning) {
		if (errorMessage)
			*errorMessage = QStringLiteral("A batch is already running");
		return false;
	}

	if (!flush(errorMessage))
		return false;

	mAddresses = addresses;
	mNextIndex = 0;
	mInFlight = 0;
	mPeakInFlight = 0;
	mRun.submitted = int(addresses.size());
	mRun.completed = 0;
	mRunning = true;

	if (addresses.isEmpty()) {
		QTimer::singleShot(0, this, &BatchCoordinator::complete);
		return true;
	}

	std::unique_ptr<IBrowserEngine> engine = mEngineFactory();
	if (!engine) {
		mRunning = false;
		if (errorMessage)
			*errorMessage = QStringLiteral("No browser engine available");
		return false;
	}

	mSession = new CaptureSession(std::move(engine), this);
	connect(mSession, &CaptureSession::started, this, &BatchCoordinator::onSessionStarted);
	connect(mSession, &CaptureSession::launchFailed, this, &BatchCoordinator::onLaunchFailed);

	emit sessionStarting(mRun.submitted);
	mSession->start(mConfig.launch);
	return true;
}

bool BatchCoordinator::flush(QString* errorMessage) {
	if (mRunning) {
		if (errorMessage)
			*errorMessage = QStringLiteral("Cannot flush while a batch is running");
		return false;
	}

	releaseSession();
	mResults->clear();
	mRun = BatchRun();
	return mStore->reset(errorMessage);
}

void BatchCoordinator::onSessionStarted() {
	emit sessionStarted();
	dispatch();
}

void BatchCoordinator::onLaunchFailed(const QString& message) {
	qWarning() << "BatchCoordinator: browser launch failed:" << message;
	releaseSession();
	mRunning = false;
	emit batchFailed(message);
}

void BatchCoordinator::dispatch() {
	const int limit = mMaxParallel > 0 ? mMaxParallel : int(mAddresses.size());

	while (mRunning && mInFlight < limit && mNextIndex < mAddresses.size()) {
		const int index = mNextIndex++;
		auto* task = new CaptureTask(index + 1, mAddresses.at(index), mSession, mStore, mConfig, this);
		connect(task, &CaptureTask::finished, this,
		        [this, task](const OutcomeRecord& outcome) { onTaskFinished(task, outcome); });

		++mInFlight;
		mPeakInFlight = qMax(mPeakInFlight, mInFlight);
		task->start();
	}
}

void BatchCoordinator::onTaskFinished(CaptureTask* task, const OutcomeRecord& outcome) {
	task->deleteLater();
	--mInFlight;
	++mRun.completed;

	mResults->append(outcome);
	emit progress(ProgressEvent{ mRun.completed, mRun.submitted, outcome });

	if (mRun.isDone()) {
		complete();
		return;
	}
	dispatch();
}

void BatchCoordinator::complete() {
	if (!mRunning)
		return;
	if (mSession)
		mSession->stop();
	mRunning = false;
	emit batchFinished();
}

void BatchCoordinator::releaseSession() {
	if (!mSession)
		return;
	mSession->stop();
	mSession->disconnect(this);
	mSession->deleteLater();
	mSession = nullptr;
}
