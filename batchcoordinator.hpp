#pragma once

#include "address.hpp"
#include "captureconfig.hpp"
#include "outcome.hpp"

#include <QList>
#include <QObject>

#include <functional>
#include <memory>

class BatchContext;
class CaptureSession;
class CaptureTask;
class IBrowserEngine;
class ResultAggregator;

using EngineFactory = std::function<std::unique_ptr<IBrowserEngine>()>;

// Counters of the current batch; done iff completed == submitted.
struct BatchRun {
	int submitted{ 0 };
	int completed{ 0 };

	bool isDone() const { return completed == submitted; }
};

/**
 * Runs one capture task per address over a single capture session.
 *
 * Tasks are pulled from a queue by at most maxParallel workers (all of them
 * when maxParallel is 0). Every finished task is reported through progress()
 * in completion order; batchFinished() follows exactly once, after the session
 * has been stopped. A launch failure ends the batch with batchFailed() instead,
 * before any task runs.
 */
class BatchCoordinator : public QObject {
	Q_OBJECT
public:
	BatchCoordinator(BatchContext* store, EngineFactory engineFactory, QObject* parent = nullptr);
	~BatchCoordinator() override;

	void setConfig(const CaptureConfig& config) { mConfig = config; }
	const CaptureConfig& config() const { return mConfig; }

	void setMaxParallel(int maxParallel) { mMaxParallel = maxParallel; }
	int maxParallel() const { return mMaxParallel; }

	// Clears the artifact store and starts a new batch. Fails while a batch is running.
	bool start(const QList<Address>& addresses, QString* errorMessage = nullptr);

	// Empties the artifact store and forgets all results. Fails while a batch is running.
	bool flush(QString* errorMessage = nullptr);

	bool isRunning() const { return mRunning; }
	const BatchRun& batchRun() const { return mRun; }
	ResultAggregator* results() const { return mResults; }

	int inFlight() const { return mInFlight; }
	int peakInFlight() const { return mPeakInFlight; }

signals:
	void sessionStarting(int totalCount);
	void sessionStarted();
	void progress(const ProgressEvent& event);
	void batchFinished();
	void batchFailed(const QString& message);

private slots:
	void onSessionStarted();
	void onLaunchFailed(const QString& message);

private:
	void dispatch();
	void onTaskFinished(CaptureTask* task, const OutcomeRecord& outcome);
	void complete();
	void releaseSession();

	BatchContext* mStore{ nullptr };
	EngineFactory mEngineFactory;
	CaptureConfig mConfig;
	int mMaxParallel{ 0 };

	ResultAggregator* mResults{ nullptr };
	CaptureSession* mSession{ nullptr };

	QList<Address> mAddresses;
	int mNextIndex{ 0 };
	int mInFlight{ 0 };
	int mPeakInFlight{ 0 };
	BatchRun mRun;
	bool mRunning{ false };
};
