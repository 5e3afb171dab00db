#pragma once

#include "address.hpp"
#include "captureconfig.hpp"
#include "outcome.hpp"

#include <QObject>
#include <QTimer>

#include <memory>

class BatchContext;
class CaptureSession;
class IBrowsingContext;
class PageSettler;

// Captures one address into one artifact. Always emits finished() exactly once,
// and always releases its browsing context before doing so.
class CaptureTask : public QObject {
	Q_OBJECT
public:
	CaptureTask(int index, const Address& address, CaptureSession* session,
	            const BatchContext* store, const CaptureConfig& config, QObject* parent = nullptr);
	~CaptureTask() override;

	void start();

	int index() const { return mIndex; }
	const Address& address() const { return mAddress; }

signals:
	void finished(const OutcomeRecord& outcome);

private slots:
	void onNavigationTimeout();
	void onSettled(int iterations);
	void onContextTerminated(const QString& reason);

private:
	void onNavigated(const CaptureStatus& status);
	void onCaptured(const CaptureStatus& status);
	void fail(FailureKind kind, const QString& message);
	void finish(const OutcomeRecord& outcome);
	void releaseContext();

	int mIndex{ 0 };
	Address mAddress;
	CaptureSession* mSession{ nullptr };
	const BatchContext* mStore{ nullptr };
	CaptureConfig mConfig;
	QString mArtifactPath;

	std::unique_ptr<IBrowsingContext> mContext;
	PageSettler* mSettler{ nullptr };
	QTimer mNavigationTimer;
	bool mFinished{ false };
};
