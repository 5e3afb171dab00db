#include "capturetask.hpp"

#include "batchcontext.hpp"
#include "browser.hpp"
#include "capturesession.hpp"
#include "pagesettler.hpp"

#include <QDebug>
#include <QFileInfo>
#include <QPointer>
#include <QRandomGenerator>

#include <algorithm>

CaptureTask::CaptureTask(int index, const Address& address, CaptureSession* session,
                         const BatchContext* store, const CaptureConfig& config, QObject* parent)
	: QObject(parent),
	  mIndex(index),
	  mAddress(address),
	  mSession(session),
	  mStore(store),
	  mConfig(config) {
	mNavigationTimer.setSingleShot(true);
	connect(&mNavigationTimer, &QTimer::timeout, this, &CaptureTask::onNavigationTimeout);
}

CaptureTask::~CaptureTask() {
	releaseContext();
}

void CaptureTask::start() {
	QString error;
	mContext = mSession->newIsolatedContext(mConfig.userAgents, mConfig.viewport, &error);
	if (!mContext) {
		fail(FailureKind::ContextCreation, error);
		return;
	}

	connect(mContext.get(), &IBrowsingContext::terminated, this, &CaptureTask::onContextTerminated);
	mContext->setBlockedExtensions(mConfig.blockedExtensions);

	mNavigationTimer.start(mConfig.navigationTimeoutMs);

	QPointer<CaptureTask> self(this);
	mContext->navigate(mAddress.toUrl(), [self](const CaptureStatus& status) {
		if (self)
			self->onNavigated(status);
	});
}

void CaptureTask::onNavigationTimeout() {
	fail(FailureKind::NavigationTimeout,
	     QStringLiteral("Navigation timeout of %1 ms exceeded").arg(mConfig.navigationTimeoutMs));
}

void CaptureTask::onNavigated(const CaptureStatus& status) {
	if (mFinished)
		return;
	mNavigationTimer.stop();

	if (!status.ok()) {
		fail(status.kind, status.message);
		return;
	}

	// Negative delays never fire in QTimer; treat them as no pause.
	const int lo = qMax(0, std::min(mConfig.settleDelayMinMs, mConfig.settleDelayMaxMs));
	const int hi = qMax(0, std::max(mConfig.settleDelayMinMs, mConfig.settleDelayMaxMs));
	const int delay = int(QRandomGenerator::global()->bounded(qint64(lo), qint64(hi) + 1));

	QTimer::singleShot(delay, this, [this]() {
		if (mFinished)
			return;
		PageSettler::Config settle;
		settle.pauseMs = mConfig.scrollPauseMs;
		settle.maxIterations = mConfig.maxScrollIterations;
		mSettler = new PageSettler(mContext.get(), settle, this);
		connect(mSettler, &PageSettler::settled, this, &CaptureTask::onSettled);
		mSettler->start();
	});
}

void CaptureTask::onSettled(int iterations) {
	if (mFinished)
		return;
	qDebug() << "CaptureTask:" << mAddress.toString() << "settled after" << iterations << "scrolls";

	mArtifactPath = mStore->artifactPath(artifactFileName(mIndex, mAddress));

	QPointer<CaptureTask> self(this);
	mContext->captureFullPage(mArtifactPath, [self](const CaptureStatus& status) {
		if (self)
			self->onCaptured(status);
	});
}

void CaptureTask::onCaptured(const CaptureStatus& status) {
	if (mFinished)
		return;

	if (!status.ok()) {
		fail(status.kind == FailureKind::None ? FailureKind::Capture : status.kind, status.message);
		return;
	}
	if (!QFileInfo::exists(mArtifactPath)) {
		fail(FailureKind::Capture, QStringLiteral("Screenshot '%1' was not written").arg(mArtifactPath));
		return;
	}

	finish(OutcomeRecord::success(mIndex, mAddress.toString(), mArtifactPath));
}

void CaptureTask::onContextTerminated(const QString& reason) {
	// Pending scroll and capture callbacks will not arrive any more.
	fail(FailureKind::Capture, reason);
}

void CaptureTask::fail(FailureKind kind, const QString& message) {
	if (mFinished)
		return;
	qDebug().noquote() << QStringLiteral("CaptureTask: %1 failed [%2]: %3")
	                          .arg(mAddress.toString(), QString::fromLatin1(failureKindName(kind)), firstLine(message));
	finish(OutcomeRecord::failure(mIndex, mAddress.toString(), kind, message));
}

void CaptureTask::finish(const OutcomeRecord& outcome) {
	if (mFinished)
		return;
	mFinished = true;
	mNavigationTimer.stop();
	releaseContext();
	emit finished(outcome);
}

void CaptureTask::releaseContext() {
	if (mSettler) {
		mSettler->disconnect(this);
		mSettler->deleteLater();
		mSettler = nullptr;
	}
	if (mContext) {
		// May run inside one of the context's own callbacks.
		mContext->disconnect(this);
		mContext->close();
		mContext.release()->deleteLater();
	}
}
