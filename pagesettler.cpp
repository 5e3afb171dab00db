#include "pagesettler.hpp"

#include "browser.hpp"

#include <QDebug>
#include <QPointer>
#include <QTimer>

PageSettler::PageSettler(IBrowsingContext* context, const Config& config, QObject* parent)
	: QObject(parent), mContext(context), mConfig(config) {}

void PageSettler::start() {
	mIterations = 0;
	mLastHeight = -1;
	mDone = false;

	QPointer<PageSettler> self(this);
	mContext->measureScrollHeight([self](int height) {
		if (!self)
			return;
		self->mLastHeight = height;
		if (self->mConfig.maxIterations <= 0) {
			self->mDone = true;
			emit self->settled(0);
			return;
		}
		self->scrollOnce();
	});
}

void PageSettler::scrollOnce() {
	++mIterations;
	mContext->scrollBy(mContext->viewportSize().height());

	QTimer::singleShot(qMax(0, mConfig.pauseMs), this, [this]() {
		QPointer<PageSettler> self(this);
		mContext->measureScrollHeight([self](int height) {
			if (self)
				self->onMeasured(height);
		});
	});
}

void PageSettler::onMeasured(int height) {
	if (mDone)
		return;

	if (height <= mLastHeight) {
		if (height < mLastHeight)
			qDebug() << "PageSettler: height shrank from" << mLastHeight << "to" << height;
		mLastHeight = height;
		mDone = true;
		emit settled(mIterations);
		return;
	}

	mLastHeight = height;
	if (mIterations >= mConfig.maxIterations) {
		qDebug() << "PageSettler: max scroll iterations reached";
		mDone = true;
		emit settled(mIterations);
		return;
	}

	scrollOnce();
}
