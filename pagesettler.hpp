#pragma once

#include <QObject>

class IBrowsingContext;

/**
 * Surfaces lazily loaded content: scroll one viewport, pause, re-measure the
 * document height, and stop as soon as the height no longer grows or after
 * maxIterations rounds.
 *
 * A page that shrinks between two measurements counts as settled.
 */
class PageSettler : public QObject {
	Q_OBJECT
public:
	struct Config {
		int pauseMs{ 1000 };
		int maxIterations{ 30 };
	};

	PageSettler(IBrowsingContext* context, const Config& config, QObject* parent = nullptr);

	void start();

	int iterations() const { return mIterations; }
	int lastHeight() const { return mLastHeight; }

signals:
	void settled(int iterations);

private:
	void scrollOnce();
	void onMeasured(int height);

	IBrowsingContext* mContext{ nullptr };
	Config mConfig;
	int mIterations{ 0 };
	int mLastHeight{ -1 };
	bool mDone{ false };
};
