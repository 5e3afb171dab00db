#pragma once

#include <QSize>
#include <QString>
#include <QStringList>

// Browser launch flags; they apply to the whole engine, not to single contexts.
struct LaunchConfig {
	bool headless{ true };
	bool disableAutomationFlags{ true };
	bool disableSandbox{ true };
	int launchTimeoutMs{ 30000 };
};

// Every option recognized by a capture run. Defaults are the production values.
struct CaptureConfig {
	LaunchConfig launch;

	QSize viewport{ 1920, 1080 };
	int navigationTimeoutMs{ 60000 };

	// Random pause after DOM content is parsed, uniform over [min, max].
	int settleDelayMinMs{ 2000 };
	int settleDelayMaxMs{ 4000 };

	int scrollPauseMs{ 1000 };
	int maxScrollIterations{ 30 };

	QStringList userAgents{ defaultUserAgents() };
	QStringList blockedExtensions{ defaultBlockedExtensions() };

	static QStringList defaultUserAgents() {
		return {
			QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
			               "(KHTML, like Gecko) Chrome/122.0.0.0 Safari/537.36"),
			QStringLiteral("Mozilla/5.0 (Macintosh; Intel Mac OS X 13_1) AppleWebKit/605.1.15 "
			               "(KHTML, like Gecko) Version/16.1 Safari/605.1.15"),
			QStringLiteral("Mozilla/5.0 (X11; Linux x86_64) AppleWebKit/537.36 "
			               "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"),
		};
	}

	// Heavy media never needed for a layout capture.
	static QStringList defaultBlockedExtensions() {
		return { "png", "jpg", "jpeg", "gif", "svg", "woff", "woff2", "ttf", "mp3", "mp4", "avi" };
	}
};
