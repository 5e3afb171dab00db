////////////////////////////////////////////////////////////////////
//
// BatchCapt - batch full-page web capture on Qt WebEngine
//
////////////////////////////////////////////////////////////////////

#include "address.hpp"
#include "batchcontext.hpp"
#include "batchcoordinator.hpp"
#include "captureconfig.hpp"
#include "resultaggregator.hpp"
#include "webengine.hpp"

#include <QApplication>
#include <QFile>
#include <QFileInfo>
#include <QTextStream>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

static void CaptHelp(const char* argv0) {
	const QString prog = QFileInfo(QString::fromLocal8Bit(argv0)).fileName();

	printf("%s",
	       " ----------------------------------------------------------------------------------\n");
	printf(" Usage: %s --url=example.org --url=https://www.example.com/ [options]\n",
	       prog.toLocal8Bit().constData());
	printf("%s",
	       " ----------------------------------------------------------------------------------\n"
	       "  --help                             Print this help page and exit                 \n"
	       "  --url=<url>                        Address to capture; repeatable                \n"
	       "  --url-file=<path>                  Addresses, one per line                       \n"
	       "  --csv=<path>                       CSV file with a 'name' column of domains      \n"
	       "  --out-dir=<path>                   Screenshot directory (default: screenshots)   \n"
	       "  --zip-dir=<path>                   Archive directory (default: zip_files)        \n"
	       "  --max-urls=<int>                   Addresses per batch (default: 10)             \n"
	       "  --max-parallel=<int>               Concurrent captures (default: whole batch)    \n"
	       "  --nav-timeout=<ms>                 Navigation timeout (default: 60000)           \n"
	       "  --launch-timeout=<ms>              Browser start timeout (default: 30000)        \n"
	       "  --settle-min=<ms>                  Min pause after DOM load (default: 2000)      \n"
	       "  --settle-max=<ms>                  Max pause after DOM load (default: 4000)      \n"
	       "  --scroll-pause=<ms>                Pause after each scroll (default: 1000)       \n"
	       "  --max-scrolls=<int>                Scroll iterations cap (default: 30)           \n"
	       "  --user-agent=<string>              User-Agent pool entry; repeatable             \n"
	       "  --headed                           Show the browser windows                      \n"
	       "  --sandbox                          Keep the Chromium sandbox enabled             \n"
	       "  --flush                            Delete screenshots and archives first         \n"
	       "  --silent                           Less console output                           \n"
	       " ----------------------------------------------------------------------------------\n");
}

static bool readTextFile(const char* path, QString* contents) {
	QFile file(QString::fromLocal8Bit(path));
	if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
		return false;
	QTextStream stream(&file);
	stream.setEncoding(QStringConverter::Utf8);
	*contents = stream.readAll();
	return true;
}

int main(int argc, char* argv[]) {
	// The QPA platform has to be chosen before the application object exists.
	bool argHeaded = false;
	for (int ax = 1; ax < argc; ++ax) {
		if (strcmp("--headed", argv[ax]) == 0)
			argHeaded = true;
	}
	if (!argHeaded && qEnvironmentVariableIsEmpty("QT_QPA_PLATFORM"))
		qputenv("QT_QPA_PLATFORM", "offscreen");

	QCoreApplication::setAttribute(Qt::AA_ShareOpenGLContexts);
	QApplication app(argc, argv);
	app.setApplicationName(QStringLiteral("batchcapt"));

	bool argHelp = false;
	bool argSilent = false;
	bool argFlush = false;
	int argMaxUrls = 10;
	int argMaxParallel = 0;
	QString argOutDir = QStringLiteral("screenshots");
	QString argZipDir = QStringLiteral("zip_files");
	QStringList argUserAgents;

	CaptureConfig config;
	config.launch.headless = !argHeaded;

	QStringList urlLines;
	QList<Address> csvAddresses;

	for (int ax = 1; ax < argc; ++ax) {
		const char* s = argv[ax];
		const char* value = nullptr;

		if (strcmp("--silent", s) == 0) {
			argSilent = true;
			continue;
		} else if (strcmp("--help", s) == 0) {
			argHelp = true;
			break;
		} else if (strcmp("--headed", s) == 0) {
			continue;
		} else if (strcmp("--sandbox", s) == 0) {
			config.launch.disableSandbox = false;
			continue;
		} else if (strcmp("--flush", s) == 0) {
			argFlush = true;
			continue;
		}

		value = strchr(s, '=');
		if (!value) {
			argHelp = true;
			break;
		}

		const QByteArray name(s, int(value++ - s));

		if (name == "--url") {
			urlLines << QString::fromLocal8Bit(value);
		} else if (name == "--url-file") {
			QString text;
			if (!readTextFile(value, &text)) {
				std::cerr << "Cannot read URL file '" << value << "'" << std::endl;
				return EXIT_FAILURE;
			}
			urlLines << text.split(QLatin1Char('\n'));
		} else if (name == "--csv") {
			QString text;
			QString error;
			if (!readTextFile(value, &text)) {
				std::cerr << "Cannot read CSV file '" << value << "'" << std::endl;
				return EXIT_FAILURE;
			}
			if (!parseAddressCsv(text, &csvAddresses, &error)) {
				std::cerr << "Error reading CSV file: " << error.toStdString() << std::endl;
				return EXIT_FAILURE;
			}
		} else if (name == "--out-dir") {
			argOutDir = QString::fromLocal8Bit(value);
		} else if (name == "--zip-dir") {
			argZipDir = QString::fromLocal8Bit(value);
		} else if (name == "--max-urls") {
			argMaxUrls = strtol(value, nullptr, 0);
		} else if (name == "--max-parallel") {
			argMaxParallel = strtol(value, nullptr, 0);
		} else if (name == "--nav-timeout") {
			config.navigationTimeoutMs = strtol(value, nullptr, 0);
		} else if (name == "--launch-timeout") {
			config.launch.launchTimeoutMs = strtol(value, nullptr, 0);
		} else if (name == "--settle-min") {
			config.settleDelayMinMs = strtol(value, nullptr, 0);
		} else if (name == "--settle-max") {
			config.settleDelayMaxMs = strtol(value, nullptr, 0);
		} else if (name == "--scroll-pause") {
			config.scrollPauseMs = strtol(value, nullptr, 0);
		} else if (name == "--max-scrolls") {
			config.maxScrollIterations = strtol(value, nullptr, 0);
		} else if (name == "--user-agent") {
			argUserAgents << QString::fromLocal8Bit(value);
		} else {
			argHelp = true;
		}
	}

	if (argHelp || argMaxUrls <= 0 || argMaxParallel < 0 || config.navigationTimeoutMs <= 0 ||
	    config.launch.launchTimeoutMs <= 0 || config.settleDelayMinMs < 0 || config.settleDelayMaxMs < 0 ||
	    config.scrollPauseMs < 0 || config.maxScrollIterations < 0) {
		CaptHelp(argv[0]);
		return EXIT_FAILURE;
	}

	if (!argUserAgents.isEmpty())
		config.userAgents = argUserAgents;

	BatchContext store(argOutDir, argZipDir);
	BatchCoordinator coordinator(&store, []() { return std::make_unique<WebEngineBrowser>(); });
	coordinator.setConfig(config);
	coordinator.setMaxParallel(argMaxParallel);

	if (argFlush) {
		QString error;
		if (!coordinator.flush(&error)) {
			std::cerr << error.toStdString() << std::endl;
			return EXIT_FAILURE;
		}
		if (!argSilent)
			std::clog << "All screenshots and ZIP files have been flushed." << std::endl;
		if (urlLines.isEmpty() && csvAddresses.isEmpty())
			return EXIT_SUCCESS;
	}

	QList<Address> addresses = parseAddressLines(urlLines.join(QLatin1Char('\n')), 0);
	addresses << csvAddresses;
	if (addresses.size() > argMaxUrls) {
		std::cerr << "More than " << argMaxUrls << " URLs given. Only the first " << argMaxUrls
		          << " will be processed." << std::endl;
		addresses = addresses.mid(0, argMaxUrls);
	}

	if (addresses.isEmpty()) {
		CaptHelp(argv[0]);
		return EXIT_FAILURE;
	}

	QObject::connect(&coordinator, &BatchCoordinator::sessionStarting, [argSilent](int total) {
		if (!argSilent)
			std::clog << "Starting browser for " << total << " URLs..." << std::endl;
	});

	QObject::connect(&coordinator, &BatchCoordinator::sessionStarted, [argSilent]() {
		if (!argSilent)
			std::clog << "Browser ready." << std::endl;
	});

	QObject::connect(&coordinator, &BatchCoordinator::progress, [argSilent](const ProgressEvent& e) {
		if (!argSilent) {
			std::clog << "[" << e.completedCount << "/" << e.totalCount << "] "
			          << e.outcome.logLine().toStdString() << std::endl;
		}
	});

	QObject::connect(&coordinator, &BatchCoordinator::batchFailed, [](const QString& message) {
		std::cerr << "Browser launch failed: " << message.toStdString() << std::endl;
		QApplication::exit(1);
	});

	QObject::connect(&coordinator, &BatchCoordinator::batchFinished, [&coordinator, argSilent]() {
		ResultAggregator* results = coordinator.results();

		if (!argSilent) {
			std::clog << "All tasks completed! " << results->successCount() << " succeeded, "
			          << results->failureCount() << " failed." << std::endl;
			std::clog << "Final log:" << std::endl;
			for (const QString& line : results->logLines())
				std::clog << "  " << line.toStdString() << std::endl;
		}

		QString warning;
		const QString archive = results->archive(&warning);
		if (archive.isEmpty())
			std::cerr << "Warning: " << warning.toStdString() << std::endl;
		else if (!argSilent)
			std::clog << "Archive: " << archive.toStdString() << std::endl;

		QApplication::exit(0);
	});

	QString error;
	if (!coordinator.start(addresses, &error)) {
		std::cerr << error.toStdString() << std::endl;
		return EXIT_FAILURE;
	}

	return app.exec();
}
