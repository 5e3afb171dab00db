#include "resultaggregator.hpp"

#include "archive.hpp"
#include "batchcontext.hpp"

#include <QDebug>
#include <QFileInfo>

ResultAggregator::ResultAggregator(const BatchContext* store, QObject* parent)
	: QObject(parent), mStore(store) {}

void ResultAggregator::append(const OutcomeRecord& outcome) {
	mRecords.append(outcome);
	emit appended(outcome);
}

void ResultAggregator::clear() {
	mRecords.clear();
	mArchivePath.clear();
}

QStringList ResultAggregator::logLines() const {
	QStringList lines;
	for (const OutcomeRecord& r : mRecords)
		lines << r.logLine();
	return lines;
}

int ResultAggregator::successCount() const {
	int n = 0;
	for (const OutcomeRecord& r : mRecords) {
		if (r.isSuccess())
			++n;
	}
	return n;
}

int ResultAggregator::failureCount() const {
	return int(mRecords.size()) - successCount();
}

bool ResultAggregator::hasAnyArtifacts() const {
	for (const OutcomeRecord& r : mRecords) {
		if (r.isSuccess() && QFileInfo::exists(r.artifactPath()))
			return true;
	}
	return false;
}

QString ResultAggregator::archive(QString* warning) {
	if (!mArchivePath.isEmpty() && QFileInfo::exists(mArchivePath))
		return mArchivePath;
	mArchivePath.clear();

	QString message;
	if (!hasAnyArtifacts() || mStore->isArtifactDirEmpty()) {
		message = QStringLiteral("Processing completed, but no screenshots were successfully generated.");
	} else {
		const QString path = mStore->archivePath();
		int entries = 0;
		QString error;
		if (zipDirectory(mStore->artifactDir(), path, &entries, &error)) {
			qDebug() << "ResultAggregator: packed" << entries << "screenshots into" << path;
			mArchivePath = path;
			return mArchivePath;
		}
		message = QStringLiteral("Could not create the screenshot archive: %1").arg(firstLine(error));
	}

	if (warning)
		*warning = message;
	emit archiveWarning(message);
	return QString();
}
