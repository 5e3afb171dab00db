#include "batchcontext.hpp"

#include <QDir>

BatchContext::BatchContext(const QString& artifactDir, const QString& archiveDir)
	: mArtifactDir(QDir(artifactDir).absolutePath()),
	  mArchiveDir(QDir(archiveDir).absolutePath()) {}

QString BatchContext::artifactPath(const QString& fileName) const {
	return QDir(mArtifactDir).filePath(fileName);
}

QString BatchContext::archivePath() const {
	return QDir(mArchiveDir).filePath(QStringLiteral("screenshots.zip"));
}

bool BatchContext::reset(QString* errorMessage) {
	for (const QString& path : { mArtifactDir, mArchiveDir }) {
		QDir dir(path);
		if (dir.exists() && !dir.removeRecursively()) {
			if (errorMessage)
				*errorMessage = QStringLiteral("Cannot remove directory '%1'").arg(path);
			return false;
		}
		if (!QDir().mkpath(path)) {
			if (errorMessage)
				*errorMessage = QStringLiteral("Cannot create directory '%1'").arg(path);
			return false;
		}
	}
	return true;
}

bool BatchContext::isArtifactDirEmpty() const {
	return QDir(mArtifactDir).isEmpty(QDir::Files | QDir::NoDotAndDotDot);
}
