#pragma once

#include <QString>

// The on-disk artifact store of one run: raw images and the derived archive.
class BatchContext {
public:
	BatchContext(const QString& artifactDir, const QString& archiveDir);

	const QString& artifactDir() const { return mArtifactDir; }
	const QString& archiveDir() const { return mArchiveDir; }

	QString artifactPath(const QString& fileName) const;
	QString archivePath() const;

	// Removes both directories with all contents and recreates them empty.
	bool reset(QString* errorMessage = nullptr);

	bool isArtifactDirEmpty() const;

private:
	QString mArtifactDir;
	QString mArchiveDir;
};
