#pragma once

#include "outcome.hpp"

#include <QList>
#include <QObject>
#include <QStringList>

class BatchContext;

// Append-only log of one run's outcomes, and the archive built from them.
class ResultAggregator : public QObject {
	Q_OBJECT
public:
	explicit ResultAggregator(const BatchContext* store, QObject* parent = nullptr);

	void append(const OutcomeRecord& outcome);
	void clear();

	// In the order received, i.e. completion order.
	const QList<OutcomeRecord>& recordAll() const { return mRecords; }
	QStringList logLines() const;

	int successCount() const;
	int failureCount() const;

	// True iff a Success record exists whose artifact file is on disk.
	bool hasAnyArtifacts() const;

	// Packs the artifact directory once per run and returns the archive path.
	// Returns an empty string and sets *warning when there is nothing to pack
	// or packing fails.
	QString archive(QString* warning = nullptr);
	const QString& archivePath() const { return mArchivePath; }

signals:
	void appended(const OutcomeRecord& outcome);
	void archiveWarning(const QString& message);

private:
	const BatchContext* mStore{ nullptr };
	QList<OutcomeRecord> mRecords;
	QString mArchivePath;
};
