#pragma once

#include <QMetaType>
#include <QString>

enum class FailureKind {
	None,
	ContextCreation,
	NavigationTimeout,
	Navigation,
	Capture
};

const char* failureKindName(FailureKind kind);

// Result of one asynchronous engine step.
struct CaptureStatus {
	FailureKind kind{ FailureKind::None };
	QString message;

	bool ok() const { return kind == FailureKind::None; }

	static CaptureStatus success() { return {}; }
	static CaptureStatus failure(FailureKind kind, const QString& message) { return { kind, message }; }
};

// Immutable per-address result of a capture task.
class OutcomeRecord {
public:
	enum Status { Success, Failure };

	OutcomeRecord() = default;

	static OutcomeRecord success(int index, const QString& address, const QString& artifactPath);
	static OutcomeRecord failure(int index, const QString& address, FailureKind kind,
	                             const QString& errorDescription);

	int index() const { return mIndex; }
	const QString& address() const { return mAddress; }
	Status status() const { return mStatus; }
	bool isSuccess() const { return mStatus == Success; }
	const QString& artifactPath() const { return mArtifactPath; }
	const QString& errorSummary() const { return mErrorSummary; }
	FailureKind failureKind() const { return mKind; }

	// One display line: "Success: <url>" or "Error on <url>: <summary>".
	QString logLine() const;

private:
	int mIndex{ 0 };
	QString mAddress;
	Status mStatus{ Failure };
	QString mArtifactPath;
	QString mErrorSummary;
	FailureKind mKind{ FailureKind::None };
};

struct ProgressEvent {
	int completedCount{ 0 };
	int totalCount{ 0 };
	OutcomeRecord outcome;
};

// First non-empty line of an error description, trimmed.
QString firstLine(const QString& text);

Q_DECLARE_METATYPE(OutcomeRecord)
Q_DECLARE_METATYPE(ProgressEvent)
