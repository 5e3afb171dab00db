#include "outcome.hpp"

#include <QStringList>

const char* failureKindName(FailureKind kind) {
	switch (kind) {
		case FailureKind::None: return "none";
		case FailureKind::ContextCreation: return "context-creation";
		case FailureKind::NavigationTimeout: return "navigation-timeout";
		case FailureKind::Navigation: return "navigation";
		case FailureKind::Capture: return "capture";
	}
	return "unknown";
}

QString firstLine(const QString& text) {
	const QStringList lines = text.split(QLatin1Char('\n'));
	for (const QString& line : lines) {
		const QString trimmed = line.trimmed();
		if (!trimmed.isEmpty())
			return trimmed;
	}
	return QStringLiteral("Unknown error");
}

OutcomeRecord OutcomeRecord::success(int index, const QString& address, const QString& artifactPath) {
	OutcomeRecord r;
	r.mIndex = index;
	r.mAddress = address;
	r.mStatus = Success;
	r.mArtifactPath = artifactPath;
	return r;
}

OutcomeRecord OutcomeRecord::failure(int index, const QString& address, FailureKind kind,
                                     const QString& errorDescription) {
	OutcomeRecord r;
	r.mIndex = index;
	r.mAddress = address;
	r.mStatus = Failure;
	r.mKind = kind;
	r.mErrorSummary = firstLine(errorDescription);
	return r;
}

QString OutcomeRecord::logLine() const {
	if (mStatus == Success)
		return QStringLiteral("Success: %1").arg(mAddress);
	return QStringLiteral("Error on %1: %2").arg(mAddress, mErrorSummary);
}
