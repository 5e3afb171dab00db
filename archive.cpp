#include "archive.hpp"

#include <QDir>
#include <QFileInfo>

#include <zip.h>

static QString zipErrorString(int code) {
	zip_error_t error;
	zip_error_init_with_code(&error, code);
	const QString message = QString::fromUtf8(zip_error_strerror(&error));
	zip_error_fini(&error);
	return message;
}

bool zipDirectory(const QString& sourceDir, const QString& archivePath, int* entryCount,
                  QString* errorMessage) {
	const QFileInfoList files =
		QDir(sourceDir).entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);

	int zerr = 0;
	zip_t* za = zip_open(QFile::encodeName(archivePath).constData(), ZIP_CREATE | ZIP_TRUNCATE, &zerr);
	if (!za) {
		if (errorMessage)
			*errorMessage = QStringLiteral("Cannot create archive '%1': %2")
			                    .arg(archivePath, zipErrorString(zerr));
		return false;
	}

	int added = 0;
	for (const QFileInfo& file : files) {
		zip_source_t* src =
			zip_source_file(za, QFile::encodeName(file.absoluteFilePath()).constData(), 0, -1);
		if (!src) {
			if (errorMessage)
				*errorMessage = QStringLiteral("Cannot read '%1': %2")
				                    .arg(file.fileName(), QString::fromUtf8(zip_strerror(za)));
			zip_discard(za);
			return false;
		}

		if (zip_file_add(za, file.fileName().toUtf8().constData(), src,
		                 ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
			if (errorMessage)
				*errorMessage = QStringLiteral("Cannot add '%1': %2")
				                    .arg(file.fileName(), QString::fromUtf8(zip_strerror(za)));
			zip_source_free(src);
			zip_discard(za);
			return false;
		}
		++added;
	}

	if (zip_close(za) < 0) {
		if (errorMessage)
			*errorMessage = QStringLiteral("Cannot write archive '%1': %2")
			                    .arg(archivePath, QString::fromUtf8(zip_strerror(za)));
		zip_discard(za);
		return false;
	}

	if (entryCount)
		*entryCount = added;
	return true;
}
