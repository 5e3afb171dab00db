#pragma once

#include <QString>

// Packs every regular file of sourceDir (non-recursive, sorted by name) into a
// new zip archive at archivePath, replacing any existing file.
bool zipDirectory(const QString& sourceDir, const QString& archivePath, int* entryCount,
                  QString* errorMessage);
