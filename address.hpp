#pragma once

#include <QList>
#include <QString>
#include <QUrl>

// A normalized capture target. Always carries an http:// or https:// scheme.
class Address {
public:
	Address() = default;

	// Trims the input and prefixes https:// when no http(s) scheme is present.
	// Returns an invalid Address for blank input.
	static Address fromUserInput(const QString& input);

	bool isValid() const { return !mText.isEmpty(); }
	const QString& toString() const { return mText; }
	QUrl toUrl() const { return QUrl(mText); }

	bool operator==(const Address& other) const { return mText == other.mText; }
	bool operator!=(const Address& other) const { return mText != other.mText; }

private:
	explicit Address(const QString& text) : mText(text) {}

	QString mText;
};

// Characters never allowed in an artifact name: : / \ ? * & " < > |
QString sanitizeForFileName(const QString& text);

// "{index}_{sanitized address without scheme}.png", index is 1-based.
QString artifactFileName(int index, const Address& address);

// One address per line; blank lines are skipped. At most maxCount addresses are
// kept, *truncated is set when more were given.
QList<Address> parseAddressLines(const QString& text, int maxCount, bool* truncated = nullptr);

// CSV with a header row containing a "name" column. Empty cells are dropped and
// repeated names keep their first position. Returns false if the column is missing.
bool parseAddressCsv(const QString& csv, QList<Address>* addresses, QString* errorMessage);
