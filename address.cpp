#include "address.hpp"

#include <QSet>
#include <QStringList>

namespace {

bool hasHttpScheme(const QString& text) {
	return text.startsWith(QLatin1String("http://"), Qt::CaseInsensitive) ||
	       text.startsWith(QLatin1String("https://"), Qt::CaseInsensitive);
}

// Splits one CSV record, honouring double-quoted fields and "" escapes.
QStringList splitCsvRecord(const QString& line) {
	QStringList fields;
	QString field;
	bool quoted = false;

	for (int ix = 0; ix < line.size(); ++ix) {
		const QChar c = line.at(ix);
		if (quoted) {
			if (c == QLatin1Char('"')) {
				if (ix + 1 < line.size() && line.at(ix + 1) == QLatin1Char('"')) {
					field += c;
					++ix;
				} else {
					quoted = false;
				}
			} else {
				field += c;
			}
		} else if (c == QLatin1Char('"')) {
			quoted = true;
		} else if (c == QLatin1Char(',')) {
			fields << field;
			field.clear();
		} else {
			field += c;
		}
	}
	fields << field;
	return fields;
}

} // namespace

Address Address::fromUserInput(const QString& input) {
	const QString text = input.trimmed();
	if (text.isEmpty())
		return Address();
	if (hasHttpScheme(text))
		return Address(text);
	return Address(QStringLiteral("https://") + text);
}

QString sanitizeForFileName(const QString& text) {
	static const QString reserved = QStringLiteral(":/\\?*&\"<>|");
	QString out = text;
	for (QChar& c : out) {
		if (reserved.contains(c))
			c = QLatin1Char('_');
	}
	return out;
}

QString artifactFileName(int index, const Address& address) {
	QString rest = address.toString();
	const int sep = rest.indexOf(QLatin1String("//"));
	if (sep >= 0)
		rest = rest.mid(sep + 2);
	return QStringLiteral("%1_%2.png").arg(index).arg(sanitizeForFileName(rest));
}

QList<Address> parseAddressLines(const QString& text, int maxCount, bool* truncated) {
	QList<Address> out;
	bool cut = false;

	const QStringList lines = text.split(QLatin1Char('\n'));
	for (const QString& line : lines) {
		const Address address = Address::fromUserInput(line);
		if (!address.isValid())
			continue;
		if (maxCount > 0 && out.size() >= maxCount) {
			cut = true;
			break;
		}
		out << address;
	}

	if (truncated)
		*truncated = cut;
	return out;
}

bool parseAddressCsv(const QString& csv, QList<Address>* addresses, QString* errorMessage) {
	QStringList lines = csv.split(QLatin1Char('\n'));
	for (QString& line : lines) {
		if (line.endsWith(QLatin1Char('\r')))
			line.chop(1);
	}

	int column = -1;
	int first = 0;
	for (; first < lines.size(); ++first) {
		if (lines.at(first).trimmed().isEmpty())
			continue;
		const QStringList header = splitCsvRecord(lines.at(first));
		for (int ix = 0; ix < header.size(); ++ix) {
			if (header.at(ix).trimmed() == QLatin1String("name")) {
				column = ix;
				break;
			}
		}
		break;
	}

	if (column < 0) {
		if (errorMessage)
			*errorMessage = QStringLiteral("CSV file must contain a column named 'name'.");
		return false;
	}

	QSet<QString> seen;
	for (int ix = first + 1; ix < lines.size(); ++ix) {
		const QStringList fields = splitCsvRecord(lines.at(ix));
		if (column >= fields.size())
			continue;
		const QString name = fields.at(column).trimmed();
		if (name.isEmpty() || seen.contains(name))
			continue;
		seen.insert(name);
		*addresses << Address::fromUserInput(name);
	}
	return true;
}
