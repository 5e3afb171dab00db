#include <QtTest>

#include <QSet>

#include "address.hpp"

class tst_Address : public QObject {
	Q_OBJECT

private slots:
	void fromUserInput_prefixesHttps();
	void fromUserInput_keepsExplicitScheme();
	void fromUserInput_blankIsInvalid();
	void sanitize_replacesReservedCharacters();
	void artifactFileName_stripsSchemeAndPrefixesIndex();
	void artifactFileName_sameHostDifferentSchemeIsDistinct();
	void artifactFileName_duplicateAddressesAreDistinct();
	void parseAddressLines_skipsBlanksAndCaps();
	void parseAddressCsv_readsNameColumnUnique();
	void parseAddressCsv_missingColumnFails();
};

void tst_Address::fromUserInput_prefixesHttps() {
	const Address a = Address::fromUserInput(QStringLiteral("  google.com \t"));
	QVERIFY(a.isValid());
	QCOMPARE(a.toString(), QStringLiteral("https://google.com"));
	QCOMPARE(a.toUrl().scheme(), QStringLiteral("https"));
}

void tst_Address::fromUserInput_keepsExplicitScheme() {
	QCOMPARE(Address::fromUserInput(QStringLiteral("http://a.com/x")).toString(),
	         QStringLiteral("http://a.com/x"));
	QCOMPARE(Address::fromUserInput(QStringLiteral("https://a.com")).toString(),
	         QStringLiteral("https://a.com"));
	QCOMPARE(Address::fromUserInput(QStringLiteral("HTTPS://A.com")).toString(),
	         QStringLiteral("HTTPS://A.com"));
}

void tst_Address::fromUserInput_blankIsInvalid() {
	QVERIFY(!Address::fromUserInput(QString()).isValid());
	QVERIFY(!Address::fromUserInput(QStringLiteral("   ")).isValid());
}

void tst_Address::sanitize_replacesReservedCharacters() {
	const QString out = sanitizeForFileName(QStringLiteral("a:b/c\\d?e*f&g\"h<i>j|k"));
	QCOMPARE(out, QStringLiteral("a_b_c_d_e_f_g_h_i_j_k"));

	const QString reserved = QStringLiteral(":/\\?*&\"<>|");
	const QString name = artifactFileName(
		3, Address::fromUserInput(QStringLiteral("https://example.org/search?q=a&b=\"c\"|<d>")));
	for (const QChar c : name.chopped(4))
		QVERIFY2(!reserved.contains(c), qPrintable(name));
}

void tst_Address::artifactFileName_stripsSchemeAndPrefixesIndex() {
	QCOMPARE(artifactFileName(1, Address::fromUserInput(QStringLiteral("google.com"))),
	         QStringLiteral("1_google.com.png"));
	QCOMPARE(artifactFileName(7, Address::fromUserInput(QStringLiteral("http://a.com/b/c"))),
	         QStringLiteral("7_a.com_b_c.png"));
}

void tst_Address::artifactFileName_sameHostDifferentSchemeIsDistinct() {
	const QString one = artifactFileName(1, Address::fromUserInput(QStringLiteral("http://a.com")));
	const QString two = artifactFileName(2, Address::fromUserInput(QStringLiteral("https://a.com")));
	QCOMPARE(one, QStringLiteral("1_a.com.png"));
	QCOMPARE(two, QStringLiteral("2_a.com.png"));
}

void tst_Address::artifactFileName_duplicateAddressesAreDistinct() {
	const QList<Address> addresses = parseAddressLines(QStringLiteral("a.com\na.com\nb.com\na.com"), 10);
	QCOMPARE(addresses.size(), 4);

	QSet<QString> names;
	for (int ix = 0; ix < addresses.size(); ++ix)
		names.insert(artifactFileName(ix + 1, addresses.at(ix)));
	QCOMPARE(names.size(), 4);
	QVERIFY(names.contains(QStringLiteral("1_a.com.png")));
	QVERIFY(names.contains(QStringLiteral("2_a.com.png")));
}

void tst_Address::parseAddressLines_skipsBlanksAndCaps() {
	QString text;
	for (int ix = 0; ix < 12; ++ix)
		text += QStringLiteral("site%1.com\n\n   \n").arg(ix);

	bool truncated = false;
	const QList<Address> capped = parseAddressLines(text, 10, &truncated);
	QCOMPARE(capped.size(), 10);
	QVERIFY(truncated);
	QCOMPARE(capped.first().toString(), QStringLiteral("https://site0.com"));
	QCOMPARE(capped.last().toString(), QStringLiteral("https://site9.com"));

	const QList<Address> few = parseAddressLines(QStringLiteral("a.com\r\nb.com"), 10, &truncated);
	QCOMPARE(few.size(), 2);
	QVERIFY(!truncated);
	QCOMPARE(few.at(0).toString(), QStringLiteral("https://a.com"));
}

void tst_Address::parseAddressCsv_readsNameColumnUnique() {
	const QString csv = QStringLiteral(
		"id,name,comment\r\n"
		"1,google.com,first\r\n"
		"2,,empty\r\n"
		"3,github.com,\"quoted, with comma\"\r\n"
		"4,google.com,again\r\n"
		"5,\"http://example.org\",x\r\n");

	QList<Address> addresses;
	QString error;
	QVERIFY(parseAddressCsv(csv, &addresses, &error));
	QCOMPARE(addresses.size(), 3);
	QCOMPARE(addresses.at(0).toString(), QStringLiteral("https://google.com"));
	QCOMPARE(addresses.at(1).toString(), QStringLiteral("https://github.com"));
	QCOMPARE(addresses.at(2).toString(), QStringLiteral("http://example.org"));
}

void tst_Address::parseAddressCsv_missingColumnFails() {
	QList<Address> addresses;
	QString error;
	QVERIFY(!parseAddressCsv(QStringLiteral("domain\ngoogle.com\n"), &addresses, &error));
	QVERIFY(addresses.isEmpty());
	QVERIFY(error.contains(QStringLiteral("'name'")));
}

QTEST_APPLESS_MAIN(tst_Address)
#include "tst_Address.moc"
