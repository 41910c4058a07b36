#ifndef ANIDBREPLY_H
#define ANIDBREPLY_H

#include <QString>
#include <QStringList>

/**
 * @brief One decoded AniDB reply datagram
 *
 * For "5 FILE 220 FILE\n12|34|..." the fields are:
 * - tag: "5"
 * - code: "220"
 * - message: "FILE"
 * - payloadLines: {"12|34|..."}
 */
struct AniDBReply
{
	QString tag;			// empty for a tagless reply
	QString code;			// 3 digits, empty when none was found
	QString message;		// rest of the first line after the code
	QStringList payloadLines;	// every line after the first, empty lines dropped
	QString rawText;		// decompressed text as received
	bool truncated = false;	// datagram hit the UDP size limit

	bool hasTag() const { return !tag.isEmpty(); }
	bool isWellFormed() const { return !tag.isEmpty() && code.size() == 3; }
	int codeValue() const { return code.toInt(); }

	// First line of the reply, for error messages
	QString firstLine() const { return rawText.section('\n', 0, 0).trimmed(); }
};

#endif // ANIDBREPLY_H
