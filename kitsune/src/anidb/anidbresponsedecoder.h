#ifndef ANIDBRESPONSEDECODER_H
#define ANIDBRESPONSEDECODER_H

#include <QByteArray>
#include "anidbreply.h"

/**
 * @brief Turns raw reply datagrams into AniDBReply values
 *
 * Compressed datagrams are inflated first:
 * - 1f 8b: gzip stream
 * - 00 00: AniDB comp=1 body, raw DEFLATE after the two zero bytes
 *
 * The text is then read as UTF-8. The first line is
 * `<tag> [echoed params...] <code> <message>`, where code is the first
 * standalone 3-digit token after the tag. A line that starts with the code
 * (no tag, e.g. "598 UNKNOWN COMMAND") decodes with an empty tag.
 */
class AniDBResponseDecoder
{
public:
	// Datagrams this large were cut by the server
	static constexpr int TRUNCATION_THRESHOLD = 1400;

	static AniDBReply decode(const QByteArray &datagram);

	/**
	 * @brief Inflate a compressed datagram; plain text is returned unchanged
	 * @return empty QByteArray if the data looked compressed but failed to inflate
	 */
	static QByteArray decompressIfNeeded(const QByteArray &datagram);

	/**
	 * @brief Payload of a FILE reply: the second line, or the text after the
	 *        code on the first line when the reply is a single line
	 */
	static QString filePayload(const AniDBReply &reply);

private:
	static QByteArray inflateData(const QByteArray &compressed, int windowBits);
	static bool isReplyCode(const QString &token);
};

#endif // ANIDBRESPONSEDECODER_H
