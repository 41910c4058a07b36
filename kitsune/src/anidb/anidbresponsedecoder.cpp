#include "anidbresponsedecoder.h"
#include "../logger.h"
#include <QList>
#include <QPair>
#include <zlib.h>

QByteArray AniDBResponseDecoder::decompressIfNeeded(const QByteArray &datagram)
{
	if(datagram.size() < 2)
		return datagram;

	const unsigned char b0 = static_cast<unsigned char>(datagram[0]);
	const unsigned char b1 = static_cast<unsigned char>(datagram[1]);

	if(b0 == 0x1f && b1 == 0x8b)
	{
		// windowBits = 15 (default) + 16 (gzip format) = 31
		QByteArray result = inflateData(datagram, 15 + 16);
		if(result.isEmpty())
			LOG("[AniDB Decoder] gzip reply failed to inflate");
		return result;
	}
	if(b0 == 0x00 && b1 == 0x00)
	{
		// comp=1: two zero bytes, then a raw DEFLATE stream (negative windowBits)
		QByteArray result = inflateData(datagram.mid(2), -15);
		if(result.isEmpty())
			LOG("[AniDB Decoder] deflate reply failed to inflate");
		return result;
	}
	return datagram;
}

QByteArray AniDBResponseDecoder::inflateData(const QByteArray &compressed, int windowBits)
{
	if(compressed.isEmpty())
		return QByteArray();

	z_stream stream;
	stream.zalloc = Z_NULL;
	stream.zfree = Z_NULL;
	stream.opaque = Z_NULL;
	stream.avail_in = static_cast<uInt>(compressed.size());
	stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(compressed.constData()));

	int ret = inflateInit2(&stream, windowBits);
	if(ret != Z_OK)
	{
		LOG(QString("[AniDB Decoder] inflateInit2 failed: %1").arg(ret));
		return QByteArray();
	}

	// Replies are at most one datagram; 64 KiB per round is plenty
	const int CHUNK = 64 * 1024;
	QByteArray out(CHUNK, Qt::Uninitialized);
	QByteArray decompressed;

	do {
		stream.avail_out = CHUNK;
		stream.next_out = reinterpret_cast<Bytef*>(out.data());

		ret = inflate(&stream, Z_NO_FLUSH);
		if(ret == Z_STREAM_ERROR || ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR)
		{
			LOG(QString("[AniDB Decoder] inflate failed: %1").arg(ret));
			inflateEnd(&stream);
			return QByteArray();
		}

		const int have = CHUNK - static_cast<int>(stream.avail_out);
		decompressed.append(out.constData(), have);

		// Input exhausted without a stream end: the body was cut off
		if(ret == Z_BUF_ERROR || (stream.avail_in == 0 && ret != Z_STREAM_END && have == 0))
		{
			LOG("[AniDB Decoder] compressed reply ended early");
			inflateEnd(&stream);
			return QByteArray();
		}
	} while(ret != Z_STREAM_END);

	inflateEnd(&stream);
	return decompressed;
}

bool AniDBResponseDecoder::isReplyCode(const QString &token)
{
	if(token.size() != 3)
		return false;
	for(const QChar c : token)
	{
		if(c < QLatin1Char('0') || c > QLatin1Char('9'))
			return false;
	}
	return true;
}

AniDBReply AniDBResponseDecoder::decode(const QByteArray &datagram)
{
	AniDBReply reply;
	reply.truncated = datagram.size() >= TRUNCATION_THRESHOLD;

	const QByteArray plain = decompressIfNeeded(datagram);
	if(plain.isEmpty())
		return reply;

	reply.rawText = QString::fromUtf8(plain);

	QStringList lines = reply.rawText.split('\n');
	for(QString &line : lines)
	{
		if(line.endsWith('\r'))
			line.chop(1);
	}

	const QString first = lines.takeFirst();
	for(const QString &line : lines)
	{
		if(!line.isEmpty())
			reply.payloadLines.append(line);
	}

	// Tokens of the first line with their start offsets, so the message keeps
	// its original spacing (titles in a single-line FILE payload can contain runs of spaces)
	QList<QPair<int, QString>> tokens;
	int pos = 0;
	while(pos < first.size())
	{
		while(pos < first.size() && first.at(pos) == QLatin1Char(' '))
			++pos;
		if(pos >= first.size())
			break;
		const int start = pos;
		while(pos < first.size() && first.at(pos) != QLatin1Char(' '))
			++pos;
		tokens.append(qMakePair(start, first.mid(start, pos - start)));
	}

	if(tokens.isEmpty())
		return reply;

	int codeIndex = -1;
	for(int i = 1; i < tokens.size(); ++i)
	{
		if(isReplyCode(tokens.at(i).second))
		{
			codeIndex = i;
			break;
		}
	}

	if(codeIndex < 0)
	{
		if(isReplyCode(tokens.first().second))
		{
			// "598 UNKNOWN COMMAND": the server could not read the tag
			reply.code = tokens.first().second;
			codeIndex = 0;
		}
		else
		{
			reply.tag = tokens.first().second;
			return reply;
		}
	}
	else
	{
		reply.tag = tokens.first().second;
		reply.code = tokens.at(codeIndex).second;
	}

	if(codeIndex + 1 < tokens.size())
		reply.message = first.mid(tokens.at(codeIndex + 1).first).trimmed();

	return reply;
}

QString AniDBResponseDecoder::filePayload(const AniDBReply &reply)
{
	if(!reply.payloadLines.isEmpty())
		return reply.payloadLines.first();
	return reply.message;
}
