#include "ed2khasher.h"
#include "../logger.h"
#include <QFileInfo>
#include <QtConcurrent/QtConcurrentRun>

Ed2kHasher::Ed2kHasher()
	: m_chunkHash(QCryptographicHash::Md4)
	, m_rootHash(QCryptographicHash::Md4)
	, m_chunkFill(0)
	, m_chunks(0)
	, m_stop(false)
{
}

void Ed2kHasher::init()
{
	m_chunkHash.reset();
	m_rootHash.reset();
	m_chunkFill = 0;
	m_chunks = 0;
	m_firstChunkDigest.clear();
	m_digest.clear();
}

void Ed2kHasher::closeChunk()
{
	QByteArray chunkDigest = m_chunkHash.result();
	m_chunkHash.reset();
	m_rootHash.addData(chunkDigest);
	if (m_chunks == 0)
	{
		m_firstChunkDigest = chunkDigest;
	}
	m_chunks++;
	m_chunkFill = 0;
}

void Ed2kHasher::update(const char *input, qint64 inputLen)
{
	while (inputLen > 0)
	{
		const qint64 take = qMin(inputLen, CHUNK_SIZE - m_chunkFill);
		m_chunkHash.addData(QByteArray::fromRawData(input, static_cast<int>(take)));
		m_chunkFill += take;
		input += take;
		inputLen -= take;
		if (m_chunkFill == CHUNK_SIZE)
		{
			closeChunk();
		}
	}
}

QByteArray Ed2kHasher::final()
{
	if (m_chunks == 0)
	{
		// Shorter than one chunk, including the empty input
		m_digest = m_chunkHash.result();
	}
	else if (m_chunkFill == 0)
	{
		// Exact multiple of the chunk size: no trailing empty chunk
		m_digest = (m_chunks == 1) ? m_firstChunkDigest : m_rootHash.result();
	}
	else
	{
		m_rootHash.addData(m_chunkHash.result());
		m_digest = m_rootHash.result();
	}
	return m_digest;
}

QString Ed2kHasher::hexDigest() const
{
	return QString::fromLatin1(m_digest.toHex());
}

QString Ed2kHasher::computeContentHashSync(const QString &filepath)
{
	m_stop = false;
	init();

	const qint64 size = FileStreamer::stream(filepath,
		[this](const char *data, qint64 length) { update(data, length); },
		&m_stop, m_progress);

	final();
	LOG(QString("[Hasher] %1 (%2 bytes, %3 chunks): %4")
		.arg(QFileInfo(filepath).fileName()).arg(size).arg(m_chunks).arg(hexDigest()));
	return hexDigest();
}

QFuture<QString> Ed2kHasher::computeContentHash(const QString &filepath)
{
	return QtConcurrent::run([filepath]()
	{
		Ed2kHasher hasher;
		return hasher.computeContentHashSync(filepath);
	});
}

QString Ed2kHasher::hashBytes(const QByteArray &data)
{
	Ed2kHasher hasher;
	hasher.init();
	hasher.update(data.constData(), data.size());
	hasher.final();
	return hasher.hexDigest();
}

QString Ed2kHasher::ed2kLink(const QString &fileName, qint64 size, const QString &hexdigest)
{
	return QString("ed2k://|file|%1|%2|%3|/").arg(fileName).arg(size).arg(hexdigest);
}

void Ed2kHasher::stop()
{
	m_stop = true;
}
