#ifndef ED2KHASHER_H
#define ED2KHASHER_H

#include <QString>
#include <QByteArray>
#include <QCryptographicHash>
#include <QFuture>
#include <atomic>
#include "filestreamer.h"

/**
 * @brief ED2K (eDonkey2000) content hash
 *
 * The file is split into 9,728,000-byte chunks and every chunk is hashed
 * with MD4.
 * - size <= one chunk: the digest is MD4 of the whole file (MD4 of zero
 *   bytes for an empty file)
 * - size > one chunk: the digest is MD4 over the concatenated chunk digests
 *
 * Files that are an exact multiple of the chunk size get no extra empty-chunk
 * digest appended (the "blue" variant, as used by AniDB).
 *
 * Input is fed through update() in any granularity; the digest depends only
 * on the bytes.
 */
class Ed2kHasher
{
public:
	static constexpr qint64 CHUNK_SIZE = 9728000;

	using ProgressCallback = FileStreamer::ProgressCallback;

	Ed2kHasher();

	void init();
	void update(const char *input, qint64 inputLen);
	QByteArray final();

	/**
	 * @brief Lowercase hex of the last final() digest (32 characters)
	 */
	QString hexDigest() const;

	/**
	 * @brief Hash a file, blocking the calling thread
	 * @throws HashError FileNotFound / ReadError / Cancelled
	 */
	QString computeContentHashSync(const QString &filepath);

	/**
	 * @brief Hash a file on the global thread pool
	 *
	 * Same digest as computeContentHashSync(); failures are rethrown from the
	 * future as HashError.
	 */
	static QFuture<QString> computeContentHash(const QString &filepath);

	// Hash an in-memory buffer
	static QString hashBytes(const QByteArray &data);

	// ed2k://|file|<name>|<size>|<hash>|/
	static QString ed2kLink(const QString &fileName, qint64 size, const QString &hexdigest);

	void setProgressCallback(ProgressCallback callback) { m_progress = std::move(callback); }

	// Abort an in-progress computeContentHashSync() from another thread
	void stop();

	int chunksCompleted() const { return m_chunks; }

private:
	void closeChunk();

	QCryptographicHash m_chunkHash;    // MD4 of the chunk being filled
	QCryptographicHash m_rootHash;     // MD4 over completed chunk digests
	qint64 m_chunkFill;
	int m_chunks;
	QByteArray m_firstChunkDigest;
	QByteArray m_digest;
	std::atomic<bool> m_stop;
	ProgressCallback m_progress;
};

#endif // ED2KHASHER_H
