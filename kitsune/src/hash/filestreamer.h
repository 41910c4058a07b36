#ifndef FILESTREAMER_H
#define FILESTREAMER_H

#include <QString>
#include <QMutex>
#include <atomic>
#include <functional>

/**
 * @brief Reads a file in fixed-size parts and hands each part to a consumer
 *
 * Only one part buffer is alive at a time, so memory does not grow with the
 * file size. Throws HashError on a missing/unreadable path, on an I/O error
 * in the middle of the file, and when the stop flag is raised.
 */
class FileStreamer
{
public:
	static constexpr qint64 PART_SIZE = 102400;

	using Consumer = std::function<void(const char *data, qint64 length)>;
	using ProgressCallback = std::function<void(int totalParts, int partsDone)>;

	/**
	 * @brief Stream @p path through @p consumer
	 * @return number of bytes read
	 */
	static qint64 stream(const QString &path, const Consumer &consumer,
						 const std::atomic<bool> *stopFlag = nullptr,
						 const ProgressCallback &progress = ProgressCallback());

	static int calculateParts(qint64 fileSize);

	// Serialize file reads across all threads (one file at a time, for HDDs)
	static void setSerializedIO(bool enabled);
	static bool serializedIO();

private:
	static QMutex fileIOMutex;
	static std::atomic<bool> useSerializedIO;
};

#endif // FILESTREAMER_H
