#include "filestreamer.h"
#include "../errors.h"
#include "../logger.h"
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QByteArray>

QMutex FileStreamer::fileIOMutex;
std::atomic<bool> FileStreamer::useSerializedIO(false);

void FileStreamer::setSerializedIO(bool enabled)
{
	useSerializedIO = enabled;
	if (enabled)
	{
		LOG("[Hasher] Serialized I/O enabled - optimized for HDD performance");
	}
	else
	{
		LOG("[Hasher] Serialized I/O disabled - optimized for SSD/parallel I/O");
	}
}

bool FileStreamer::serializedIO()
{
	return useSerializedIO;
}

int FileStreamer::calculateParts(qint64 fileSize)
{
	qint64 parts = (fileSize + PART_SIZE - 1) / PART_SIZE;
	if (parts == 0)
	{
		parts = 1; // empty files still report one part
	}
	return static_cast<int>(parts);
}

qint64 FileStreamer::stream(const QString &path, const Consumer &consumer,
							const std::atomic<bool> *stopFlag,
							const ProgressCallback &progress)
{
	QFileInfo fileinfo(path);
	if (!fileinfo.exists() || !fileinfo.isFile() || !fileinfo.isReadable())
	{
		throw HashError(HashError::FileNotFound, path);
	}

	QMutexLocker ioLocker(useSerializedIO ? &fileIOMutex : nullptr);

	QFile file(fileinfo.absoluteFilePath());
	if (!file.open(QIODevice::ReadOnly))
	{
		throw HashError(HashError::FileNotFound, path, file.errorString());
	}

	const int parts = calculateParts(file.size());
	int partsDone = 0;
	qint64 total = 0;
	QByteArray buffer(static_cast<int>(PART_SIZE), Qt::Uninitialized);

	while (!file.atEnd())
	{
		if (stopFlag && stopFlag->load())
		{
			throw HashError(HashError::Cancelled, path);
		}

		const qint64 n = file.read(buffer.data(), PART_SIZE);
		if (n < 0)
		{
			throw HashError(HashError::ReadError, path, file.errorString());
		}
		if (n == 0)
		{
			break;
		}
		consumer(buffer.constData(), n);
		total += n;

		partsDone++;
		if (progress)
		{
			progress(parts, partsDone);
		}
	}

	if (file.error() != QFileDevice::NoError)
	{
		throw HashError(HashError::ReadError, path, file.errorString());
	}
	if (partsDone == 0 && progress)
	{
		progress(parts, parts);
	}
	return total;
}
