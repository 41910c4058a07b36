#ifndef RATELIMITER_H
#define RATELIMITER_H

#include <QtGlobal>

class Clock;

/**
 * @brief Minimum spacing between outgoing AniDB commands
 *
 * Every command is at least generalIntervalMs after the previous command.
 * FILE commands are additionally at least fileIntervalMs after the previous
 * FILE command.
 *
 * reserve() books the next free slot and records it at once, so callers
 * that reserve back to back get strictly increasing send times even before
 * any of them has actually sent. The caller waits the returned delay on its
 * event loop (QTimer) and sends.
 *
 * Long bulk runs also rest: once slots have followed each other for
 * bulkIntervalMs, the next slot is pushed out by bulkPauseMs and a new run
 * starts. A gap of at least bulkPauseMs between two slots counts as that
 * rest, so an idle client never pauses. Either value at 0 disables it.
 */
class RateLimiter
{
public:
    enum Category
    {
        General,
        File
    };

    RateLimiter(const Clock *clock, int generalIntervalMs = 2000, int fileIntervalMs = 4000);

    void setBulkPause(qint64 intervalMs, qint64 pauseMs);

    /**
     * @brief Book a send slot
     * @return milliseconds to wait before sending, 0 to send immediately
     */
    qint64 reserve(Category category);

    int generalIntervalMs() const { return m_generalIntervalMs; }
    int fileIntervalMs() const { return m_fileIntervalMs; }
    qint64 bulkIntervalMs() const { return m_bulkIntervalMs; }
    qint64 bulkPauseMs() const { return m_bulkPauseMs; }

    // Forget all previous slots
    void reset();

private:
    const Clock *m_clock;
    int m_generalIntervalMs;
    int m_fileIntervalMs;
    qint64 m_lastGeneral;
    qint64 m_lastFile;
    bool m_hasGeneral;
    bool m_hasFile;

    qint64 m_bulkIntervalMs;
    qint64 m_bulkPauseMs;
    qint64 m_bulkStart;     // first slot of the current run
};

#endif // RATELIMITER_H
