#ifndef FUTUREUTILS_H
#define FUTUREUTILS_H

#include <QFuture>
#include <QFutureWatcher>
#include <QPromise>
#include <QObject>
#include <exception>
#include <memory>
#include <type_traits>
#include "errors.h"

/**
 * @brief Small helpers for chaining QFuture-based operations on an event loop
 *
 * observe() is the single place where a future's outcome is turned back into
 * callbacks. The callbacks run in the thread of @p context, after control
 * returns to its event loop, even when the future is already finished.
 */
namespace FutureUtils
{

template <typename T>
QFuture<T> makeReady(const T& value)
{
    QPromise<T> promise;
    promise.start();
    promise.addResult(value);
    promise.finish();
    return promise.future();
}

inline QFuture<void> makeReady()
{
    QPromise<void> promise;
    promise.start();
    promise.finish();
    return promise.future();
}

template <typename T>
QFuture<T> makeFailed(const QException& error)
{
    QPromise<T> promise;
    promise.start();
    promise.setException(error);
    promise.finish();
    return promise.future();
}

template <typename T>
QFuture<T> makeFailed(std::exception_ptr error)
{
    QPromise<T> promise;
    promise.start();
    promise.setException(error);
    promise.finish();
    return promise.future();
}

// what() of the stored exception, for log lines
inline QString errorMessage(std::exception_ptr error)
{
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return QString::fromUtf8(e.what());
    }
    catch (...)
    {
        return QStringLiteral("unknown error");
    }
}

/**
 * @brief Run onValue(result) or onError(exception_ptr) when @p future finishes
 *
 * For QFuture<void> onValue takes no argument. A future cancelled without an
 * exception is reported as CancelledError.
 */
template <typename T, typename OnValue, typename OnError>
void observe(QObject* context, const QFuture<T>& future, OnValue onValue, OnError onError)
{
    auto* watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcherBase::finished, context,
        [watcher, onValue, onError]() mutable
        {
            QFuture<T> finished = watcher->future();
            watcher->deleteLater();

            try
            {
                finished.waitForFinished();
            }
            catch (...)
            {
                onError(std::current_exception());
                return;
            }

            if constexpr (std::is_void_v<T>)
            {
                if (finished.isCanceled())
                {
                    onError(std::make_exception_ptr(CancelledError()));
                    return;
                }
                onValue();
            }
            else
            {
                if (finished.isCanceled() || finished.resultCount() == 0)
                {
                    onError(std::make_exception_ptr(CancelledError()));
                    return;
                }
                onValue(finished.result());
            }
        });
    watcher->setFuture(future);
}

/**
 * @brief Forward the outcome of @p future into @p promise
 */
template <typename T>
void forward(QObject* context, const QFuture<T>& future, std::shared_ptr<QPromise<T>> promise)
{
    if constexpr (std::is_void_v<T>)
    {
        observe(context, future,
            [promise]() { promise->finish(); },
            [promise](std::exception_ptr error) { promise->setException(error); promise->finish(); });
    }
    else
    {
        observe(context, future,
            [promise](const T& value) { promise->addResult(value); promise->finish(); },
            [promise](std::exception_ptr error) { promise->setException(error); promise->finish(); });
    }
}

} // namespace FutureUtils

#endif // FUTUREUTILS_H
