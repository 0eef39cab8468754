/// @file src/appusage/workspace/run_loop.cpp
/// @brief Implementation for the run loop.

#include "./run_loop.h"

namespace appusage
{
    namespace workspace
    {
        const std::chrono::milliseconds RunLoop::cDefaultPumpInterval{100};

        RunLoop::RunLoop() noexcept : mStopRequested{false}
        {
        }

        void RunLoop::Post(Task task)
        {
            if (!task)
            {
                return;
            }

            {
                std::lock_guard<std::mutex> _lock(mMutex);
                mTasks.push_back(std::move(task));
            }
            mCondition.notify_one();
        }

        std::size_t RunLoop::RunOnce(std::chrono::milliseconds timeout)
        {
            std::deque<Task> _tasks;
            {
                std::unique_lock<std::mutex> _lock(mMutex);
                mCondition.wait_for(
                    _lock,
                    timeout,
                    [this]()
                    { return !mTasks.empty() || mStopRequested.load(); });
                _tasks.swap(mTasks);
            }

            for (auto &task : _tasks)
            {
                task();
            }

            return _tasks.size();
        }

        void RunLoop::Run(
            std::chrono::milliseconds pumpInterval,
            StopPredicate stopPredicate)
        {
            while (!mStopRequested.load())
            {
                if (stopPredicate && stopPredicate())
                {
                    break;
                }

                (void)RunOnce(pumpInterval);
            }
        }

        void RunLoop::Stop() noexcept
        {
            {
                std::lock_guard<std::mutex> _lock(mMutex);
                mStopRequested.store(true);
            }
            mCondition.notify_all();
        }

        void RunLoop::Reset() noexcept
        {
            mStopRequested.store(false);
        }

        bool RunLoop::IsStopRequested() const noexcept
        {
            return mStopRequested.load();
        }

        std::size_t RunLoop::GetPendingCount() const
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mTasks.size();
        }
    }
}
