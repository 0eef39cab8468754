/// @file src/appusage/workspace/run_loop.h
/// @brief Declarations for the run loop.

#ifndef APPUSAGE_WORKSPACE_RUN_LOOP_H
#define APPUSAGE_WORKSPACE_RUN_LOOP_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

namespace appusage
{
    namespace workspace
    {
        /// @brief Single-threaded delivery loop fed by notification sources
        /// @details Sources post tasks from their own threads; the tasks are executed
        ///          strictly one after another on the thread that pumps the loop.
        ///          Pumping blocks for at most the given interval so that the owner
        ///          can observe shutdown requests while otherwise idle.
        class RunLoop
        {
        public:
            /// @brief Delivery task type
            using Task = std::function<void()>;
            /// @brief Predicate polled once per pump to end Run()
            using StopPredicate = std::function<bool()>;

            /// @brief Default pump interval
            static const std::chrono::milliseconds cDefaultPumpInterval;

        private:
            mutable std::mutex mMutex;
            std::condition_variable mCondition;
            std::deque<Task> mTasks;
            std::atomic_bool mStopRequested;

        public:
            RunLoop() noexcept;
            RunLoop(const RunLoop &) = delete;
            RunLoop &operator=(const RunLoop &) = delete;
            ~RunLoop() noexcept = default;

            /// @brief Enqueue a task for execution on the pumping thread
            /// @param task Task to be executed
            /// @note Thread-safe
            void Post(Task task);

            /// @brief Wait for tasks up to a timeout and execute all pending ones
            /// @param timeout Maximum waiting duration if the queue is empty
            /// @returns Number of executed tasks
            std::size_t RunOnce(std::chrono::milliseconds timeout);

            /// @brief Pump the loop until a stop is requested
            /// @param pumpInterval Maximum blocking duration of a single pump
            /// @param stopPredicate Optional external stop condition
            void Run(
                std::chrono::milliseconds pumpInterval = cDefaultPumpInterval,
                StopPredicate stopPredicate = nullptr);

            /// @brief Request Run() to return
            /// @note Thread-safe
            void Stop() noexcept;

            /// @brief Clear a previous stop request
            void Reset() noexcept;

            /// @brief Check whether a stop has been requested
            /// @returns True if Stop() has been called since the last reset
            bool IsStopRequested() const noexcept;

            /// @brief Get the number of tasks waiting for execution
            /// @returns Pending task count
            std::size_t GetPendingCount() const;
        };
    }
}

#endif
