/**
 * @file PersistenceService.hpp
 * @brief Centralized service for serialized, atomic writes of collection files.
 */

#pragma once
#include <string>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <future>

namespace iconforge::infrastructure {

/**
 * @struct SaveTask
 * @brief Represents a single file write operation.
 */
struct SaveTask {
    std::string filename;
    std::string content;
    std::promise<bool> done;
};

/**
 * @class PersistenceService
 * @brief Manages a background thread that performs atomic file writes sequentially.
 *
 * All writes pass through a single queue; each lands in a temporary file that is renamed
 * over the target, so readers never see a half-written collection.
 */
class PersistenceService {
public:
    PersistenceService();
    ~PersistenceService();

    /**
     * @brief Asynchronously queues a text content to be saved to a file.
     * @param filename Path to the file; missing parent directories are created.
     * @return Becomes true once the file is in place, false if the write failed.
     */
    std::future<bool> saveTextAsync(const std::string& filename, const std::string& content);

    /**
     * @brief Stops the worker thread and ensures all pending tasks are processed.
     */
    void stop();

private:
    /**
     * @brief The main loop running in the background thread.
     */
    void workerLoop();

    /**
     * @brief Performs the actual atomic write (temp -> rename).
     */
    bool performAtomicWrite(const SaveTask& task);

    // Thread Safety
    std::queue<SaveTask> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cv;

    // Worker Control
    std::thread m_worker;
    std::atomic<bool> m_running;
};

} // namespace iconforge::infrastructure
