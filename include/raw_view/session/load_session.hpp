#pragma once

#include "raw_view/core/events.hpp"
#include "raw_view/core/types.hpp"
#include "raw_view/image/reconstruction.hpp"
#include "raw_view/session/viewer_state.hpp"

#include <opencv2/core.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace raw_view::session {

struct LoadToken {
    uint64_t generation = 0;
    std::string source;
};

/**
 * Runs image loads off the render thread and installs the results into a
 * ViewerState. Every begin_load() starts a new generation; a completion whose
 * generation is no longer current is dropped, so the most recently requested
 * image always wins regardless of completion order. A failed load leaves the
 * displayed image untouched.
 */
class LoadSession {
public:
    using FailureCallback = std::function<void(LoadToken, const std::string&)>;
    using InstalledCallback = std::function<void(LoadToken, const LoadedImage&)>;

    LoadSession(ViewerState& viewer, core::EventEmitter& events,
                image::ReconstructOptions options = {});
    ~LoadSession();

    LoadSession(const LoadSession&) = delete;
    LoadSession& operator=(const LoadSession&) = delete;

    LoadToken begin_load(const std::string& source);

    bool is_current(LoadToken token) const;
    uint64_t current_generation() const;

    // Reconstruct a Bayer frame on a worker thread.
    void submit(LoadToken token, SensorFrame frame);

    // Pre-decoded standard format; skips demosaicing.
    void submit_decoded(LoadToken token, cv::Mat decoded);

    /**
     * Install a finished image if the token is still current.
     * Returns false when the result was discarded as stale.
     */
    bool complete(LoadToken token, LoadedImage loaded);

    void fail(LoadToken token, const std::string& message);

    // Block until every submitted load has finished.
    void wait_idle();

    void on_failure(FailureCallback cb);
    void on_installed(InstalledCallback cb);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    template <typename Job>
    void spawn(LoadToken token, Job job);

    void reap_finished();

    ViewerState& viewer_;
    core::EventEmitter& events_;
    image::ReconstructOptions options_;

    std::atomic<uint64_t> generation_{0};
    mutable std::mutex install_mutex_;   // orders begin_load against complete
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    std::mutex callback_mutex_;
    FailureCallback on_failure_;
    InstalledCallback on_installed_;
};

} // namespace raw_view::session
