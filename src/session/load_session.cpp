#include "raw_view/session/load_session.hpp"
#include "raw_view/core/errors.hpp"
#include "raw_view/core/utils.hpp"
#include "raw_view/image/decoded.hpp"

#include <chrono>
#include <iostream>
#include <optional>

namespace raw_view::session {

namespace {

// Thrown from the progress hook once a newer load has started.
class LoadSuperseded : public RawViewError {
public:
    explicit LoadSuperseded(uint64_t generation)
        : RawViewError("load " + std::to_string(generation) + " superseded") {}
};

Metadata metadata_from(const SensorFrame& frame) {
    Metadata meta;
    if (!frame.make.empty()) meta["Make"] = frame.make;
    if (!frame.model.empty()) meta["Model"] = frame.model;
    return meta;
}

} // namespace

LoadSession::LoadSession(ViewerState& viewer, core::EventEmitter& events,
                         image::ReconstructOptions options)
    : viewer_(viewer), events_(events), options_(std::move(options)) {}

LoadSession::~LoadSession() {
    wait_idle();
}

LoadToken LoadSession::begin_load(const std::string& source) {
    LoadToken token;
    {
        std::lock_guard<std::mutex> lock(install_mutex_);
        token.generation = generation_.fetch_add(1) + 1;
    }
    token.source = source;
    events_.load_start(token.generation, source);
    return token;
}

bool LoadSession::is_current(LoadToken token) const {
    return token.generation == generation_.load();
}

uint64_t LoadSession::current_generation() const {
    return generation_.load();
}

template <typename Job>
void LoadSession::spawn(LoadToken token, Job job) {
    reap_finished();

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, token, job = std::move(job), done]() mutable {
        const auto start = std::chrono::steady_clock::now();
        std::optional<LoadedImage> loaded;
        try {
            loaded = job();
        } catch (const LoadSuperseded&) {
            events_.load_discarded(token.generation, current_generation());
        } catch (const std::exception& e) {
            fail(token, e.what());
        }

        // Only errors from producing the image count as a failed load; once
        // complete() has installed it, the load has succeeded.
        if (loaded) {
            if (loaded->source.empty()) {
                loaded->source = token.source;
            }
            loaded->load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            try {
                complete(token, std::move(*loaded));
            } catch (const std::exception& e) {
                std::cerr << "[LOAD] generation " << token.generation
                          << " completion handler failed: " << e.what() << std::endl;
            }
        }
        done->store(true);
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(Worker{std::move(thread), done});
}

void LoadSession::submit(LoadToken token, SensorFrame frame) {
    spawn(token, [this, token, frame = std::move(frame)]() {
        image::ReconstructOptions opts = options_;
        opts.progress = [this, token](int rows_done, int rows_total) {
            if (!is_current(token)) {
                throw LoadSuperseded(token.generation);
            }
            events_.reconstruct_progress(token.generation, rows_done, rows_total);
        };

        for (Channel c : {Channel::R, Channel::G, Channel::B}) {
            if (frame.wb_coeffs[static_cast<size_t>(channel_index(c))] == 0.0f) {
                events_.warning(token.generation, "white balance gain for channel " +
                                                      channel_to_string(c) + " is zero");
            }
        }

        LoadedImage loaded;
        auto image = std::make_shared<RgbImage>(image::reconstruct(frame, opts));
        loaded.memory_mib = core::memory_footprint_mib(image->width, image->height, 3);
        loaded.image = std::move(image);
        loaded.metadata = metadata_from(frame);
        return loaded;
    });
}

void LoadSession::submit_decoded(LoadToken token, cv::Mat decoded) {
    spawn(token, [decoded = std::move(decoded)]() {
        LoadedImage loaded;
        auto image = std::make_shared<RgbImage>(image::from_decoded(decoded));
        loaded.memory_mib = core::memory_footprint_mib(image->width, image->height, 3);
        loaded.image = std::move(image);
        return loaded;
    });
}

bool LoadSession::complete(LoadToken token, LoadedImage loaded) {
    {
        std::lock_guard<std::mutex> lock(install_mutex_);
        if (token.generation != generation_.load()) {
            events_.load_discarded(token.generation, generation_.load());
            return false;
        }
        viewer_.install(loaded);
    }

    core::json extra = {
        {"load_time_ms", loaded.load_time.count()},
        {"memory_mib", loaded.memory_mib}
    };
    if (loaded.image) {
        extra["width"] = loaded.image->width;
        extra["height"] = loaded.image->height;
    }
    for (const auto& [key, value] : loaded.metadata) {
        extra["metadata"][key] = value;
    }
    events_.load_end(token.generation, true, extra);

    InstalledCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_installed_;
    }
    if (cb) {
        cb(token, loaded);
    }
    return true;
}

void LoadSession::fail(LoadToken token, const std::string& message) {
    if (!is_current(token)) {
        events_.load_discarded(token.generation, current_generation());
        return;
    }
    std::cerr << "[LOAD] generation " << token.generation << " failed: " << message
              << std::endl;
    events_.error(token.generation, message);
    events_.load_end(token.generation, false, {{"error", message}});

    FailureCallback cb;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        cb = on_failure_;
    }
    if (cb) {
        cb(token, message);
    }
}

void LoadSession::reap_finished() {
    std::vector<Worker> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& w : finished) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

void LoadSession::wait_idle() {
    while (true) {
        std::vector<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& w : pending) {
            if (w.thread.joinable()) {
                w.thread.join();
            }
        }
    }
}

void LoadSession::on_failure(FailureCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_failure_ = std::move(cb);
}

void LoadSession::on_installed(InstalledCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    on_installed_ = std::move(cb);
}

} // namespace raw_view::session
