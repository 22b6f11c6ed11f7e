#include "load_pool.h"
#include "paste_log.h"

LOG_CONTEXT("load_pool", info);

//////////////////////////////////////////////////////////////////////

load_pool::~load_pool()
{
    shut_down();
}

//////////////////////////////////////////////////////////////////////

void load_pool::shut_down()
{
    abort();

    for(auto &w : workers) {
        w.get_stop_source().request_stop();
    }

    cv.notify_all();
    workers.clear();
}

//////////////////////////////////////////////////////////////////////

void load_pool::start_workers(size_t thread_count)
{
    if(thread_count == 0) {
        thread_count = 1;
    }
    for(size_t i = 0; i < thread_count; ++i) {
        workers.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
    }
    LOG_VERBOSE("Started {} workers", thread_count);
}

//////////////////////////////////////////////////////////////////////

void load_pool::add_file(std::string const &filename)
{
    auto job = std::make_shared<load_job>();
    job->filename = filename;
    {
        std::lock_guard lock(queue_mutex);
        jobs.push_back(job);
        tasks.push_back(job);
    }
    cv.notify_one();
}

//////////////////////////////////////////////////////////////////////

void load_pool::abort()
{
    std::lock_guard lock(queue_mutex);

    for(auto &job : jobs) {
        if(!job->finished) {
            job->stop_src.request_stop();
        }
    }
}

//////////////////////////////////////////////////////////////////////

void load_pool::wait()
{
    std::unique_lock lock(queue_mutex);
    done_cv.wait(lock, [this] { return tasks.empty() && active_count == 0; });
}

//////////////////////////////////////////////////////////////////////

void load_pool::worker_loop(std::stop_token pool_stoken)
{
    while(!pool_stoken.stop_requested()) {
        std::shared_ptr<load_job> current_job;
        {
            std::unique_lock lock(queue_mutex);

            // Wait until a file is queued OR stop requested
            if(!cv.wait(lock, pool_stoken, [this] { return !tasks.empty(); })) {
                return;
            }

            current_job = tasks.front();
            tasks.pop_front();
            active_count += 1;
        }

        LOG_VERBOSE("Loading {}", current_job->filename);

        current_job->result = current_job->file.parse_file(current_job->filename.c_str(), current_job->stop_src.get_token());

        if(current_job->result != paste_lib::ok) {
            LOG_ERROR("Error loading {} ({})", current_job->filename, paste_lib::get_error_text(current_job->result));
        }

        {
            std::lock_guard lock(queue_mutex);
            current_job->finished = true;
            active_count -= 1;
        }
        done_cv.notify_all();
    }
}
