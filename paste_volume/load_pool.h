#pragma once

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "paste_lib.h"

//////////////////////////////////////////////////////////////////////
// parses files on worker threads, each parse owns its paste_file

struct load_pool
{
    //////////////////////////////////////////////////////////////////////

    struct load_job
    {
        std::string filename;
        paste_lib::paste_file file;
        paste_lib::paste_error_code result{ paste_lib::ok };
        bool finished{ false };
        std::stop_source stop_src;
    };

    //////////////////////////////////////////////////////////////////////

    load_pool() = default;

    ~load_pool();

    void start_workers(size_t thread_count);

    // queued and running parses stop at their next line and finish as incomplete
    void abort();

    // block until nothing is queued or running
    void wait();

    void shut_down();

    void worker_loop(std::stop_token pool_stoken);

    void add_file(std::string const &filename);

    // in the order the files were added
    std::vector<std::shared_ptr<load_job>> const &results() const
    {
        return jobs;
    }

    //////////////////////////////////////////////////////////////////////

    std::vector<std::jthread> workers;
    std::vector<std::shared_ptr<load_job>> jobs;
    std::deque<std::shared_ptr<load_job>> tasks;
    size_t active_count{};
    std::mutex queue_mutex;
    std::condition_variable_any cv;
    std::condition_variable_any done_cv;
};
