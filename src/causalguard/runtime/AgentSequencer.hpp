#pragma once

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace runtime {

// Serializes work per causal scope while letting distinct scopes run in
// parallel. Each scope gets its own strand over a shared worker pool.
class AgentSequencer {
public:
    explicit AgentSequencer(std::size_t workers);
    ~AgentSequencer();

    AgentSequencer(const AgentSequencer&) = delete;
    AgentSequencer& operator=(const AgentSequencer&) = delete;

    template <typename Fn>
    std::future<std::invoke_result_t<Fn>> Submit(const std::string& scope, Fn fn) {
        using Result = std::invoke_result_t<Fn>;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        auto future = task->get_future();
        boost::asio::post(StrandFor(scope), [task]() { (*task)(); });
        return future;
    }

    // Blocks until every submitted task has run. No further work is accepted.
    void Shutdown();

private:
    using Strand = boost::asio::strand<boost::asio::thread_pool::executor_type>;

    Strand& StrandFor(const std::string& scope);

    boost::asio::thread_pool pool_;

    std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Strand>> strands_;
    bool stopped_ = false;
};

} // namespace runtime
