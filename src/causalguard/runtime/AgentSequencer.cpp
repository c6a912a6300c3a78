#include "runtime/AgentSequencer.hpp"

#include <stdexcept>

namespace runtime {

AgentSequencer::AgentSequencer(std::size_t workers)
    : pool_{workers == 0 ? 1 : workers} {}

AgentSequencer::~AgentSequencer() { Shutdown(); }

void AgentSequencer::Shutdown() {
    {
        std::lock_guard<std::mutex> lock{mutex_};
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }
    pool_.join();
}

AgentSequencer::Strand& AgentSequencer::StrandFor(const std::string& scope) {
    std::lock_guard<std::mutex> lock{mutex_};
    if (stopped_) {
        throw std::runtime_error("sequencer is shut down");
    }

    auto& slot = strands_[scope];
    if (!slot) {
        slot = std::make_unique<Strand>(boost::asio::make_strand(pool_.get_executor()));
    }
    return *slot;
}

} // namespace runtime
