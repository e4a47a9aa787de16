#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "chunkvault/core/config.h"
#include "chunkvault/ledger/progress_ledger.h"
#include "chunkvault/storage/chunk_store.h"

namespace chunkvault::transfer {

struct SweepReport {
    std::size_t examined{0};
    std::size_t expired{0};
    std::size_t faults{0};
};

/// @brief Expires idle uploads and releases their held chunk bytes.
///
/// Only public ledger operations are used, so a chunk arriving between the
/// scan and the expiry keeps its session alive.
class ReclamationSweeper {
public:
    ReclamationSweeper(std::shared_ptr<ledger::ProgressLedger> ledger,
                       std::shared_ptr<storage::ChunkStore> chunks, core::CleanupConfig config);

    /// One pass with the configured idle threshold.
    SweepReport RunOnce();
    SweepReport SweepIdleBefore(std::int64_t cutoff_millis);

    /// Schedules RunOnce every sweep interval on the given context.
    void Start(boost::asio::io_context& ioc);
    /// Stops rescheduling; the pending wait ends with the io_context.
    void Stop();

private:
    void Schedule();

    std::shared_ptr<ledger::ProgressLedger> ledger_;
    std::shared_ptr<storage::ChunkStore> chunks_;
    core::CleanupConfig config_;
    std::unique_ptr<boost::asio::steady_timer> timer_;
    std::atomic<bool> stopped_{false};
};

}  // namespace chunkvault::transfer
