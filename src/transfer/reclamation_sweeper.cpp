#include "chunkvault/transfer/reclamation_sweeper.h"

#include <chrono>
#include <exception>

#include <boost/system/error_code.hpp>

#include "chunkvault/core/logger.h"
#include "chunkvault/core/time.h"
#include "chunkvault/observability/metrics.h"

namespace chunkvault::transfer {

namespace {
bool IsReclaimable(ledger::SessionState state) {
    return state == ledger::SessionState::kPending || state == ledger::SessionState::kInProgress;
}
}  // namespace

ReclamationSweeper::ReclamationSweeper(std::shared_ptr<ledger::ProgressLedger> ledger,
                                       std::shared_ptr<storage::ChunkStore> chunks,
                                       core::CleanupConfig config)
    : ledger_(std::move(ledger)), chunks_(std::move(chunks)), config_(config) {}

SweepReport ReclamationSweeper::RunOnce() {
    const auto cutoff = core::NowEpochMillis() -
                        static_cast<std::int64_t>(config_.idle_threshold_seconds) * 1000;
    return SweepIdleBefore(cutoff);
}

SweepReport ReclamationSweeper::SweepIdleBefore(std::int64_t cutoff_millis) {
    SweepReport report;
    const auto limit = static_cast<std::size_t>(config_.max_sessions_per_sweep);
    for (const auto& session : ledger_->ListAll()) {
        if (!IsReclaimable(session.state) || session.last_activity_at >= cutoff_millis) {
            continue;
        }
        if (report.examined >= limit) {
            break;
        }
        ++report.examined;

        // One broken session must not stop the pass.
        try {
            auto expired = ledger_->ExpireIfIdle(session.filename, session.owner,
                                                 session.upload_id, cutoff_millis);
            if (!expired.ok()) {
                ++report.faults;
                observability::RecordSweepFault();
                core::LogError("sweeper could not expire " + session.filename + ": " +
                               expired.error().message);
                continue;
            }
            if (!expired.value()) {
                continue;
            }
            ++report.expired;
            core::LogTransferEvent(
                "session_expired", session.owner, session.filename,
                core::JsonFields{{"upload_id", session.upload_id},
                                 {"bytes_received", std::to_string(session.bytes_received)}});
            auto purged = chunks_->Purge(session.filename, session.owner, session.upload_id);
            if (!purged.ok()) {
                ++report.faults;
                observability::RecordSweepFault();
                core::LogError("sweeper could not purge " + session.filename + ": " +
                               purged.error().message);
            }
        } catch (const std::exception& ex) {
            ++report.faults;
            observability::RecordSweepFault();
            core::LogError("sweeper fault on " + session.filename + ": " + ex.what());
        }
    }
    observability::RecordSessionsExpired(report.expired);
    if (report.examined > 0) {
        core::LogInfo("sweep examined " + std::to_string(report.examined) + ", expired " +
                      std::to_string(report.expired) + ", faults " +
                      std::to_string(report.faults));
    }
    return report;
}

void ReclamationSweeper::Start(boost::asio::io_context& ioc) {
    if (!config_.enabled) {
        return;
    }
    stopped_ = false;
    timer_ = std::make_unique<boost::asio::steady_timer>(ioc);
    Schedule();
}

void ReclamationSweeper::Stop() {
    // A pending wait still completes, but its handler neither sweeps nor reschedules.
    stopped_ = true;
}

void ReclamationSweeper::Schedule() {
    if (!timer_ || stopped_) {
        return;
    }
    timer_->expires_after(std::chrono::seconds(config_.sweep_interval_seconds));
    timer_->async_wait([this](const boost::system::error_code& ec) {
        if (ec || stopped_) {
            return;
        }
        RunOnce();
        Schedule();
    });
}

}  // namespace chunkvault::transfer
