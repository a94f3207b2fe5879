#include "mbk/backup/backup_run.hpp"

#include <algorithm>
#include <array>
#include <unordered_map>
#include <vector>

namespace mbk::backup {
namespace {

bool is_progressive(BackupStatus current, BackupStatus target) {
    static const std::unordered_map<BackupStatus, std::vector<BackupStatus>> transitions {
        {BackupStatus::Queued, {BackupStatus::StoppingMySQL}},
        {BackupStatus::StoppingMySQL, {BackupStatus::Compressing}},
        {BackupStatus::Compressing, {BackupStatus::Encrypting, BackupStatus::Transferring}},
        {BackupStatus::Encrypting, {BackupStatus::Transferring}},
        {BackupStatus::Transferring, {BackupStatus::Verifying}},
        {BackupStatus::Verifying, {BackupStatus::StartingMySQL}},
        {BackupStatus::StartingMySQL, {BackupStatus::Completed}},
    };

    if (target == BackupStatus::Failed || target == BackupStatus::Cancelled) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

constexpr std::array<std::string_view, 10> kStatusNames {
    "Queued", "StoppingMySQL", "Compressing", "Encrypting", "Transferring",
    "Verifying", "StartingMySQL", "Completed", "Failed", "Cancelled",
};

} // namespace

std::string_view to_string(BackupStatus status) noexcept {
    const auto index = static_cast<std::size_t>(status);
    return index < kStatusNames.size() ? kStatusNames[index] : "Unknown";
}

bool is_terminal(BackupStatus status) noexcept {
    return status == BackupStatus::Completed || status == BackupStatus::Failed ||
           status == BackupStatus::Cancelled;
}

BackupRun::BackupRun(std::string operation_id)
    : operation_id_(std::move(operation_id)),
      started_(std::chrono::steady_clock::now()) {
    progress_.operation_id = operation_id_;
    progress_.status = BackupStatus::Queued;
    progress_.current_operation = "Queued";
}

BackupStatus BackupRun::status() const {
    std::lock_guard lock(mutex_);
    return progress_.status;
}

BackupProgress BackupRun::snapshot() const {
    std::lock_guard lock(mutex_);
    auto copy = progress_;
    copy.elapsed = elapsed();
    return copy;
}

Outcome<void> BackupRun::transition_to(BackupStatus next, std::string operation_text) {
    std::lock_guard lock(mutex_);
    if (progress_.status == next) {
        progress_.current_operation = std::move(operation_text);
        return Ok();
    }

    if (!can_transition(next)) {
        return Fail<void>(ErrorCode::Validation,
                          std::string("Illegal backup state transition ") +
                          std::string(to_string(progress_.status)) + " -> " + std::string(to_string(next)));
    }

    progress_.status = next;
    progress_.current_operation = std::move(operation_text);
    if (next == BackupStatus::Completed) {
        progress_.overall_progress = 1.0;
        progress_.eta = std::chrono::milliseconds{0};
    }
    return Ok();
}

Outcome<void> BackupRun::resume_at_transfer(std::string operation_text) {
    std::lock_guard lock(mutex_);
    if (progress_.status != BackupStatus::Queued) {
        return Fail<void>(ErrorCode::Validation, "Only a queued run can resume at Transferring");
    }
    progress_.status = BackupStatus::Transferring;
    progress_.current_operation = std::move(operation_text);
    resumed_ = true;
    return Ok();
}

BackupProgress BackupRun::report(double overall_progress, std::string operation_text) {
    std::lock_guard lock(mutex_);
    progress_.overall_progress = std::clamp(std::max(progress_.overall_progress, overall_progress), 0.0, 1.0);
    if (!operation_text.empty()) {
        progress_.current_operation = std::move(operation_text);
    }
    auto copy = progress_;
    copy.elapsed = elapsed();
    return copy;
}

BackupProgress BackupRun::report_transfer(double overall_progress, const transfer::TransferProgress& progress) {
    std::lock_guard lock(mutex_);
    progress_.overall_progress = std::clamp(std::max(progress_.overall_progress, overall_progress), 0.0, 1.0);
    progress_.bytes_transferred = progress.bytes_transferred;
    progress_.total_bytes = progress.total_bytes;
    progress_.transfer_rate = progress.average_rate;
    progress_.eta = progress.eta;
    progress_.current_operation = "Transferring chunk " + std::to_string(progress.chunks_completed) +
                                  "/" + std::to_string(progress.total_chunks);
    auto copy = progress_;
    copy.elapsed = elapsed();
    return copy;
}

std::chrono::milliseconds BackupRun::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_);
}

bool BackupRun::can_transition(BackupStatus target) const noexcept {
    if (progress_.status == target) {
        return true;
    }

    if (is_terminal(progress_.status)) {
        return false;
    }

    // A resumed run never stopped MySQL, so it has nothing to start.
    if (resumed_ && progress_.status == BackupStatus::Verifying && target == BackupStatus::Completed) {
        return true;
    }

    return is_progressive(progress_.status, target);
}

} // namespace mbk::backup
