#include "guardsig/monitor/signing_monitor.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/fmt/fmt.h>

#include "guardsig/common/log.hpp"

namespace guardsig {
namespace {

enum class Bucket {
  kActive,
  kCompleted,
  kFailed,
  kExpired,
};

struct Sample {
  TimePoint created_at;
  std::optional<TimePoint> completed_at;
  Bucket bucket = Bucket::kActive;
};

Bucket Classify(SigningSessionStatus status, TimePoint expires_at, TimePoint now) {
  switch (status) {
    case SigningSessionStatus::kCompleted:
      return Bucket::kCompleted;
    case SigningSessionStatus::kFailed:
      return Bucket::kFailed;
    case SigningSessionStatus::kExpired:
      return Bucket::kExpired;
    case SigningSessionStatus::kPending:
    case SigningSessionStatus::kCollectingCommitments:
    case SigningSessionStatus::kSigning:
    case SigningSessionStatus::kAggregating:
      break;
  }
  return now >= expires_at ? Bucket::kExpired : Bucket::kActive;
}

Bucket Classify(ReconstructionStatus status, TimePoint expires_at, TimePoint now) {
  switch (status) {
    case ReconstructionStatus::kCompleted:
      return Bucket::kCompleted;
    case ReconstructionStatus::kFailed:
      return Bucket::kFailed;
    case ReconstructionStatus::kExpired:
      return Bucket::kExpired;
    case ReconstructionStatus::kPending:
      break;
  }
  return now >= expires_at ? Bucket::kExpired : Bucket::kActive;
}

MethodMetrics Summarize(const std::vector<Sample>& samples) {
  MethodMetrics out;
  std::chrono::milliseconds completion_total{0};
  for (const Sample& sample : samples) {
    ++out.total;
    switch (sample.bucket) {
      case Bucket::kActive:
        ++out.active;
        break;
      case Bucket::kCompleted:
        ++out.completed;
        if (sample.completed_at.has_value()) {
          completion_total +=
              std::chrono::duration_cast<std::chrono::milliseconds>(*sample.completed_at - sample.created_at);
        }
        break;
      case Bucket::kFailed:
        ++out.failed;
        break;
      case Bucket::kExpired:
        ++out.expired;
        break;
    }
  }

  const size_t finished = out.finished();
  if (finished > 0) {
    out.success_rate = static_cast<double>(out.completed) / static_cast<double>(finished);
    out.failure_rate = static_cast<double>(out.failed) / static_cast<double>(finished);
    out.expiry_rate = static_cast<double>(out.expired) / static_cast<double>(finished);
  }
  if (out.completed > 0) {
    out.average_completion_time = completion_total / static_cast<int64_t>(out.completed);
  }
  return out;
}

std::string Percent(double rate) {
  return fmt::format("{:.1f}%", rate * 100.0);
}

}  // namespace

SigningMonitor::SigningMonitor(ISigningStore& store,
                               ThresholdSessionManager& sessions,
                               ReconstructionCoordinator& reconstructions,
                               MonitorConfig config,
                               std::shared_ptr<spdlog::logger> logger)
    : store_(store),
      sessions_(sessions),
      reconstructions_(reconstructions),
      config_(config),
      logger_(LoggerOrDefault(std::move(logger))) {}

SigningMetrics SigningMonitor::GetMetrics(TimePoint now) {
  SigningMetrics metrics;
  metrics.window_end = now;
  metrics.window_start = now - config_.metrics_window;

  std::vector<Sample> threshold_samples;
  for (const SigningSession& session : store_.ListSessions()) {
    if (session.created_at < metrics.window_start || session.created_at > now) {
      continue;
    }
    threshold_samples.push_back(Sample{
        .created_at = session.created_at,
        .completed_at = session.completed_at,
        .bucket = Classify(session.status, session.expires_at, now),
    });
  }

  std::vector<Sample> reconstruction_samples;
  for (const ReconstructionRequest& request : store_.ListRequests()) {
    if (request.created_at < metrics.window_start || request.created_at > now) {
      continue;
    }
    reconstruction_samples.push_back(Sample{
        .created_at = request.created_at,
        .completed_at = request.completed_at,
        .bucket = Classify(request.status, request.expires_at, now),
    });
  }

  std::vector<Sample> all = threshold_samples;
  all.insert(all.end(), reconstruction_samples.begin(), reconstruction_samples.end());

  metrics.threshold_signature = Summarize(threshold_samples);
  metrics.key_reconstruction = Summarize(reconstruction_samples);
  metrics.combined = Summarize(all);
  return metrics;
}

AlertDecision SigningMonitor::ShouldAlert(const SigningMetrics& metrics) const {
  AlertDecision decision;
  const MethodMetrics& combined = metrics.combined;

  if (combined.finished() >= config_.min_finished_for_alert) {
    if (combined.failure_rate > config_.failure_rate_alert) {
      decision.reasons.push_back("failure rate " + Percent(combined.failure_rate) + " exceeds " +
                                 Percent(config_.failure_rate_alert));
    }
    if (combined.expiry_rate > config_.expiry_rate_alert) {
      decision.reasons.push_back("expiry rate " + Percent(combined.expiry_rate) + " exceeds " +
                                 Percent(config_.expiry_rate_alert));
    }
  }
  if (combined.active > config_.max_active) {
    decision.reasons.push_back(std::to_string(combined.active) + " active operations exceed limit of " +
                               std::to_string(config_.max_active));
  }

  decision.alert = !decision.reasons.empty();
  return decision;
}

std::vector<ActivityEntry> SigningMonitor::GetRecentActivity(size_t limit) {
  std::vector<ActivityEntry> out;
  for (const SigningSession& session : store_.ListSessions()) {
    out.push_back(ActivityEntry{
        .id = session.session_id,
        .method = SigningMethod::kThresholdSignature,
        .status = ToString(session.status),
        .created_at = session.created_at,
        .updated_at = session.updated_at,
        .completed_at = session.completed_at,
    });
  }
  for (const ReconstructionRequest& request : store_.ListRequests()) {
    out.push_back(ActivityEntry{
        .id = request.request_id,
        .method = SigningMethod::kKeyReconstruction,
        .status = ToString(request.status),
        .created_at = request.created_at,
        .updated_at = request.updated_at,
        .completed_at = request.completed_at,
    });
  }

  std::sort(out.begin(), out.end(), [](const ActivityEntry& a, const ActivityEntry& b) {
    return a.created_at > b.created_at;
  });
  if (out.size() > limit) {
    out.resize(limit);
  }
  return out;
}

SweepReport SigningMonitor::RunSweep(TimePoint now) {
  SweepReport report;
  report.sessions_expired = sessions_.ExpireOldSessions(now);
  report.requests_expired = reconstructions_.ExpireOldRequests(now);
  report.sessions_deleted = sessions_.CleanupOldSessions(now);
  report.requests_deleted = reconstructions_.CleanupOldRequests(now);

  logger_->info("sweep: expired {} sessions and {} requests, deleted {} sessions and {} requests",
                report.sessions_expired, report.requests_expired, report.sessions_deleted,
                report.requests_deleted);
  return report;
}

}  // namespace guardsig
