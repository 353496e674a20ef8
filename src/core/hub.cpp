#include "core/hub.hpp"

#include <algorithm>
#include <cstddef>
#include <iostream>

#include "core/timestamp.hpp"
#include "storage/store_factory.hpp"

namespace fleet_hub::core {

namespace {

std::int64_t days_ms(const std::uint32_t days) { return static_cast<std::int64_t>(days) * kMillisPerDay; }

}  // namespace

Hub::Hub(HubConfig config)
    : config_(std::move(config)),
      events_(config_.gateway.subscriber_queue_capacity,
              config_.gateway.subscriber_disconnect_on_overflow ? gateway::OverflowPolicy::DISCONNECT
                                                                : gateway::OverflowPolicy::DROP_OLDEST) {
  const auto now_ms = unix_timestamp_now_ms();

  database_ = std::make_unique<SqliteDatabase>(config_.database_path);
  auth_store_ = std::make_unique<auth::AuthStore>(*database_);
  auth_store_->ensure_schema();
  authenticator_ = std::make_unique<auth::Authenticator>(config_.auth, *auth_store_);
  authenticator_->bootstrap();
  resolver_ = std::make_unique<auth::PermissionResolver>(*auth_store_);
  audit_ = std::make_unique<control::AuditLog>(*database_);
  audit_->ensure_schema();

  if (config_.history.enabled) {
    history_ = std::make_unique<storage::HistoryArchive>(
        *database_, storage::HistoryOptions{.retention_days = config_.history.retention_days,
                                            .hourly_retention_days = config_.history.hourly_retention_days,
                                            .daily_retention_days = config_.history.daily_retention_days});
    history_->ensure_schema(now_ms);
  }
  storage_ = std::make_unique<storage::StorageEngine>(storage::make_time_series_store(config_.storage),
                                                      config_.storage.max_entries, history_.get());

  gateway_ = std::make_unique<gateway::Gateway>(gateway::make_gateway_options(config_.server, config_.gateway),
                                                registry_, *storage_, events_, *authenticator_);
  dispatcher_ = std::make_unique<control::CommandDispatcher>(*gateway_, *resolver_, *authenticator_, *audit_,
                                                             registry_, config_.command_timeout);
  gateway_->set_reply_listener(dispatcher_.get());

  api_service_ = std::make_unique<api::ApiService>(api::ApiDependencies{.registry = registry_,
                                                                        .storage = *storage_,
                                                                        .history = history_.get(),
                                                                        .auth_store = *auth_store_,
                                                                        .authenticator = *authenticator_,
                                                                        .resolver = *resolver_,
                                                                        .dispatcher = *dispatcher_,
                                                                        .audit = *audit_,
                                                                        .events = events_});
  api_server_ = std::make_unique<api::ApiServer>(
      api::ApiServerOptions{.bind_address = config_.server.bind_address,
                            .port = config_.server.api_port,
                            .read_timeout = config_.gateway.read_timeout,
                            .write_timeout = config_.gateway.write_timeout,
                            .max_line_bytes = config_.gateway.max_frame_bytes},
      *api_service_, events_);

  register_maintenance_tasks();
}

Hub::~Hub() { stop(); }

void Hub::start() {
  if (started_) {
    return;
  }
  gateway_->start();
  api_server_->start();
  maintenance_.start();
  started_ = true;
}

void Hub::stop() {
  if (!started_) {
    return;
  }
  started_ = false;
  maintenance_.stop();
  // API threads blocked in dispatch must return before they can be joined.
  dispatcher_->shutdown();
  api_server_->stop();
  events_.close_all();
  gateway_->set_reply_listener(nullptr);
  gateway_->stop();
  storage_->close();
  std::cerr << "[hub] stopped\n";
}

void Hub::register_maintenance_tasks() {
  const auto now_ms = unix_timestamp_now_ms();
  const auto cleanup_every = std::chrono::duration_cast<std::chrono::milliseconds>(config_.history.cleanup_interval);

  if (history_ != nullptr) {
    maintenance_.add_task(
        "history.aggregate",
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.history.aggregation_interval),
        [this](const std::int64_t now) {
          const std::int64_t previous_hour = (now / kMillisPerHour - 1) * kMillisPerHour;
          if (rollup_watermark_ms_ == 0) {
            rollup_watermark_ms_ = now - days_ms(config_.history.retention_days);
          }
          // Hours missed while the hub was down get their rollups on the next run.
          const auto hourly = history_->backfill_hourly(rollup_watermark_ms_, previous_hour) +
                              history_->aggregate_hourly(previous_hour);
          const std::int64_t previous_day = (now / kMillisPerDay - 1) * kMillisPerDay;
          std::size_t daily = 0;
          const std::int64_t first_day =
              std::min(rollup_watermark_ms_ - (rollup_watermark_ms_ % kMillisPerDay), previous_day);
          for (std::int64_t day = first_day; day <= previous_day; day += kMillisPerDay) {
            daily += history_->aggregate_daily(day);
          }
          rollup_watermark_ms_ = previous_hour;
          for (const auto& mismatch : history_->reconcile_hourly(previous_hour)) {
            std::cerr << "[maintenance] hourly rollup for " << mismatch.agent_id << " at " << mismatch.bucket_ms
                      << " has " << mismatch.rollup_points << " points, source has " << mismatch.source_points
                      << '\n';
          }
          if (hourly > 0 || daily > 0) {
            std::cerr << "[maintenance] aggregated " << hourly << " hourly and " << daily << " daily rollups\n";
          }
        },
        now_ms + kMillisPerMinute);

    maintenance_.add_task("history.partitions", cleanup_every, [this](const std::int64_t now) {
      history_->ensure_partition(now);
      history_->ensure_partition(now + kMillisPerDay);
      for (const auto& dropped : history_->drop_expired_partitions(now)) {
        std::cerr << "[maintenance] dropped partition " << dropped << '\n';
      }
      const auto pruned = history_->prune_rollups(now);
      if (pruned > 0) {
        std::cerr << "[maintenance] pruned " << pruned << " rollup rows\n";
      }
    });
  }

  maintenance_.add_task("audit.retention", cleanup_every, [this](const std::int64_t now) {
    const auto pruned = audit_->prune(now - days_ms(config_.audit_retention_days));
    if (pruned > 0) {
      std::cerr << "[maintenance] pruned " << pruned << " audit entries\n";
    }
  });

  maintenance_.add_task("storage.retention", cleanup_every, [this](const std::int64_t now) {
    storage_->delete_before(now - days_ms(config_.storage.retention_days));
  });
}

}  // namespace fleet_hub::core
