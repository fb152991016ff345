#include "uuidforge/app/uuid_service.hpp"

#include "uuidforge/entropy/system_entropy.hpp"
#include "uuidforge/util/log.hpp"
#include "uuidforge/util/time.hpp"

#include <algorithm>
#include <utility>

namespace uuidforge {

UuidService::UuidService() : UuidService(Config{}) {}

UuidService::UuidService(Config config)
    : UuidService(config, make_entropy_source(config.entropy)) {}

UuidService::UuidService(Config config, std::unique_ptr<EntropySource> source)
    : config_(std::move(config)),
      source_(source ? std::move(source)
                     : make_entropy_source(config_.entropy)),
      generator_(*source_),
      pool_(std::max(1U, config_.entropy.workers)) {}

UuidService::~UuidService() {
  stop();
  pool_.join();
}

auto UuidService::config() const noexcept -> const Config & { return config_; }

auto UuidService::start() -> Result<void> {
  std::lock_guard lock(lifecycle_mu_);
  if (running_.load(std::memory_order_acquire)) {
    return ok();
  }

  log::set_level(config_.log.level);
  if (!config_.log.file.empty() && !log::set_output_file(config_.log.file)) {
    log::warn("Cannot open log file '{}', logging to stderr",
              config_.log.file);
  }

  log::start();

  if (auto r = source_->start(); !r) {
    log::error("UUID service failed to start entropy source '{}': {}",
               source_->name(), r.error().message());
    log::stop();
    return fail(r.error());
  }
  running_.store(true, std::memory_order_release);
  log::info("UUID service started (entropy={}, workers={}, format={}{})",
            source_->name(), config_.entropy.workers,
            to_string_view(config_.render.default_format),
            config_.render.strict_format ? ", strict" : "");
  return ok();
}

auto UuidService::stop() noexcept -> void {
  std::lock_guard lock(lifecycle_mu_);
  if (!running_.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  source_->stop();
  log::info("UUID service stopped");
  log::stop();
}

auto UuidService::is_running() const noexcept -> bool {
  return running_.load(std::memory_order_acquire);
}

auto UuidService::v7() -> Result<Uuid> {
  auto id = generator_.generate();
  if (!id) {
    return fail(id.error());
  }
  log::trace("v7 {} at {}", *id,
             util::format_iso8601_millis(
                 static_cast<std::int64_t>(id->unix_millis().value_or(0))));
  return id;
}

auto UuidService::v7(std::int64_t count) -> Result<std::vector<Uuid>> {
  return generator_.generate_batch(count);
}

auto UuidService::async_v7() -> task<Result<Uuid>> {
  co_return co_await boost::asio::co_spawn(
      pool_, [this]() -> task<Result<Uuid>> { co_return v7(); },
      use_awaitable);
}

auto UuidService::async_v7(std::int64_t count)
    -> task<Result<std::vector<Uuid>>> {
  co_return co_await boost::asio::co_spawn(
      pool_,
      [this, count]() -> task<Result<std::vector<Uuid>>> {
        co_return v7(count);
      },
      use_awaitable);
}

auto UuidService::v5(Namespace tag, std::string_view name) const
    -> Result<Uuid> {
  return generate_v5(tag, name);
}

auto UuidService::v5(const Uuid &namespace_id, std::string_view name) const
    -> Result<Uuid> {
  return generate_v5(namespace_id, name);
}

auto UuidService::v5(std::span<const std::uint8_t> namespace_bytes,
                     std::span<const std::byte> name) const -> Result<Uuid> {
  return generate_v5(namespace_bytes, name);
}

auto UuidService::render(const Uuid &id) const -> std::string {
  return uuidforge::render(id, config_.render.default_format);
}

auto UuidService::render(const Uuid &id, Format format) const -> std::string {
  return uuidforge::render(id, format);
}

auto UuidService::render(const Uuid &id, std::string_view format) const
    -> Result<std::string> {
  if (!config_.render.strict_format) {
    return ok(uuidforge::render(id, parse<Format>(format)));
  }
  auto parsed = parse_format_strict(format);
  if (!parsed) {
    log::warn("Rejected unknown render format '{}'", format);
    return fail(parsed.error());
  }
  return ok(uuidforge::render(id, *parsed));
}

} // namespace uuidforge
