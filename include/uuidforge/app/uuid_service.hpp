#pragma once

#include "uuidforge/config/config.hpp"
#include "uuidforge/core/coroutine.hpp"
#include "uuidforge/core/error.hpp"
#include "uuidforge/entropy/entropy_source.hpp"
#include "uuidforge/uuid/name_based.hpp"
#include "uuidforge/uuid/namespaces.hpp"
#include "uuidforge/uuid/render.hpp"
#include "uuidforge/uuid/time_based.hpp"
#include "uuidforge/uuid/uuid.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_future.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace uuidforge {

// Facade over the generators. The entropy source is started explicitly by
// start(); v7 calls before that (or after stop()) fail with
// Error::EntropyUnavailable. v5 and rendering need no start. start() also
// applies the [log] settings and starts the async log writer; stop() drains
// and stops it.
class UuidService {
public:
  UuidService();
  explicit UuidService(Config config);
  // Uses `source` instead of the one named by config.entropy.source; a null
  // `source` falls back to that one.
  UuidService(Config config, std::unique_ptr<EntropySource> source);
  ~UuidService();

  UuidService(const UuidService &) = delete;
  auto operator=(const UuidService &) -> UuidService & = delete;

  [[nodiscard]] auto config() const noexcept -> const Config &;

  // Lifecycle
  // -------------------------------------------------------------------
  [[nodiscard]] auto start() -> Result<void>;
  auto stop() noexcept -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

  // Time-ordered (v7)
  // -----------------------------------------------------------
  [[nodiscard]] auto v7() -> Result<Uuid>;
  [[nodiscard]] auto v7(std::int64_t count) -> Result<std::vector<Uuid>>;

  // Run the blocking entropy draw on the service's worker pool and resume
  // the caller on its own executor.
  [[nodiscard]] auto async_v7() -> task<Result<Uuid>>;
  [[nodiscard]] auto async_v7(std::int64_t count)
      -> task<Result<std::vector<Uuid>>>;

  template <typename T>
  [[nodiscard]] auto sync_wait(task<Result<T>> op) -> Result<T> {
    auto fut = boost::asio::co_spawn(pool_.get_executor(), std::move(op),
                                     boost::asio::use_future);
    return fut.get();
  }

  // Name-based (v5)
  // -------------------------------------------------------------
  [[nodiscard]] auto v5(Namespace tag, std::string_view name) const
      -> Result<Uuid>;
  [[nodiscard]] auto v5(const Uuid &namespace_id, std::string_view name) const
      -> Result<Uuid>;
  [[nodiscard]] auto v5(std::span<const std::uint8_t> namespace_bytes,
                        std::span<const std::byte> name) const -> Result<Uuid>;

  // Rendering
  // -------------------------------------------------------------------
  [[nodiscard]] auto render(const Uuid &id) const -> std::string;
  [[nodiscard]] auto render(const Uuid &id, Format format) const
      -> std::string;
  // Unknown tags fall back to standard unless render.strict_format is set,
  // in which case they are Error::InvalidArgument.
  [[nodiscard]] auto render(const Uuid &id, std::string_view format) const
      -> Result<std::string>;

private:
  Config config_;
  std::unique_ptr<EntropySource> source_;
  V7Generator generator_;
  std::atomic<bool> running_{false};
  mutable std::mutex lifecycle_mu_;
  boost::asio::thread_pool pool_;
};

} // namespace uuidforge
