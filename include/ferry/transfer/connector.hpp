#pragma once

#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <vector>

namespace ferry {

// Connector errors are free-form messages from whatever performs the
// transfer; the scheduler stores them verbatim in last_error.
template <typename T>
using TransferResult = std::expected<T, std::string>;

// (bytes_done, bytes_total). Called synchronously from inside the operation.
using ProgressCallback = std::function<void(std::int64_t, std::int64_t)>;

struct RemoteEntry {
  std::string name;
  bool is_dir{false};
  std::int64_t size{0};
  std::int64_t mtime{0};  // seconds since epoch, 0 when unknown
};

// One remote endpoint. Every call is synchronous and returns once the
// operation finished or failed.
class ITransferConnector {
public:
  virtual ~ITransferConnector() = default;

  [[nodiscard]] virtual auto connect() -> TransferResult<void> = 0;
  virtual auto disconnect() -> void = 0;
  [[nodiscard]] virtual auto is_connected() const -> bool = 0;

  [[nodiscard]] virtual auto upload(const std::string& local,
                                    const std::string& remote,
                                    const ProgressCallback& on_progress)
      -> TransferResult<void> = 0;

  [[nodiscard]] virtual auto download(const std::string& remote,
                                      const std::string& local,
                                      const ProgressCallback& on_progress)
      -> TransferResult<void> = 0;

  [[nodiscard]] virtual auto remove(const std::string& remote)
      -> TransferResult<void> = 0;

  [[nodiscard]] virtual auto list(const std::string& remote_dir)
      -> TransferResult<std::vector<RemoteEntry>> = 0;
};

}  // namespace ferry
