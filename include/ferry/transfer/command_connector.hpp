#pragma once

#include "ferry/config/system_config.hpp"
#include "ferry/transfer/connector.hpp"
#include "ferry/transfer/process.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace ferry {

// Single-quotes value for /bin/sh.
[[nodiscard]] auto shell_quote(std::string_view value) -> std::string;

// Delegates every operation to an external command (ssh by default)
// built from the configured templates.
class CommandConnector : public ITransferConnector {
public:
  explicit CommandConnector(ConnectorConfig config);

  [[nodiscard]] auto connect() -> TransferResult<void> override;
  auto disconnect() -> void override;
  [[nodiscard]] auto is_connected() const -> bool override {
    return connected_;
  }

  [[nodiscard]] auto upload(const std::string& local,
                            const std::string& remote,
                            const ProgressCallback& on_progress)
      -> TransferResult<void> override;
  [[nodiscard]] auto download(const std::string& remote,
                              const std::string& local,
                              const ProgressCallback& on_progress)
      -> TransferResult<void> override;
  [[nodiscard]] auto remove(const std::string& remote)
      -> TransferResult<void> override;
  [[nodiscard]] auto list(const std::string& remote_dir)
      -> TransferResult<std::vector<RemoteEntry>> override;

  // Expands a template; unknown placeholders are left as they are.
  [[nodiscard]] auto render(std::string_view tmpl, std::string_view local,
                            std::string_view remote) const -> std::string;

private:
  [[nodiscard]] auto run(std::string_view op, const std::string& tmpl,
                         std::string_view local, std::string_view remote)
      -> TransferResult<ProcessResult>;

  ConnectorConfig config_;
  std::chrono::seconds timeout_;
  bool connected_{false};
};

}  // namespace ferry
