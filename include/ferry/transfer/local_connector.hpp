#pragma once

#include "ferry/transfer/connector.hpp"

#include <filesystem>
#include <string>

namespace ferry {

// Treats a local directory tree as the remote endpoint. Remote paths are
// resolved under root; a path that would leave it is rejected.
class LocalConnector : public ITransferConnector {
public:
  static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

  explicit LocalConnector(std::filesystem::path root);

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

  [[nodiscard]] auto root() const -> const std::filesystem::path& {
    return root_;
  }

  // Maps a remote path onto the filesystem, or an error if it escapes root.
  [[nodiscard]] auto resolve(const std::string& remote) const
      -> TransferResult<std::filesystem::path>;

private:
  [[nodiscard]] auto ensure_connected() const -> TransferResult<void>;

  std::filesystem::path root_;
  bool connected_{false};
};

}  // namespace ferry
