// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <bridge/InputTarget.hpp>

#include <filesystem>
#include <string_view>

namespace voicebridge
{

/// @brief Capability level advertised to producers through the side-channel file.
enum class TargetCapability
{
    Basic,
    Surrounding,
};

[[nodiscard]] constexpr auto capabilityToString(TargetCapability capability) -> std::string_view
{
    switch (capability)
    {
        case TargetCapability::Basic: return "basic";
        case TargetCapability::Surrounding: return "surrounding";
    }
    return "basic";
}

/// @brief Reads the capability advertised by the bridge.
///
/// A missing or unreadable file, or unexpected content, reads as Basic.
[[nodiscard]] auto readTargetCapability(const std::filesystem::path& path) -> TargetCapability;

/// @brief Owner of the one-line capability side-channel file.
///
/// Every write replaces the file content. Write failures are logged at debug level and
/// otherwise ignored since producers treat a missing file as "basic". The file is
/// removed when the writer is destroyed.
class CapabilityFile
{
  public:
    explicit CapabilityFile(std::filesystem::path path);
    ~CapabilityFile();

    CapabilityFile(const CapabilityFile&) = delete;
    CapabilityFile& operator=(const CapabilityFile&) = delete;

    void write(TargetCapabilities capabilities);

    /// @brief Removes the file if present.
    void remove() noexcept;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return _path; }

  private:
    std::filesystem::path _path;
};

} // namespace voicebridge
