// SPDX-License-Identifier: Apache-2.0
#include "CapabilityFile.hpp"

#include <core/Log.hpp>

#include <fstream>
#include <string>

namespace voicebridge
{

auto readTargetCapability(const std::filesystem::path& path) -> TargetCapability
{
    auto file = std::ifstream(path);
    if (!file.is_open())
        return TargetCapability::Basic;

    auto line = std::string {};
    std::getline(file, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' '))
        line.pop_back();

    return line == capabilityToString(TargetCapability::Surrounding) ? TargetCapability::Surrounding
                                                                     : TargetCapability::Basic;
}

CapabilityFile::CapabilityFile(std::filesystem::path path): _path(std::move(path))
{
}

CapabilityFile::~CapabilityFile()
{
    remove();
}

void CapabilityFile::write(TargetCapabilities capabilities)
{
    auto const capability =
        capabilities.supportsSurroundingText ? TargetCapability::Surrounding : TargetCapability::Basic;

    auto file = std::ofstream(_path, std::ios::trunc);
    if (!file.is_open())
    {
        log::debug("Cannot write capability file {}", _path.string());
        return;
    }

    file << capabilityToString(capability) << '\n';
    if (!file)
        log::debug("Short write to capability file {}", _path.string());
}

void CapabilityFile::remove() noexcept
{
    auto ec = std::error_code {};
    std::filesystem::remove(_path, ec);
}

} // namespace voicebridge
