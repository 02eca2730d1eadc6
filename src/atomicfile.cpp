/*
 * Copyright (C) 2025 The debhost developers
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "atomicfile.h"

#include <cerrno>
#include <cstring>
#include <format>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

#include "logging.h"
#include "utils.h"

namespace DebHost
{

AtomicFile::AtomicFile(const fs::path &target)
    : m_target(target),
      m_fd(-1),
      m_committed(false)
{
    m_tmpPath = target.parent_path() / std::format(".{}.{}.tmp", target.filename().string(), Utils::randomString(8));

    m_fd = ::open(m_tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (m_fd < 0)
        throw std::runtime_error(
            std::format("Unable to create temporary file '{}': {}", m_tmpPath.string(), std::strerror(errno)));
}

AtomicFile::~AtomicFile()
{
    if (!m_committed)
        discard();
}

void AtomicFile::discard() noexcept
{
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }

    std::error_code ec;
    fs::remove(m_tmpPath, ec);
    if (ec)
        logWarning("Unable to remove temporary file '{}': {}", m_tmpPath.string(), ec.message());
}

void AtomicFile::write(const void *data, std::size_t len)
{
    if (m_fd < 0)
        throw std::runtime_error(std::format("Temporary file for '{}' is not open", m_target.string()));

    const auto *ptr = static_cast<const char *>(data);
    while (len > 0) {
        const auto written = ::write(m_fd, ptr, len);
        if (written < 0) {
            if (errno == EINTR)
                continue;
            throw std::runtime_error(
                std::format("Unable to write to '{}': {}", m_tmpPath.string(), std::strerror(errno)));
        }
        ptr += written;
        len -= static_cast<std::size_t>(written);
    }
}

void AtomicFile::write(std::string_view data)
{
    write(data.data(), data.size());
}

void AtomicFile::write(const std::vector<std::uint8_t> &data)
{
    write(data.data(), data.size());
}

void AtomicFile::commit()
{
    if (m_committed)
        return;
    if (m_fd < 0)
        throw std::runtime_error(std::format("Temporary file for '{}' is not open", m_target.string()));

    if (::fsync(m_fd) != 0)
        throw std::runtime_error(std::format("Unable to sync '{}': {}", m_tmpPath.string(), std::strerror(errno)));

    const int fd = m_fd;
    m_fd = -1;
    if (::close(fd) != 0)
        throw std::runtime_error(std::format("Unable to close '{}': {}", m_tmpPath.string(), std::strerror(errno)));

    if (::rename(m_tmpPath.c_str(), m_target.c_str()) != 0)
        throw std::runtime_error(std::format(
            "Unable to move '{}' into place as '{}': {}", m_tmpPath.string(), m_target.string(), std::strerror(errno)));

    m_committed = true;
}

void writeFileAtomically(const fs::path &target, std::string_view data)
{
    AtomicFile file(target);
    file.write(data);
    file.commit();
}

void writeFileAtomically(const fs::path &target, const std::vector<std::uint8_t> &data)
{
    AtomicFile file(target);
    file.write(data);
    file.commit();
}

} // namespace DebHost
