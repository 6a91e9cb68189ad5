/*
 * Copyright © 2015, 2020 Christian Persch
 * Copyright © 2026 the copa authors
 *
 * This library is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this library.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <cerrno>
#include <utility>

#include <unistd.h>

namespace copa::libc {

// Restores errno on destruction
class ErrnoSaver {
public:
        ErrnoSaver() noexcept : m_errsv{errno} { }
        ~ErrnoSaver() noexcept { errno = m_errsv; }

        ErrnoSaver(ErrnoSaver const&) = delete;
        ErrnoSaver& operator=(ErrnoSaver const&) = delete;

        operator int () const noexcept { return m_errsv; }

private:
        int m_errsv;

}; // class ErrnoSaver

/*
 * FD:
 *
 * An owned file descriptor, closed on destruction. Standard input
 * may be wrapped too, and is never closed.
 */
class FD {
public:
        constexpr FD() noexcept = default;
        explicit constexpr FD(int fd) noexcept : m_fd{fd} { }
        FD(FD&& other) noexcept : m_fd{std::exchange(other.m_fd, -1)} { }
        ~FD() noexcept { close_fd(); }

        FD(FD const&) = delete;
        FD& operator=(FD const&) = delete;

        FD& operator=(FD&& other) noexcept
        {
                std::swap(m_fd, other.m_fd);
                return *this;
        }

        explicit constexpr operator bool() const noexcept { return m_fd != -1; }
        constexpr int get() const noexcept { return m_fd; }

private:
        int m_fd{-1};

        void close_fd() noexcept
        {
                if (m_fd == -1 || m_fd == STDIN_FILENO)
                        return;

                auto errsv = ErrnoSaver{};
                ::close(std::exchange(m_fd, -1));
        }

}; // class FD

/*
 * read_retry:
 * @fd:
 * @buf:
 * @len:
 *
 * read(2), restarted when interrupted or when no data is available yet.
 *
 * Returns: the number of bytes read, 0 at end of file, or -1 with errno set
 */
inline ssize_t
read_retry(int fd,
           void* buf,
           size_t len) noexcept
{
        for (;;) {
                auto const r = ::read(fd, buf, len);
                if (r != -1 || (errno != EINTR && errno != EAGAIN))
                        return r;
        }
}

} // namespace copa::libc
