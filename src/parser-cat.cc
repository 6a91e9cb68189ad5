/*
 * Copyright © 2017, 2018 Christian Persch
 * Copyright © 2026 the copa authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "config.h"

#include <glib.h>
#include <locale.h>
#include <unistd.h>
#include <fcntl.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <iterator>
#include <numeric>
#include <span>
#include <string>
#include <utility>

#include <fmt/color.h>

#include "boxed.hh"
#include "debug.hh"
#include "fmt-glue.hh"
#include "glib-glue.hh"
#include "libc-glue.hh"
#include "parser-fmt.hh"
#include "parser.hh"
#include "std-glue.hh"

using namespace std::literals;

using copa::parser::Intermediates;
using copa::parser::OscFields;
using copa::parser::Params;

class PrettyPrinter final : public copa::parser::Performer {
private:
        std::string m_str;
        bool m_plain;
        bool m_codepoints;
        bool m_line_open{false};

        static inline constexpr auto const k_flush_size = size_t{4096};

        // Writes out the buffer, leaving the line open
        void
        flush() noexcept
        {
                if (std::fwrite(m_str.data(), 1, m_str.size(), stdout) != m_str.size())
                        g_warning("Short write on standard output");
                m_str.clear();
                m_line_open = true;
        }

        // Writes out the buffer and ends the line
        void
        printout() noexcept
        {
                flush();
                if (std::fputc('\n', stdout) == EOF)
                        g_warning("Short write on standard output");
                m_line_open = false;
        }

        void
        maybe_flush() noexcept
        {
                if (m_str.size() >= k_flush_size) [[unlikely]]
                        flush();
        }

        template<typename... T>
        void
        emit(fmt::text_style const& style,
             fmt::format_string<T...> fmt,
             T&&... args)
        {
                if (m_plain)
                        fmt::format_to(std::back_inserter(m_str), fmt, std::forward<T>(args)...);
                else
                        fmt::format_to(std::back_inserter(m_str), style, fmt, std::forward<T>(args)...);

                maybe_flush();
        }

        static inline constexpr auto seq_style() noexcept
        {
                return fmt::text_style(fmt::emphasis::reverse);
        }

        static inline constexpr auto string_style() noexcept
        {
                return fmt::fg(fmt::terminal_color::green) | fmt::text_style(fmt::emphasis::reverse);
        }

        static inline constexpr auto ignore_style() noexcept
        {
                return fmt::fg(fmt::terminal_color::red) | fmt::text_style(fmt::emphasis::reverse);
        }

        void
        string_byte(uint8_t byte)
        {
                if (byte >= 0x20 && byte < 0x7f)
                        m_str.push_back(char(byte));
                else
                        fmt::format_to(std::back_inserter(m_str), "<{}>", copa::parser::control_t(byte));

                maybe_flush();
        }

public:
        PrettyPrinter(bool plain,
                      bool codepoints) noexcept
                : m_plain{plain},
                  m_codepoints{codepoints}
        {
        }

        ~PrettyPrinter() noexcept
        {
                if (m_line_open || !m_str.empty())
                        printout();
        }

        void print(char32_t c) override
        {
                fmt::format_to(std::back_inserter(m_str),
                               fmt::runtime(m_codepoints ? "{:u}" : "{}"),
                               copa::boxed<char32_t>{c});
                maybe_flush();
        }

        void execute(uint8_t control) override
        {
                emit(seq_style(), "{{{}}}", copa::parser::control_t(control));
                if (control == 0x0a /* LF */)
                        printout();
        }

        void csi_dispatch(Params const& params,
                          Intermediates const& intermediates,
                          bool ignore,
                          char final) override
        {
                emit(ignore ? ignore_style() : seq_style(),
                     "{{CSI {} {} {}}}", params, intermediates, final);
        }

        void esc_dispatch(Intermediates const& intermediates,
                          bool ignore,
                          char final) override
        {
                emit(ignore ? ignore_style() : seq_style(),
                     "{{ESC {} {}}}", intermediates, final);
        }

        void hook(Params const& params,
                  Intermediates const& intermediates,
                  bool ignore,
                  char final) override
        {
                emit(ignore ? ignore_style() : string_style(),
                     "{{DCS {} {} {} ", params, intermediates, final);
        }

        void put(uint8_t byte) override
        {
                string_byte(byte);
        }

        void unhook() override
        {
                emit(string_style(), "}}");
        }

        void osc_dispatch(OscFields const& fields,
                          bool bell_terminated) override
        {
                emit(string_style(), "{{OSC {} {}}}", fields, bell_terminated ? "BEL"sv : "ST"sv);
        }

        void sos_start() override { emit(string_style(), "{{SOS "); }
        void sos_put(uint8_t byte) override { string_byte(byte); }
        void sos_end() override { emit(string_style(), "}}"); }

        void pm_start() override { emit(string_style(), "{{PM "); }
        void pm_put(uint8_t byte) override { string_byte(byte); }
        void pm_end() override { emit(string_style(), "}}"); }

        void apc_start() override { emit(string_style(), "{{APC "); }
        void apc_put(uint8_t byte) override { string_byte(byte); }
        void apc_end() override { emit(string_style(), "}}"); }

}; // class PrettyPrinter

class Sink final : public copa::parser::Performer {
}; // class Sink

/*
 * Statistics:
 *
 * Counts the callbacks by the action that caused them, and passes
 * them on to the delegate.
 */
class Statistics final : public copa::parser::Performer {
private:
        using Action = copa::parser::Action;

        copa::parser::Performer& m_delegate;
        std::array<gsize, copa::parser::k_n_actions> m_stats{};
        gsize m_ignored{0};

        inline void count(Action action) noexcept
        {
                ++m_stats[std::to_underlying(action)];
        }

public:
        explicit Statistics(copa::parser::Performer& delegate) noexcept
                : m_delegate{delegate}
        {
        }

        void print(char32_t c) override
        {
                count(Action::PRINT);
                m_delegate.print(c);
        }

        void execute(uint8_t control) override
        {
                count(Action::EXECUTE);
                m_delegate.execute(control);
        }

        void csi_dispatch(Params const& params,
                          Intermediates const& intermediates,
                          bool ignore,
                          char final) override
        {
                count(Action::CSI_DISPATCH);
                m_ignored += ignore;
                m_delegate.csi_dispatch(params, intermediates, ignore, final);
        }

        void esc_dispatch(Intermediates const& intermediates,
                          bool ignore,
                          char final) override
        {
                count(Action::ESC_DISPATCH);
                m_ignored += ignore;
                m_delegate.esc_dispatch(intermediates, ignore, final);
        }

        void hook(Params const& params,
                  Intermediates const& intermediates,
                  bool ignore,
                  char final) override
        {
                count(Action::HOOK);
                m_ignored += ignore;
                m_delegate.hook(params, intermediates, ignore, final);
        }

        void put(uint8_t byte) override
        {
                count(Action::PUT);
                m_delegate.put(byte);
        }

        void unhook() override
        {
                count(Action::UNHOOK);
                m_delegate.unhook();
        }

        void osc_dispatch(OscFields const& fields,
                          bool bell_terminated) override
        {
                count(Action::OSC_END);
                m_delegate.osc_dispatch(fields, bell_terminated);
        }

        void sos_start() override { count(Action::STRING_START); m_delegate.sos_start(); }
        void sos_put(uint8_t byte) override { count(Action::STRING_PUT); m_delegate.sos_put(byte); }
        void sos_end() override { count(Action::STRING_END); m_delegate.sos_end(); }

        void pm_start() override { count(Action::STRING_START); m_delegate.pm_start(); }
        void pm_put(uint8_t byte) override { count(Action::STRING_PUT); m_delegate.pm_put(byte); }
        void pm_end() override { count(Action::STRING_END); m_delegate.pm_end(); }

        void apc_start() override { count(Action::STRING_START); m_delegate.apc_start(); }
        void apc_put(uint8_t byte) override { count(Action::STRING_PUT); m_delegate.apc_put(byte); }
        void apc_end() override { count(Action::STRING_END); m_delegate.apc_end(); }

        void print_statistics() const noexcept
        {
                for (auto a = 0u; a < copa::parser::k_n_actions; ++a) {
                        if (m_stats[a] > 0)
                                fmt::println(stderr, "{:>16} {}", m_stats[a], Action(a));
                }

                fmt::println(stderr, "{:>16} ignored dispatches", m_ignored);
        }

}; // class Statistics

class Processor {
private:
        copa::parser::Performer& m_delegate;
        size_t m_buffer_size{0};
        bool m_benchmark{false};

        copa::Freeable<GArray> m_bench_times;

        copa::parser::Parser m_parser{};

        bool
        process_fd(int fd,
                   uint8_t* buf)
        {
                for (;;) {
                        auto const len = copa::libc::read_retry(fd, buf, m_buffer_size);
                        if (len == -1) {
                                auto errsv = copa::libc::ErrnoSaver{};
                                fmt::println(stderr, "Error reading: {}", g_strerror(errsv));
                                return false;
                        }
                        if (len == 0)
                                break;

                        m_parser.advance(m_delegate, {buf, size_t(len)});
                }

                return true;
        }

        bool
        process_file(int fd,
                     int repeat)
        {
                if (fd == STDIN_FILENO && repeat != 1) {
                        fmt::println(stderr, "Cannot consume STDIN more than once");
                        return false;
                }

                auto buf = copa::glib::take_free_ptr(g_new0(uint8_t, m_buffer_size));

                for (auto i = 0; i < repeat; ++i) {
                        if (i > 0 && lseek(fd, 0, SEEK_SET) != 0) {
                                auto errsv = copa::libc::ErrnoSaver{};
                                fmt::println(stderr, "Failed to seek: {}", g_strerror(errsv));
                                return false;
                        }

                        auto const start_time = g_get_monotonic_time();

                        if (!process_fd(fd, buf.get()))
                                return false;

                        auto const time_spent = int64_t{g_get_monotonic_time() - start_time};
                        g_array_append_val(m_bench_times.get(), time_spent);

                        m_parser.reset();
                }

                return true;
        }

public:
        Processor(copa::parser::Performer& delegate,
                  size_t buffer_size,
                  bool benchmark,
                  bool scalar) noexcept
                : m_delegate{delegate},
                  m_buffer_size{buffer_size},
                  m_benchmark{benchmark},
                  m_bench_times{g_array_new(false, true, sizeof(int64_t))}
        {
                m_parser.set_fast_path(!scalar);
        }

        ~Processor() noexcept
        {
                if (m_benchmark)
                        print_benchmark();
        }

        bool
        process_files(char const* const* filenames,
                      int repeat)
        {
                if (filenames == nullptr)
                        return process_file(STDIN_FILENO, repeat);

                for (auto i = 0; filenames[i] != nullptr; i++) {
                        char const* filename = filenames[i];

                        auto fd = copa::libc::FD{};
                        if (g_str_equal(filename, "-")) {
                                fd = copa::libc::FD{STDIN_FILENO};
                        } else {
                                fd = copa::libc::FD{open(filename, O_RDONLY | O_CLOEXEC)};
                                if (!fd) {
                                        auto errsv = copa::libc::ErrnoSaver{};
                                        fmt::println(stderr,
                                                     "Error opening file \"{}\": {}",
                                                     filename,
                                                     g_strerror(errsv));
                                        continue;
                                }
                        }

                        if (!process_file(fd.get(), repeat))
                                return false;
                }

                return true;
        }

        void print_benchmark() const noexcept
        {
                auto const times = std::span{reinterpret_cast<int64_t*>(m_bench_times->data),
                                             m_bench_times->len};
                if (times.empty())
                        return;

                std::ranges::sort(times);
                auto const total = std::accumulate(times.begin(), times.end(), int64_t{0});

                fmt::println(stderr,
                             "\nTimes: best {}µs worst {}µs average {}µs",
                             times.front(),
                             times.back(),
                             total / int64_t(times.size()));
                for (auto const t : times)
                        fmt::println(stderr, "  {:>10}µs", t);
        }

}; // class Processor

class Options {
private:
        bool m_benchmark{false};
        bool m_codepoints{false};
        bool m_plain{false};
        bool m_quiet{false};
        bool m_scalar{false};
        bool m_statistics{false};
        bool m_version{false};
        int m_buffer_size{16384};
        int m_repeat{1};
        copa::glib::StrvPtr m_filenames{};

public:

        Options() noexcept = default;
        Options(Options const&) = delete;
        Options(Options&&) = delete;

        ~Options() = default;

        inline constexpr bool   benchmark()   const noexcept { return m_benchmark;  }
        inline constexpr size_t buffer_size() const noexcept { return size_t(m_buffer_size); }
        inline constexpr bool   codepoints()  const noexcept { return m_codepoints; }
        inline constexpr bool   plain()       const noexcept { return m_plain;      }
        inline constexpr bool   quiet()       const noexcept { return m_quiet;      }
        inline constexpr bool   scalar()      const noexcept { return m_scalar;     }
        inline constexpr bool   statistics()  const noexcept { return m_statistics; }
        inline constexpr bool   version()     const noexcept { return m_version;    }
        inline constexpr int    repeat()      const noexcept { return m_repeat;     }
        inline char const* const* filenames() const noexcept { return m_filenames.get(); }

        bool parse(int argc,
                   char* argv[],
                   GError** error) noexcept
        {
                {
                        using BoolOption = copa::OptionValue<bool, gboolean>;
                        using IntOption = copa::OptionValue<int, int>;
                        using StrvOption = copa::OptionValue<copa::glib::StrvPtr, char**>;

                        auto benchmark = BoolOption{m_benchmark, false};
                        auto codepoints = BoolOption{m_codepoints, false};
                        auto plain = BoolOption{m_plain, false};
                        auto quiet = BoolOption{m_quiet, false};
                        auto scalar = BoolOption{m_scalar, false};
                        auto statistics = BoolOption{m_statistics, false};
                        auto version = BoolOption{m_version, false};
                        auto buffer_size = IntOption{m_buffer_size, 16384};
                        auto repeat = IntOption{m_repeat, 1};
                        auto filenames = StrvOption{m_filenames, nullptr};

                        GOptionEntry const entries[] = {
                                { "benchmark", 'b', 0, G_OPTION_ARG_NONE, &benchmark,
                                  "Measure time spent parsing each file", nullptr },
                                { "buffer-size", 'B', 0, G_OPTION_ARG_INT, &buffer_size,
                                  "Buffer size", "SIZE" },
                                { "codepoints", 'u', 0, G_OPTION_ARG_NONE, &codepoints,
                                  "Output unicode code points by number", nullptr },
                                { "plain", 'p', 0, G_OPTION_ARG_NONE, &plain,
                                  "Output plain text without attributes", nullptr },
                                { "quiet", 'q', 0, G_OPTION_ARG_NONE, &quiet,
                                  "Suppress output except for statistics and benchmark", nullptr },
                                { "repeat", 'r', 0, G_OPTION_ARG_INT, &repeat,
                                  "Repeat each file COUNT times", "COUNT" },
                                { "scalar", 0, 0, G_OPTION_ARG_NONE, &scalar,
                                  "Disable the vectorised text path", nullptr },
                                { "statistics", 's', 0, G_OPTION_ARG_NONE, &statistics,
                                  "Output statistics", nullptr },
                                { "version", 0, 0, G_OPTION_ARG_NONE, &version,
                                  "Print version information and exit", nullptr },
                                { G_OPTION_REMAINING, 0, 0, G_OPTION_ARG_FILENAME_ARRAY, &filenames,
                                  nullptr, nullptr },
                                { nullptr },
                        };

                        auto context = copa::take_freeable(g_option_context_new("[FILE…] — parser cat"));
                        g_option_context_set_help_enabled(context.get(), true);
                        g_option_context_add_main_entries(context.get(), entries, nullptr);

                        if (!g_option_context_parse(context.get(), &argc, &argv, error))
                                return false;
                }

                if (m_buffer_size < 1) {
                        g_set_error(error, G_OPTION_ERROR, G_OPTION_ERROR_BAD_VALUE,
                                    "Buffer size must be positive");
                        return false;
                }

                if (m_repeat < 1) {
                        g_set_error(error, G_OPTION_ERROR, G_OPTION_ERROR_BAD_VALUE,
                                    "Repeat count must be positive");
                        return false;
                }

                return true;
        }
}; // class Options

static bool
process(Options const& options,
        copa::parser::Performer& delegate)
{
        auto stats = Statistics{delegate};
        auto& performer = options.statistics() ? static_cast<copa::parser::Performer&>(stats) : delegate;

        auto rv = false;
        {
                auto proc = Processor{performer,
                                      options.buffer_size(),
                                      options.benchmark(),
                                      options.scalar()};
                rv = proc.process_files(options.filenames(), options.repeat());
        }

        if (options.statistics())
                stats.print_statistics();

        return rv;
}

int
main(int argc,
     char *argv[])
{
        setlocale(LC_ALL, "");

        _copa_debug_init();

        Options options{};
        auto error = copa::glib::Error{};
        if (!options.parse(argc, argv, error)) {
                fmt::println(stderr,
                             "Failed to parse arguments: {}",
                             error.message());
                return EXIT_FAILURE;
        }

        if (options.version()) {
                fmt::println("{} {}", PACKAGE_NAME, PACKAGE_VERSION);
                return EXIT_SUCCESS;
        }

        auto rv = false;
        try {
                if (options.quiet()) {
                        auto sink = Sink{};
                        rv = process(options, sink);
                } else {
                        auto printer = PrettyPrinter{options.plain(), options.codepoints()};
                        rv = process(options, printer);
                }
        } catch (...) {
                copa::glib::set_error_from_exception(error);
                fmt::println(stderr, "Error: {}", error.message());
                return EXIT_FAILURE;
        }

        return rv ? EXIT_SUCCESS : EXIT_FAILURE;
}
