/*
 * Copyright © 2020 Hans Petter Jansson <hpj@cl.no>
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

#include "config.h"

#include <glib.h>
#include <locale.h>

#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <fmt/format.h>

#include "glib-glue.hh"
#include "std-glue.hh"

/*
 * Generator:
 *
 * Writes a random mix of text, valid and invalid UTF-8, controls,
 * and well-formed or broken control sequences and strings, for
 * feeding into copa-cat.
 */
class Generator {
private:
        GRand* m_rand;
        fmt::memory_buffer m_buf{};

        static inline constexpr auto const k_flush_size = size_t{1 << 16};

        inline int range(int begin,
                         int end) noexcept
        {
                return g_rand_int_range(m_rand, begin, end);
        }

        inline bool chance(int percent) noexcept
        {
                return range(0, 100) < percent;
        }

        inline void byte(int c)
        {
                m_buf.push_back(char(c));
        }

        void text()
        {
                for (auto n = range(1, 40); n > 0; --n)
                        byte(range(0x20, 0x7f));
        }

        void utf8()
        {
                for (auto n = range(1, 10); n > 0; --n) {
                        auto c = gunichar{};
                        switch (range(0, 3)) {
                        case 0: c = gunichar(range(0xa0, 0x800)); break;
                        case 1: c = gunichar(range(0x800, 0xd800)); break;
                        default: c = gunichar(range(0x10000, 0x110000)); break;
                        }

                        char ubuf[8];
                        auto const len = g_unichar_to_utf8(c, ubuf);
                        // Sometimes cut the sequence short
                        auto const cut = (len > 1 && chance(5)) ? range(1, len) : len;
                        m_buf.append(ubuf, ubuf + cut);
                }
        }

        void invalid()
        {
                for (auto n = range(1, 5); n > 0; --n)
                        byte(range(0x80, 0x100));
        }

        void control()
        {
                auto c = range(0, 0x20);
                if (c == 0x1b)
                        c = 0x0a;
                byte(c);
        }

        void params()
        {
                if (chance(20))
                        byte(range(0x3c, 0x40));

                auto const n = chance(5) ? range(30, 40) : range(0, 6);
                for (auto i = 0; i < n; ++i) {
                        if (i > 0)
                                byte(chance(20) ? ':' : ';');
                        if (chance(10))
                                continue; // default parameter
                        auto const digits = chance(5) ? range(6, 12) : range(1, 4);
                        for (auto d = 0; d < digits; ++d)
                                byte(range('0', '9' + 1));
                }
        }

        void intermediates()
        {
                auto const n = chance(80) ? 0 : range(1, 4);
                for (auto i = 0; i < n; ++i)
                        byte(range(0x20, 0x30));
        }

        void maybe_interrupt()
        {
                if (!chance(3))
                        return;

                switch (range(0, 3)) {
                case 0: byte(0x18); break; // CAN
                case 1: byte(0x1a); break; // SUB
                default: byte(0x1b); break;
                }
        }

        void st()
        {
                if (chance(10)) {
                        byte(0x9c);
                } else {
                        byte(0x1b);
                        byte('\\');
                }
        }

        void escape()
        {
                byte(0x1b);
                intermediates();
                byte(range(0x30, 0x7f));
        }

        void csi()
        {
                if (chance(5)) {
                        byte(0x9b);
                } else {
                        byte(0x1b);
                        byte('[');
                }
                params();
                maybe_interrupt();
                intermediates();
                byte(range(0x40, 0x7f));
        }

        void payload(int max_len)
        {
                for (auto n = range(0, max_len); n > 0; --n) {
                        if (chance(2))
                                byte(range(0, 0x20));
                        else
                                byte(range(0x20, 0x100));
                }
        }

        void osc()
        {
                byte(0x1b);
                byte(']');
                auto const n = range(1, 20);
                for (auto i = 0; i < n; ++i) {
                        if (i > 0)
                                byte(';');
                        payload(chance(1) ? 4096 : 16);
                }
                maybe_interrupt();
                if (chance(50))
                        byte(0x07);
                else
                        st();
        }

        void dcs()
        {
                byte(0x1b);
                byte('P');
                params();
                intermediates();
                byte(range(0x40, 0x7f));
                payload(64);
                maybe_interrupt();
                st();
        }

        void sos_pm_apc()
        {
                static constexpr char const introducers[] = {'X', '^', '_'};

                byte(0x1b);
                byte(introducers[range(0, 3)]);
                payload(64);
                maybe_interrupt();
                if (chance(20))
                        byte(0x07);
                else
                        st();
        }

        void flush() noexcept
        {
                fwrite(m_buf.data(), 1, m_buf.size(), stdout);
                m_buf.clear();
        }

public:
        explicit Generator(GRand* rand) noexcept
                : m_rand{rand}
        {
        }

        ~Generator() noexcept
        {
                flush();
                fflush(stdout);
        }

        void generate(size_t length)
        {
                auto total = size_t{0};
                while (total < length) {
                        auto const before = m_buf.size();

                        switch (range(0, 12)) {
                        case 0: case 1: case 2: text(); break;
                        case 3: utf8(); break;
                        case 4: invalid(); break;
                        case 5: control(); break;
                        case 6: escape(); break;
                        case 7: case 8: csi(); break;
                        case 9: osc(); break;
                        case 10: dcs(); break;
                        default: sos_pm_apc(); break;
                        }

                        total += m_buf.size() - before;
                        if (m_buf.size() >= k_flush_size)
                                flush();
                }
        }

}; // class Generator

class Options {
private:
        int64_t m_seed{0};
        int m_length{1 << 20};

public:
        Options() noexcept = default;
        Options(Options const&) = delete;
        Options(Options&&) = delete;

        ~Options() = default;

        inline constexpr int64_t seed() const noexcept { return m_seed; }
        inline constexpr size_t length() const noexcept { return size_t(m_length); }

        bool parse(int argc,
                   char* argv[],
                   GError** error) noexcept
        {
                {
                        using Int64Option = copa::OptionValue<int64_t, gint64>;
                        using IntOption = copa::OptionValue<int, int>;

                        auto seed = Int64Option{m_seed, g_get_real_time()};
                        auto length = IntOption{m_length, 1 << 20};

                        GOptionEntry const entries[] = {
                                { "seed", 0, 0, G_OPTION_ARG_INT64, &seed,
                                  "Random seed", "N" },
                                { "length", 0, 0, G_OPTION_ARG_INT, &length,
                                  "Number of bytes to write", "N" },
                                { nullptr },
                        };

                        auto context = copa::take_freeable(g_option_context_new("— parser fuzzer"));
                        g_option_context_set_help_enabled(context.get(), true);
                        g_option_context_add_main_entries(context.get(), entries, nullptr);

                        if (!g_option_context_parse(context.get(), &argc, &argv, error))
                                return false;
                }

                if (m_length < 0) {
                        g_set_error(error, G_OPTION_ERROR, G_OPTION_ERROR_BAD_VALUE,
                                    "Length must not be negative");
                        return false;
                }

                return true;
        }
}; // class Options

int
main(int argc,
     char *argv[])
{
        setlocale(LC_ALL, "");

        auto options = Options{};
        auto error = copa::glib::Error{};
        if (!options.parse(argc, argv, error)) {
                fmt::println(stderr, "Failed to parse arguments: {}", error.message());
                return EXIT_FAILURE;
        }

        fmt::println(stderr, "Seed: {}", options.seed());

        auto rand = copa::take_freeable(g_rand_new_with_seed(guint32(options.seed())));
        auto generator = Generator{rand.get()};
        generator.generate(options.length());

        return EXIT_SUCCESS;
}
