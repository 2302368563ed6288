/*
 * Read whitespace-separated integers from standard input and report
 * the count and sum of each consecutive chunk of them.
 *
 * With --take, only the first N items of each chunk are read; the rest
 * are skipped, and chunk boundaries stay where they were.
 */

#include <cstddef>
#include <iostream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/format.h>
#include <tinyopt/tinyopt.h>

#include <chunkit/chunk_size.hpp>
#include <chunkit/chunkexcept.hpp>
#include <chunkit/chunks.hpp>
#include <chunkit/version.hpp>

struct options {
    std::size_t size = 4;
    int take = -1;
    bool version = false;
};

const char* usage_str =
    "[OPTION]...\n"
    "\n"
    "  -n, --size=N      group input into chunks of N integers (4)\n"
    "  -t, --take=N      read at most N integers of each chunk (all)\n"
    "  -V, --version     print version and exit\n"
    "  -h, --help        display usage information and exit\n";

std::optional<options> read_options(int argc, char** argv) {
    auto help = [argv] { to::usage(argv[0], usage_str); };

    // Stricter than tinyopt's default std::size_t parser, which accepts
    // a leading sign or whitespace.
    auto size_parser = [](const char* text) {
        return to::just(chunkit::parse_chunk_size(text));
    };

    options opt;
    to::option cli_opts[] = {
        { to::sink(opt.size, size_parser),       "-n", "--size" },
        { opt.take,                              "-t", "--take" },
        { to::set(opt.version), to::flag,        "-V", "--version" },
        { to::action(help),     to::flag, to::exit, "-h", "--help" }
    };

    if (!to::run(cli_opts, argc, argv+1)) return std::nullopt;
    if (argv[1]) throw to::option_error("unrecognized argument", argv[1]);
    if (opt.take==0 || opt.take<-1) throw to::option_error("take must be positive", std::to_string(opt.take));

    return opt;
}

int main(int argc, char** argv) {
    try {
        auto opt = read_options(argc, argv);
        if (!opt) return 0;

        if (opt->version) {
            std::cout << fmt::format("chunkit {} ({})\n", chunkit::version, chunkit::source_id);
            return 0;
        }

        auto cs = chunkit::chunks(std::istream_iterator<long long>(std::cin), std::istream_iterator<long long>(), opt->size);

        constexpr long long max_sum = std::numeric_limits<long long>::max();
        constexpr long long min_sum = std::numeric_limits<long long>::min();

        std::size_t index = 0;
        while (auto c = cs.next()) {
            std::size_t count = 0;
            long long sum = 0;

            for (auto v: *c) {
                ++count;
                if ((v>0 && sum>max_sum-v) || (v<0 && sum<min_sum-v)) {
                    throw std::overflow_error(fmt::format("sum of chunk {} overflows", index));
                }
                sum += v;
                if (opt->take>0 && count==static_cast<std::size_t>(opt->take)) break;
            }
            std::cout << fmt::format("{:>6} {:>6} {:>12}\n", index++, count, sum);
        }

        if (!std::cin.eof()) {
            std::cerr << "chunkstat: stopped at non-integer input\n";
            return 1;
        }
    }
    catch (to::option_error& e) {
        to::usage_error(argv[0], "[OPTION]...\nTry '--help' for more information.", e.what());
        return 1;
    }
    catch (chunkit::chunkit_exception& e) {
        std::cerr << "chunkstat: " << e.what() << "\n";
        return 1;
    }
    catch (std::overflow_error& e) {
        std::cerr << "chunkstat: " << e.what() << "\n";
        return 1;
    }
    catch (std::exception& e) {
        std::cerr << "caught exception: " << e.what() << "\n";
        return 2;
    }
}
