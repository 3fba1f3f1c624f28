#include <calcexpr/big_float.hpp>
#include <calcexpr/errors.hpp>
#include <calcexpr/parser.hpp>
#include <calcexpr/rounding.hpp>

#include <iostream>
#include <optional>
#include <string>

namespace {

struct Options {
    calcexpr::AngleUnit angle_unit{calcexpr::AngleUnit::Radians};
    bool precise{false};
};

void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [--deg | --rad] [--precise]\n"
              << "  --deg      trigonometry in degrees\n"
              << "  --rad      trigonometry in radians (default)\n"
              << "  --precise  256-bit GMP floats instead of double\n";
}

// "≈ 2 + 2/3" style suffix, empty when neither component simplifies.
template <class M>
std::string estimate_suffix(const calcexpr::BasicNumber<M>& n) {
    using calcexpr::Component;

    std::optional<std::string> re = calcexpr::estimate(n, Component::Real);
    if (!n.has_imaginary()) return re ? " \xE2\x89\x88 " + *re : std::string();

    std::optional<std::string> im = calcexpr::estimate(n, Component::Imaginary);
    if (!re && !im) return {};

    const std::string real_part = re ? *re : calcexpr::decimal_string(n.real);
    const std::string imag_part = im ? *im : calcexpr::decimal_string(n.imaginary);
    return " \xE2\x89\x88 " + real_part + " + (" + imag_part + ")i";
}

template <class M>
int run(const Options& opts) {
    calcexpr::ParserContext context;
    std::string line;

    while (std::cout << ">> " << std::flush && std::getline(std::cin, line)) {
        if (line == "exit" || line == "quit") break;
        if (line.empty()) continue;

        try {
            auto result = calcexpr::parse<M>(context, line, opts.angle_unit);
            if (result) std::cout << "= " << calcexpr::format(*result) << estimate_suffix(*result) << "\n";
        } catch (const calcexpr::ParseError& e) {
            std::cerr << "Parse error: " << e.what() << "\n";
        } catch (const calcexpr::EvalError& e) {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--deg") {
            opts.angle_unit = calcexpr::AngleUnit::Degrees;
        } else if (arg == "--rad") {
            opts.angle_unit = calcexpr::AngleUnit::Radians;
        } else if (arg == "--precise") {
            opts.precise = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 2;
        }
    }

    if (opts.precise) return run<calcexpr::BigFloat>(opts);
    return run<calcexpr::Float>(opts);
}
