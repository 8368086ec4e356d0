#include <charconv>
#include <cmath>
#include <sstream>

#include "format/format.hpp"

std::string format_number(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    if (d == std::floor(d) && std::fabs(d) < 1e15) {
        return std::to_string(static_cast<long long>(d));
    }

    // shortest text that reads back as the same double
    char buf[64];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    if (ec != std::errc()) {
        std::ostringstream ss;
        ss.precision(17);
        ss << d;
        return ss.str();
    }
    return std::string(buf, end);
}

std::string format_literal(const Literal& lit) {
    if (auto pd = std::get_if<double>(&lit)) return format_number(*pd);
    if (auto ps = std::get_if<std::string>(&lit)) return "\"" + *ps + "\"";
    if (auto pb = std::get_if<bool>(&lit)) return *pb ? "true" : "false";
    return "nil";
}

std::string format_program(ProgramNode* program) {
    if (!program) return "";

    std::ostringstream ss;
    for (size_t i = 0; i < program->body.size(); i++) {
        if (i > 0) ss << "\n";
        ss << format_statement(program->body[i].get());
    }
    return ss.str();
}
