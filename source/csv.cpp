#include "csv.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "fmt/core.h"
#include "log.hpp"

namespace ctrlkit {

void writeCsv(const std::string& path, const IdData& data) {
    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error(fmt::format("writeCsv: cannot open '{}' for writing", path));
    }

    out << "time,input,output\n";
    const auto  t = data.time();
    const auto& u = data.input();
    const auto& y = data.output();
    for (size_t k = 0; k < data.size(); ++k) {
        out << fmt::format("{:.17g},{:.17g},{:.17g}\n", t[k], u[k], y[k]);
    }

    out.flush();
    if (!out) {
        throw std::runtime_error(fmt::format("writeCsv: write to '{}' failed", path));
    }
    log::debug("wrote {} samples to {}", data.size(), path);
}

static std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

// Parse one field as a double; false if the field is not entirely a number
static bool parseField(const std::string& field, double& value) {
    const std::string f = trim(field);
    if (f.empty()) {
        return false;
    }
    char*       end = nullptr;
    const char* beg = f.c_str();
    value           = std::strtod(beg, &end);
    return end == beg + f.size();
}

static std::vector<std::string> splitFields(const std::string& line) {
    std::vector<std::string> fields;
    size_t                   start = 0;
    while (true) {
        const size_t comma = line.find(',', start);
        fields.push_back(line.substr(start, comma - start));
        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return fields;
}

IdData readCsv(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(fmt::format("readCsv: cannot open '{}'", path));
    }

    std::vector<double> t, u, y;
    std::string         line;
    size_t              line_no     = 0;
    bool                seen_header = false;

    while (std::getline(in, line)) {
        ++line_no;
        const std::string content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }

        const auto fields = splitFields(content);
        if (fields.size() != 3) {
            throw std::runtime_error(fmt::format("readCsv: {}:{}: expected 3 fields, found {}", path, line_no, fields.size()));
        }

        double values[3];
        bool   numeric = true;
        for (size_t i = 0; i < 3; ++i) {
            numeric = numeric && parseField(fields[i], values[i]);
        }

        if (!numeric) {
            // Only the first non-comment line may be a header
            if (t.empty() && !seen_header) {
                seen_header = true;
                continue;
            }
            throw std::runtime_error(fmt::format("readCsv: {}:{}: malformed number", path, line_no));
        }

        t.push_back(values[0]);
        u.push_back(values[1]);
        y.push_back(values[2]);
    }

    if (in.bad()) {
        throw std::runtime_error(fmt::format("readCsv: read from '{}' failed", path));
    }
    if (t.size() < 2) {
        throw std::runtime_error(fmt::format("readCsv: '{}' needs at least two samples to infer the sample time", path));
    }

    const double Ts = (t.back() - t.front()) / static_cast<double>(t.size() - 1);
    if (!(Ts > 0.0)) {
        throw std::runtime_error(fmt::format("readCsv: '{}' time column is not increasing", path));
    }
    for (size_t k = 1; k < t.size(); ++k) {
        if (std::abs((t[k] - t[k - 1]) - Ts) > 1e-6 * Ts) {
            throw std::runtime_error(fmt::format("readCsv: '{}' is not uniformly sampled near t = {}", path, t[k]));
        }
    }

    log::debug("read {} samples from {} (Ts = {})", t.size(), path, Ts);
    return IdData{std::move(y), std::move(u), Ts, t.front()};
}

}  // namespace ctrlkit
