// csv_export.cpp - Row serialization for the export stream

#include "combination/csv_export.hpp"
#include "combination/types.hpp"

#include <cstdio>
#include <stdexcept>

namespace combination {

std::string format_value(double value) {
    char buffer[64];
    snprintf(buffer, sizeof(buffer), "%.*f", VALUE_DECIMALS, round_value(value));
    std::string text(buffer);

    size_t dot = text.find('.');
    if (dot != std::string::npos) {
        size_t last = text.find_last_not_of('0');
        text.erase(last == dot ? dot : last + 1);
    }
    if (text == "-0") text = "0";
    return text;
}

std::string csv_escape(const std::string& cell) {
    if (cell.find_first_of(",\"\r\n") == std::string::npos) {
        return cell;
    }
    std::string quoted = "\"";
    for (char c : cell) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

size_t write_csv(std::ostream& out,
                 const std::vector<std::string>& component_names,
                 const ResultAggregator& results) {
    if (results.row_width() != 0 && component_names.size() != results.row_width()) {
        throw std::invalid_argument("write_csv: header has " + std::to_string(component_names.size()) +
                                    " names but rows have " + std::to_string(results.row_width()) +
                                    " values");
    }

    for (size_t i = 0; i < component_names.size(); ++i) {
        if (i) out << ',';
        out << csv_escape(component_names[i]);
    }
    out << '\n';

    size_t written = 0;
    results.for_each_export_row([&](const double* row, size_t width) {
        for (size_t i = 0; i < width; ++i) {
            if (i) out << ',';
            out << format_value(row[i]);
        }
        out << '\n';
        ++written;
    });

    if (!out) {
        throw std::runtime_error("write_csv: output stream failed");
    }
    return written;
}

}  // namespace combination
