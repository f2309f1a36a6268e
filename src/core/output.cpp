#include "clikit/output.hpp"

#include <algorithm>
#include <vector>

namespace clikit {

std::string display_value(const nlohmann::json& value) {
    if (value.is_string()) return value.get<std::string>();
    if (value.is_null()) return "";
    return value.dump();
}

namespace {

void render_plain(const nlohmann::json& data, const std::string& title, std::ostream& out) {
    if (!title.empty()) {
        out << title << "\n";
    }
    if (data.is_object()) {
        for (auto& [key, value] : data.items()) {
            out << key << ": " << display_value(value) << "\n";
        }
    } else if (data.is_array()) {
        for (const auto& item : data) {
            if (item.is_object()) {
                for (auto& [key, value] : item.items()) {
                    out << key << ": " << display_value(value) << "\n";
                }
                out << "---\n";
            } else {
                out << display_value(item) << "\n";
            }
        }
    } else {
        out << display_value(data) << "\n";
    }
    out.flush();
}

void print_rows(const std::vector<std::string>& header,
                const std::vector<std::vector<std::string>>& rows,
                const std::string& title, std::ostream& out) {
    std::vector<size_t> widths(header.size(), 0);
    for (size_t c = 0; c < header.size(); ++c) {
        widths[c] = header[c].size();
        for (const auto& row : rows) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_line = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < cells.size(); ++c) {
            if (c > 0) out << "  ";
            out << cells[c];
            if (c + 1 < cells.size()) {
                out << std::string(widths[c] - cells[c].size(), ' ');
            }
        }
        out << "\n";
    };

    if (!title.empty()) {
        out << title << "\n";
    }
    print_line(header);
    std::vector<std::string> rule;
    for (size_t w : widths) rule.push_back(std::string(w, '-'));
    print_line(rule);
    for (const auto& row : rows) {
        print_line(row);
    }
    out.flush();
}

void render_table(const nlohmann::json& data, const std::string& title, std::ostream& out) {
    if (data.is_object()) {
        std::vector<std::vector<std::string>> rows;
        for (auto& [key, value] : data.items()) {
            rows.push_back({key, display_value(value)});
        }
        print_rows({"Key", "Value"}, rows, title, out);
        return;
    }

    if (data.is_array() && !data.empty() && data.front().is_object()) {
        // Columns come from the first row
        std::vector<std::string> columns;
        for (auto& [key, value] : data.front().items()) {
            columns.push_back(key);
        }
        std::vector<std::vector<std::string>> rows;
        for (const auto& item : data) {
            std::vector<std::string> row;
            for (const auto& col : columns) {
                row.push_back(item.contains(col) ? display_value(item[col]) : "");
            }
            rows.push_back(std::move(row));
        }
        print_rows(columns, rows, title, out);
        return;
    }

    render_plain(data, title, out);
}

} // namespace

void render(const nlohmann::json& data, const std::string& title, const ExecutionContext& ctx) {
    switch (ctx.format()) {
        case OutputFormat::Json:
            ctx.out() << data.dump(2) << std::endl;
            break;
        case OutputFormat::Plain:
            render_plain(data, title, ctx.out());
            break;
        case OutputFormat::Table:
            render_table(data, title, ctx.out());
            break;
    }
}

} // namespace clikit
