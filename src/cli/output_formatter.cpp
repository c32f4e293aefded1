#include <pocketbase/cli/output_formatter.hpp>
#include <pocketbase/core/ansi.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace pocketbase {

namespace {

constexpr size_t kMaxCellWidth = 48;

std::string Truncate(std::string text) {
    if (text.size() > kMaxCellWidth) {
        text.resize(kMaxCellWidth - 3);
        text += "...";
    }
    return text;
}

using namespace pocketbase::ansi;

} // anonymous namespace

std::string CellText(const nlohmann::json& value) {
    if (value.is_null()) {
        return "";
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto array = nlohmann::json::array();
        for (const auto& row : rows) {
            auto obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
             << "\n";
        return;
    }

    if (color_mode_) {
        // Build FTXUI table data: header row + data rows.
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);

        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain human-readable table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::left << std::setw(static_cast<int>(widths[c]))
             << headers[c];
    }
    out_ << "\n";

    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";

    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c]))
                 << row[c];
        }
        out_ << "\n";
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    struct TreeEntry {
        std::string key;
        std::string value;
        bool is_section_header = false;
        bool is_last = false;           // Last in its group
        bool is_child = false;          // Inside a sub-section
        bool is_last_child = false;     // Last in sub-section
    };

    std::vector<TreeEntry> entries;
    for (const auto& sec : sections) {
        if (sec.entries.empty()) continue;

        if (sec.title.empty()) {
            for (const auto& e : sec.entries) {
                entries.push_back({e.first, e.second, false, false, false, false});
            }
        } else {
            entries.push_back({sec.title, "", true, false, false, false});
            for (size_t ei = 0; ei < sec.entries.size(); ++ei) {
                entries.push_back({sec.entries[ei].first, sec.entries[ei].second,
                                   false, false, true,
                                   ei == sec.entries.size() - 1});
            }
        }
    }

    // Mark last root-level entry
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (!it->is_child) {
            it->is_last = true;
            break;
        }
    }

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
        for (const auto& e : entries) {
            if (e.is_child) {
                out_ << kDim << (e.is_last_child ? "    \u2514\u2500\u2500 " : "    \u251C\u2500\u2500 ") << kReset;
                out_ << e.key << ": " << e.value << "\n";
            } else if (e.is_section_header) {
                out_ << kDim << (e.is_last ? "\u2514\u2500\u2500 " : "\u251C\u2500\u2500 ") << kReset;
                out_ << kBold << e.key << kReset << "\n";
            } else {
                out_ << kDim << (e.is_last ? "\u2514\u2500\u2500 " : "\u251C\u2500\u2500 ") << kReset;
                out_ << e.key << ": " << e.value << "\n";
            }
        }
        return;
    }

    out_ << title << "\n";
    for (const auto& e : entries) {
        if (e.is_child) {
            out_ << (e.is_last_child ? "    +-- " : "    |-- ");
            out_ << e.key << ": " << e.value << "\n";
        } else if (e.is_section_header) {
            out_ << (e.is_last ? "+-- " : "|-- ");
            out_ << e.key << "\n";
        } else {
            out_ << (e.is_last ? "+-- " : "|-- ");
            out_ << e.key << ": " << e.value << "\n";
        }
    }
}

void OutputFormatter::PrintRecords(const std::vector<nlohmann::json>& records) const {
    if (json_mode_) {
        out_ << nlohmann::json(records).dump(-1, ' ', false,
                                             nlohmann::json::error_handler_t::replace)
             << "\n";
        return;
    }

    std::vector<std::string> headers{"id"};
    for (const auto& record : records) {
        if (!record.is_object()) continue;
        for (const auto& [key, value] : record.items()) {
            if (std::find(headers.begin(), headers.end(), key) == headers.end()) {
                headers.push_back(key);
            }
        }
    }

    std::vector<std::vector<std::string>> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        std::vector<std::string> row;
        row.reserve(headers.size());
        for (const auto& header : headers) {
            auto it = record.is_object() ? record.find(header) : record.end();
            row.push_back(it == record.end() ? "" : Truncate(CellText(*it)));
        }
        rows.push_back(std::move(row));
    }
    PrintTable(headers, rows);
}

void OutputFormatter::PrintRecord(const std::string& title,
                                  const nlohmann::json& record) const {
    if (json_mode_) {
        PrintJson(record.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
        return;
    }

    DetailSection root;
    std::vector<DetailSection> sections;
    if (record.is_object()) {
        for (const auto& [key, value] : record.items()) {
            // Expanded relations get their own sub-tree.
            if (key == "expand" && value.is_object()) {
                DetailSection expand{"expand", {}};
                for (const auto& [rel, rel_value] : value.items()) {
                    expand.entries.emplace_back(rel, Truncate(CellText(rel_value)));
                }
                sections.push_back(std::move(expand));
                continue;
            }
            root.entries.emplace_back(key, CellText(value));
        }
    } else {
        root.entries.emplace_back("value", CellText(record));
    }
    sections.insert(sections.begin(), std::move(root));
    PrintDetail(title, sections);
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        for (const auto& field : error.field_errors) {
            err_ << "  " << kYellow << field.name << kReset << ": "
                 << field.message << kDim << " [" << field.code << "]" << kReset
                 << "\n";
        }
        return;
    }

    // Plain-text multi-line layout (same structure as color path, no ANSI).
    err_ << "Error: " << error.operation;
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    for (const auto& field : error.field_errors) {
        err_ << "  " << field.name << ": " << field.message
             << " [" << field.code << "]\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        nlohmann::json j = {{"success", true}, {"message", message}};
        out_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

} // namespace pocketbase
