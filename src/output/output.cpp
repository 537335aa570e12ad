// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. std::endl не используется,
// буферы сбрасываются явно.
//
// ==============================================================================

#include <scanconv/output.hpp>

#include <scanconv/platform.hpp>
#include <scanconv/value.hpp>

#include <algorithm>

namespace scanconv::output {

namespace {

struct LevelStyle {
    std::string_view prefix;
    Color color;
    int min_verbose;  // минимальный -v
    bool quietable;   // подавляется -q
};

constexpr LevelStyle LEVEL_STYLES[] = {
    {"[+] ", Color::Green, 0, true},     // Info
    {"[!] ", Color::Yellow, 0, true},    // Warning
    {"[x] ", Color::Red, 0, false},      // Error
    {"[*] ", Color::Cyan, 1, false},     // Debug
    {"[~] ", Color::Magenta, 2, false},  // Trace
};

const LevelStyle& style(Level level) {
    return LEVEL_STYLES[static_cast<std::size_t>(level)];
}

// Горизонтальная линия таблицы: левый угол, заполнитель, стык столбцов, правый угол
struct Border {
    const char* left;
    const char* fill;
    const char* joint;
    const char* right;
};

constexpr Border TOP{"\xe2\x94\x8c", "\xe2\x94\x80", "\xe2\x94\xac", "\xe2\x94\x90"};  // ┌─┬┐
constexpr Border MIDDLE{"\xe2\x94\x9c", "\xe2\x94\x80", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├─┼┤
constexpr Border BOTTOM{"\xe2\x94\x94", "\xe2\x94\x80", "\xe2\x94\xb4", "\xe2\x94\x98"};  // └─┴┘
constexpr const char* VERTICAL = "\xe2\x94\x82";  // │

std::string render_border(const Border& border, const std::vector<std::size_t>& widths) {
    std::string line = border.left;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) {
            line += border.joint;
        }
        // По одному пробелу отступа с каждой стороны ячейки
        for (std::size_t j = 0; j < widths[i] + 2; ++j) {
            line += border.fill;
        }
    }
    line += border.right;
    line += '\n';
    return line;
}

}  // namespace

// ----------------------------------------------------------------------------
// Уровни
// ----------------------------------------------------------------------------

std::string_view level_prefix(Level level) {
    return style(level).prefix;
}

Color level_color(Level level) {
    return style(level).color;
}

bool level_enabled(const OutputConfig& cfg, Level level) {
    const LevelStyle& s = style(level);
    if (s.quietable && cfg.quiet) {
        return false;
    }
    return cfg.verbose >= s.min_verbose;
}

std::string format_message(Level level, std::string_view message) {
    std::string result(level_prefix(level));
    result.append(message);
    result += '\n';
    return result;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

FILE* Writer::file(Stream s) const {
    return s == Stream::Stdout ? stdout : stderr;
}

void Writer::write(Stream s, std::string_view bytes) {
    std::fwrite(bytes.data(), 1, bytes.size(), file(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::log(Level level, std::string_view message) {
    if (!level_enabled(config_, level)) {
        return;
    }
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(level_color(level)));
        write(Stream::Stderr, level_prefix(level));
        write(Stream::Stderr, ansi_reset_code());
    } else {
        write(Stream::Stderr, level_prefix(level));
    }
    write_line(Stream::Stderr, message);
}

void Writer::highlight(Color color, std::string_view message) {
    if (config_.quiet) {
        return;
    }
    const bool colored = color != Color::Default && supports_color(Stream::Stderr);
    if (colored) {
        write(Stream::Stderr, ansi_color_code(color));
    }
    write(Stream::Stderr, message);
    if (colored) {
        write(Stream::Stderr, ansi_reset_code());
    }
    write(Stream::Stderr, "\n");
}

void Writer::write_json(const Value& value) {
    write_line(Stream::Stdout, value.to_json(2));
    flush();
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table(std::vector<std::string> headers) : headers_(std::move(headers)) {}

Table& Table::align(std::size_t column, Align alignment) {
    if (aligns_.size() <= column) {
        aligns_.resize(column + 1, Align::Left);
    }
    aligns_[column] = alignment;
    return *this;
}

void Table::add_row(std::vector<std::string> cells) {
    rows_.push_back(std::move(cells));
}

std::vector<std::size_t> Table::column_widths() const {
    std::vector<std::size_t> widths(headers_.size(), 0);
    auto measure = [&widths](const std::vector<std::string>& cells) {
        if (widths.size() < cells.size()) {
            widths.resize(cells.size(), 0);
        }
        for (std::size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };
    measure(headers_);
    for (const auto& row : rows_) {
        measure(row);
    }
    return widths;
}

std::string Table::render_cells(const std::vector<std::string>& cells,
                                const std::vector<std::size_t>& widths) const {
    std::string line = VERTICAL;
    for (std::size_t i = 0; i < widths.size(); ++i) {
        const std::string empty;
        const std::string& cell = i < cells.size() ? cells[i] : empty;
        const std::size_t pad = widths[i] - display_width(cell);
        const bool right = i < aligns_.size() && aligns_[i] == Align::Right;

        line += ' ';
        if (right) {
            line.append(pad, ' ');
        }
        line += cell;
        if (!right) {
            line.append(pad, ' ');
        }
        line += ' ';
        line += VERTICAL;
    }
    line += '\n';
    return line;
}

std::string Table::render() const {
    const std::vector<std::size_t> widths = column_widths();

    std::string result = render_border(TOP, widths);
    if (!headers_.empty()) {
        result += render_cells(headers_, widths);
        result += render_border(MIDDLE, widths);
    }
    for (const auto& row : rows_) {
        result += render_cells(row, widths);
    }
    result += render_border(BOTTOM, widths);
    return result;
}

void Table::print(Writer& w, Stream s) const {
    w.write(s, render());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::size_t display_width(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        // 10xxxxxx - continuation byte
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string_view ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return {};
}

std::string_view ansi_reset_code() {
    return "\x1b[0m";
}

bool supports_color(Stream s) {
    return platform::is_tty(s == Stream::Stdout ? stdout : stderr);
}

}  // namespace scanconv::output
