// ==============================================================================
// scanconv/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами уровней [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) только для TTY
// - Таблицы (каталог эндпоинтов, итог конвертации)
//
// Значения секретов через этот модуль не выводятся никогда.
//
// ==============================================================================

#ifndef SCANCONV_OUTPUT_HPP
#define SCANCONV_OUTPUT_HPP

#include <cstddef>
#include <cstdio>
#include <string>
#include <string_view>
#include <vector>

namespace scanconv {
class Value;
}

namespace scanconv::output {

enum class Stream { Stdout, Stderr };

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

// ----------------------------------------------------------------------------
// Уровни сообщений
// ----------------------------------------------------------------------------

enum class Level {
    Info,     // [+]  подавляется -q
    Warning,  // [!]  подавляется -q
    Error,    // [x]  всегда
    Debug,    // [*]  только -v
    Trace     // [~]  только -vv
};

struct OutputConfig {
    bool quiet = false;      // -q
    int verbose = 0;         // -v, -vv
    bool no_banner = false;  // --no-banner
};

/// "[+] ", "[!] ", "[x] ", "[*] ", "[~] "
std::string_view level_prefix(Level level);

Color level_color(Level level);

/// Выводится ли сообщение уровня level при конфигурации cfg
bool level_enabled(const OutputConfig& cfg, Level level);

/// "<prefix><message>\n" без цвета
std::string format_message(Level level, std::string_view message);

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    void write(Stream s, std::string_view bytes);
    void write_line(Stream s, std::string_view bytes);

    /// Сообщение уровня level в stderr (если уровень включён)
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warning, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    /// Цветная строка без префикса в stderr (подавляется -q)
    void highlight(Color color, std::string_view message);

    /// JSON с отступом 2 и переводом строки в stdout
    void write_json(const Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    FILE* file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Table (Unicode box-drawing)
// ----------------------------------------------------------------------------

enum class Align { Left, Right };

class Table {
public:
    explicit Table(std::vector<std::string> headers = {});

    /// Выравнивание столбца; по умолчанию Left
    Table& align(std::size_t column, Align alignment);

    void add_row(std::vector<std::string> cells);

    std::size_t row_count() const { return rows_.size(); }

    std::string render() const;

    void print(Writer& w, Stream s = Stream::Stdout) const;

private:
    std::vector<std::size_t> column_widths() const;

    std::string render_cells(const std::vector<std::string>& cells,
                             const std::vector<std::size_t>& widths) const;

    std::vector<std::string> headers_;
    std::vector<Align> aligns_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Количество символов UTF-8 (continuation-байты не считаются)
std::size_t display_width(std::string_view text);

/// ANSI SGR последовательность цвета ("" для Default)
std::string_view ansi_color_code(Color color);

std::string_view ansi_reset_code();

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace scanconv::output

#endif  // SCANCONV_OUTPUT_HPP
