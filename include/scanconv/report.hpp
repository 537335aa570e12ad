// ==============================================================================
// scanconv/report.hpp - Разбор текстового отчёта сканера секретов
// ==============================================================================
//
// Назначение:
// - SecretRecord: одно найденное вхождение учётных данных
// - ReportParser: явный автомат Idle / Accumulating(record)
// - Чтение отчёта из файла с best-effort декодированием UTF-8
//
// Формат отчёта (plain-text вывод trufflehog):
//
//   Found verified result 🐷🔑
//   Detector Type: OpenAI
//   Decoder Type: PLAIN
//   Raw result: sk-...
//   File: /data/extensions/<id>/<version>/background.js
//   Line: 42
//   Username: someone        <- дополнительное поле
//
// Неизвестные строки пропускаются без ошибки. Запись без "Raw result"
// не попадает в результат.
//
// ==============================================================================

#ifndef SCANCONV_REPORT_HPP
#define SCANCONV_REPORT_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scanconv::report {

// ----------------------------------------------------------------------------
// Маркеры и префиксы полей
// ----------------------------------------------------------------------------

constexpr std::string_view VERIFIED_MARKER = "Found verified result";
constexpr std::string_view UNVERIFIED_MARKER = "Found unverified result";

constexpr std::string_view DETECTOR_TYPE_PREFIX = "Detector Type:";
constexpr std::string_view DECODER_TYPE_PREFIX = "Decoder Type:";
constexpr std::string_view RAW_RESULT_PREFIX = "Raw result:";
constexpr std::string_view FILE_PREFIX = "File:";
constexpr std::string_view LINE_PREFIX = "Line:";

/// Идентификатор группы, если путь не содержит компонента extensions/
constexpr const char* UNKNOWN_GROUP = "unknown";

// ----------------------------------------------------------------------------
// SecretRecord
// ----------------------------------------------------------------------------

/// Дополнительные поля "ключ: значение" в порядке появления
using ExtraFields = std::vector<std::pair<std::string, std::string>>;

struct SecretRecord {
    std::string detector_type;
    std::string decoder_type;
    std::string raw_value;  // сам секрет; попадает только в хранилище и unknown.txt
    std::string file_path;
    std::optional<std::string> line_number;
    bool verified = false;
    std::string group_id = UNKNOWN_GROUP;  // вычисляется после разбора
    ExtraFields extra_fields;

    /// Установить дополнительное поле; повторный ключ заменяет значение на месте
    void set_extra(std::string key, std::string value);

    /// Значение дополнительного поля или nullptr
    const std::string* extra(std::string_view key) const;

    bool operator==(const SecretRecord& other) const;
    bool operator!=(const SecretRecord& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// Статистика разбора
// ----------------------------------------------------------------------------

struct ParseStats {
    std::size_t lines = 0;            // всего строк
    std::size_t markers = 0;          // строк-маркеров (открытых записей)
    std::size_t dropped_records = 0;  // записей без raw value
    std::size_t invalid_bytes = 0;    // отброшенных байтов при декодировании
};

// ----------------------------------------------------------------------------
// ReportParser - построчный автомат
// ----------------------------------------------------------------------------

/// Состояния: Idle (до первого маркера) и Accumulating (запись открыта).
/// feed() принимает строки по одной, finish() закрывает последнюю запись.
class ReportParser {
public:
    enum class State { Idle, Accumulating };

    ReportParser() = default;

    /// Обработать одну строку (без завершающего '\n')
    void feed(std::string_view line);

    /// Завершить разбор и забрать записи в порядке появления
    /// После вызова парсер пуст и готов к следующему отчёту (stats() накапливается)
    std::vector<SecretRecord> finish();

    State state() const { return state_; }

    const ParseStats& stats() const { return stats_; }

private:
    /// Закрыть текущую запись (сохранить, если есть raw value)
    void close_current();

    /// Обработать строку внутри открытой записи
    void apply_field(std::string_view line);

    State state_ = State::Idle;
    SecretRecord current_;
    std::vector<SecretRecord> records_;
    ParseStats stats_;
};

// ----------------------------------------------------------------------------
// Ошибки и результат чтения файла
// ----------------------------------------------------------------------------

struct ReportError {
    std::string message;
    std::string path;

    /// "failed to read report '<path>' - <message>"
    std::string format() const;
};

struct ParseResult {
    bool ok = false;
    std::vector<SecretRecord> records;
    ParseStats stats;
    ReportError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Разобрать текст отчёта целиком
std::vector<SecretRecord> parse(std::string_view text);

/// Разобрать текст и вернуть статистику
std::vector<SecretRecord> parse(std::string_view text, ParseStats& stats);

/// Прочитать отчёт из файла (весь файл в памяти) и разобрать
/// Некорректные последовательности UTF-8 отбрасываются, это не ошибка.
ParseResult parse_file(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Удалить некорректные последовательности UTF-8
/// @param dropped (опционально) количество отброшенных байтов
std::string sanitize_utf8(std::string_view bytes, std::size_t* dropped = nullptr);

/// Удалить ANSI SGR последовательности (ESC [ ... m)
std::string strip_ansi(std::string_view line);

/// Обрезать пробельные символы с обеих сторон
std::string_view trim(std::string_view s);

/// Обрезать пробельные символы справа (включая '\r')
std::string_view trim_right(std::string_view s);

}  // namespace scanconv::report

#endif  // SCANCONV_REPORT_HPP
